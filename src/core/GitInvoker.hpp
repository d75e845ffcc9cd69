#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"
#include "util/Process.hpp"

namespace promptline {

/**
 * @brief Runs git for the status decoration
 *
 * The command line is fixed: git status --porcelain=2 --branch, executed in
 * the current working directory.
 */
class GitInvoker {
public:
    GitInvoker();
    explicit GitInvoker(std::string gitProgram);

    /// Argument vector passed to runProcess()
    std::vector<std::string> statusArgv() const;

    /**
     * @brief Query porcelain v2 status for the working directory
     *
     * @return Raw porcelain output; GitUnavailable when git cannot be run
     *         (spawn failure, exec failing with 127), NotARepository for any
     *         other non-zero exit. Callers treat both as "no decoration".
     */
    Expected<std::string> queryStatus() const;

private:
    std::string program;
};

}
