#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace promptline {

struct ProcessResult {
    int exitCode{0};
    std::string output;  // Captured stdout
};

/**
 * @brief Run a program and capture its standard output
 *
 * argv[0] is looked up on PATH; no shell is involved, so arguments are
 * passed through without any quoting or expansion. The child's stderr is
 * sent to /dev/null. Blocks until the child exits.
 *
 * A child that cannot be exec'd exits with 127; a child killed by a signal
 * reports 128 + signal number.
 *
 * @param argv Program name followed by its arguments (must not be empty)
 * @return ProcessResult, or IoError when the pipe or fork fails
 */
Expected<ProcessResult> runProcess(const std::vector<std::string>& argv);

}
