#include "core/GitInvoker.hpp"

#include <utility>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace promptline {

GitInvoker::GitInvoker() : program("git") {}

GitInvoker::GitInvoker(std::string gitProgram) : program(std::move(gitProgram)) {}

std::vector<std::string> GitInvoker::statusArgv() const {
    return {program, "status", "--porcelain=2", "--branch"};
}

Expected<std::string> GitInvoker::queryStatus() const {
    auto res = runProcess(statusArgv());
    if (!res) {
        return Error{ErrorCode::GitUnavailable, program + " could not be run: " + res.error().message};
    }

    int code = res.value().exitCode;
    Logger::instance().debug(program + " status exited with " + std::to_string(code));
    if (code == Constants::EXEC_FAILED_STATUS) {
        return Error{ErrorCode::GitUnavailable, program + " not found"};
    }
    if (code != 0) {
        return Error{ErrorCode::NotARepository, "not a git work tree (exit " + std::to_string(code) + ")"};
    }
    return std::move(res.value().output);
}

}
