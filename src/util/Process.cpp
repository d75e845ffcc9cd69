#include "util/Process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/Constants.hpp"

namespace promptline {

namespace {

// Closes the descriptor on scope exit unless released
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ != -1) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

Error sysError(const std::string& what) {
    return Error{ErrorCode::IoError, what + ": " + std::strerror(errno)};
}

}

Expected<ProcessResult> runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgs, "runProcess: empty argument vector"};
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int pipefd[2];
    if (::pipe(pipefd) == -1) return sysError("pipe");
    FdGuard readEnd(pipefd[0]);
    FdGuard writeEnd(pipefd[1]);

    pid_t child = ::fork();
    if (child == -1) return sysError("fork");

    if (child == 0) {
        if (::dup2(writeEnd.get(), STDOUT_FILENO) == -1) _exit(Constants::EXEC_FAILED_STATUS);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull != -1) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::close(readEnd.get());
        ::close(writeEnd.get());
        ::execvp(cargv[0], cargv.data());
        _exit(Constants::EXEC_FAILED_STATUS);
    }

    // Parent keeps only the read end so EOF arrives when the child exits
    writeEnd.reset();

    ProcessResult result;
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(readEnd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            Error err = sysError("read");
            readEnd.reset();
            while (::waitpid(child, nullptr, 0) == -1 && errno == EINTR) {}
            return err;
        }
    }
    readEnd.reset();

    int status = 0;
    while (::waitpid(child, &status, 0) == -1) {
        if (errno != EINTR) return sysError("waitpid");
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = -1;
    }
    return result;
}

}
