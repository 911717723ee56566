#pragma once
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <sys/wait.h>
#include <unistd.h>

namespace beacon::node::test_helpers {

constexpr int CHILD_EXIT_OK = 0;
constexpr int CHILD_EXIT_FAILED = 3;

/**
 * Runs @p body in a forked child and returns its wait status. The child
 * exits with CHILD_EXIT_OK when @p body returns true, CHILD_EXIT_FAILED
 * when it returns false or throws. Anything published process-wide by the
 * body stays in the child.
 */
inline int RunInChildProcess(const std::function<bool()>& body) {
    std::fflush(nullptr);
    const pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid == 0) {
        int code = CHILD_EXIT_FAILED;
        try {
            code = body() ? CHILD_EXIT_OK : CHILD_EXIT_FAILED;
        } catch (const std::exception&) {
            code = CHILD_EXIT_FAILED;
        }
        std::fflush(nullptr);
        std::_Exit(code);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) != pid) {
        return -1;
    }
    return status;
}

[[nodiscard]] inline bool TerminatedByAbort(const int status) {
    return status != -1 && WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

[[nodiscard]] inline bool ExitedSuccessfully(const int status) {
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == CHILD_EXIT_OK;
}

}
