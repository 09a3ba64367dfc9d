#include <polygrader/subprocess/run_result.hpp>

#include <libassert/assert.hpp>

#include <sys/wait.h>

namespace polygrader {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_signaled(int signal) {
    return {Kind::Signaled, signal};
}

RunResult RunResult::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return make_exited(WEXITSTATUS(status));
    }

    ASSERT(WIFSIGNALED(status), "waitpid returned a status for a process that did not terminate", status);

    return make_signaled(WTERMSIG(status));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

bool RunResult::succeeded() const {
    return kind_ == Kind::Exited && code_ == 0;
}

} // namespace polygrader
