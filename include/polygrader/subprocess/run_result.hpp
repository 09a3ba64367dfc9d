#pragma once

#include <fmt/format.h>

#include <chrono>
#include <string>

namespace polygrader {

/// How a child process terminated, if it terminated on its own
class RunResult
{
public:
    enum class Kind { Exited, Signaled };

    static RunResult make_exited(int code);
    static RunResult make_signaled(int signal);

    /// Decode a raw status as returned by waitpid(2)
    static RunResult from_wait_status(int status);

    Kind get_kind() const;

    /// Exit code if ``Exited``, otherwise the terminating signal number
    int get_code() const;

    /// Exited normally with code 0
    bool succeeded() const;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

/// Everything collected from one child process that ran to completion
struct CommandOutput
{
    RunResult result;
    std::string stdout_str;
    std::string stderr_str;
    std::chrono::milliseconds elapsed;

    /// stdout immediately followed by stderr, separated by a newline
    std::string combined() const { return stdout_str + "\n" + stderr_str; }
};

} // namespace polygrader

template <>
struct fmt::formatter<::polygrader::RunResult> : fmt::formatter<std::string>
{
    auto format(const ::polygrader::RunResult& from, fmt::format_context& ctx) const {
        if (from.get_kind() == ::polygrader::RunResult::Kind::Exited) {
            return fmt::format_to(ctx.out(), "exited with code {}", from.get_code());
        }

        return fmt::format_to(ctx.out(), "killed by signal {}", from.get_code());
    }
};
