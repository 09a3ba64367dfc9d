#pragma once

#include <polygrader/common/class_traits.hpp>
#include <polygrader/common/error_types.hpp>
#include <polygrader/common/linux.hpp>
#include <polygrader/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace polygrader {

/// A child process running in its own process group, with stdin from /dev/null and
/// stdout/stderr captured on separate pipes
///
/// The child's whole process group is SIGKILLed when the object is destroyed while it is still running,
/// so no descendant can outlive its owner.
class Subprocess : NonCopyable
{
public:
    /// Bytes kept per output stream unless ``set_output_limit`` says otherwise
    static constexpr std::size_t DEFAULT_OUTPUT_LIMIT = std::size_t{64} * 1024 * 1024;

    /// ``exec`` is searched for in PATH when it contains no slash.
    /// An empty ``cwd`` keeps the current working directory.
    Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path cwd = {});
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Fork and exec the child
    /// Returns ``ExecFailure`` if the executable could not be started at all
    Result<void> start();

    /// Collect output until the child exits and both pipes are closed, or until ``timeout`` elapses
    /// On timeout, the process group is killed and ``TimedOut`` is returned; whatever output was
    /// collected up to that point stays available from ``get_stdout``/``get_stderr``.
    /// Once either stream passes the output limit, the group is killed and ``OutputLimitExceeded``
    /// is returned, with that stream cut off at the limit.
    Result<RunResult> wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGKILL the whole process group and reap the child
    Result<void> kill();

    bool is_running() const;

    /// Must be called before ``wait_for_exit``
    void set_output_limit(std::size_t bytes) { output_limit_ = bytes; }

    bool output_truncated() const { return output_truncated_; }

    pid_t get_pid() const { return child_pid_; }

    const std::string& get_stdout() const { return stdout_buffer_; }

    const std::string& get_stderr() const { return stderr_buffer_; }

    /// Wall-clock time since ``start``, frozen once the child has exited
    std::chrono::milliseconds get_elapsed() const;

private:
    /// Runs in the child after fork. Only async-signal-safe calls are permitted here.
    [[noreturn]] void exec_child(const std::vector<char*>& argv, int devnull_fd, int error_fd) const;

    /// Read whatever is available on the pipes; closes a pipe once it reaches EOF
    Result<void> drain_pipes(std::chrono::milliseconds poll_timeout);

    /// Non-blocking check for child exit; records the status
    Result<void> try_reap();

    void kill_group() const;

    Result<void> close_pipes();

    /// Kill a still running child and close every pipe end; used on destruction and move assignment
    void release();

    std::string exec_;
    std::vector<std::string> args_;
    std::filesystem::path cwd_;

    pid_t child_pid_{};
    std::optional<int> wait_status_;

    linux::Pipe stdout_pipe_{-1, -1};
    linux::Pipe stderr_pipe_{-1, -1};

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::size_t output_limit_ = DEFAULT_OUTPUT_LIMIT;
    bool output_truncated_ = false;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
};

/// Convenience wrapper: start ``exec`` with ``args`` in ``cwd`` and wait for it, up to ``timeout``
Result<CommandOutput> run_command(const std::string& exec, const std::vector<std::string>& args,
                                  const std::filesystem::path& cwd, std::chrono::milliseconds timeout,
                                  std::size_t output_limit = Subprocess::DEFAULT_OUTPUT_LIMIT);

} // namespace polygrader
