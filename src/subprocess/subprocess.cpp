#include "subprocess/subprocess.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/expected.hpp>
#include <polygrader/common/linux.hpp>
#include <polygrader/logging.hpp>

#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace polygrader {

namespace {

/// Report ``errno`` to the parent through the error pipe and exit. Async-signal-safe.
[[noreturn]] void report_child_failure(int error_fd) {
    int err = errno;
    // Nothing more can be done if this write fails; the parent then sees exit code 127 instead
    std::ignore = ::write(error_fd, &err, sizeof(err));
    ::_exit(127); // NOLINT
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path cwd)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , cwd_{std::move(cwd)} {}

Subprocess::~Subprocess() {
    release();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , cwd_{std::move(other.cwd_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , wait_status_{std::exchange(other.wait_status_, std::nullopt)}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {-1, -1})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {-1, -1})}
    , stdout_buffer_{std::move(other.stdout_buffer_)}
    , stderr_buffer_{std::move(other.stderr_buffer_)}
    , output_limit_{other.output_limit_}
    , output_truncated_{other.output_truncated_}
    , start_time_{other.start_time_}
    , end_time_{other.end_time_} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    release();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    cwd_ = std::move(rhs.cwd_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    wait_status_ = std::exchange(rhs.wait_status_, std::nullopt);
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {-1, -1});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {-1, -1});
    stdout_buffer_ = std::move(rhs.stdout_buffer_);
    stderr_buffer_ = std::move(rhs.stderr_buffer_);
    output_limit_ = rhs.output_limit_;
    output_truncated_ = rhs.output_truncated_;
    start_time_ = rhs.start_time_;
    end_time_ = rhs.end_time_;

    return *this;
}

void Subprocess::release() {
    // child_pid_ == 0 -> never started, or moved from
    if (is_running()) {
        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill process group {}: {}", child_pid_, res.error());
        }
    }

    if (auto res = close_pipes(); !res) {
        LOG_WARN("Failed to close pipes of pid {}: {}", child_pid_, res.error());
    }
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess may only be started once");

    // Everything the child needs is prepared before forking, as it must not allocate
    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(const_cast<char*>(exec_.c_str()));
    for (const std::string& arg : args_) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    int devnull_fd = TRYE(linux::open("/dev/null", O_RDONLY | O_CLOEXEC), SyscallFailure); // NOLINT
    auto close_devnull = gsl::finally([devnull_fd] {
        if (auto res = linux::close(devnull_fd); !res) {
            LOG_WARN("Failed to close /dev/null: {}", res.error().message());
        }
    });

    // All pipes are close-on-exec so that concurrently spawned children never inherit each other's ends
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    linux::Pipe error_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    start_time_ = std::chrono::steady_clock::now();

    auto fork_res = linux::fork();

    if (!fork_res) {
        std::ignore = linux::close(error_pipe.read_fd);
        std::ignore = linux::close(error_pipe.write_fd);
        return ErrorKind::SyscallFailure;
    }

    if (fork_res->which == linux::Fork::Child) {
        exec_child(argv, devnull_fd, error_pipe.write_fd);
    }

    // Parent process
    child_pid_ = fork_res->pid;

    // Also done in the child, as either may run first. Fails with EACCES once the child has exec'd, which is fine
    std::ignore = linux::setpgid(child_pid_, child_pid_);

    TRYE(linux::close(error_pipe.write_fd), SyscallFailure);
    TRYE(linux::close(stdout_pipe_.write_fd), SyscallFailure);
    stdout_pipe_.write_fd = -1;
    TRYE(linux::close(stderr_pipe_.write_fd), SyscallFailure);
    stderr_pipe_.write_fd = -1;

    // EOF on the error pipe means that exec succeeded and closed it
    auto child_errno = linux::read(error_pipe.read_fd, sizeof(int));
    TRYE(linux::close(error_pipe.read_fd), SyscallFailure);

    if (!child_errno) {
        return ErrorKind::SyscallFailure;
    }

    if (!child_errno->empty()) {
        int err = 0;
        std::copy_n(child_errno->data(), std::min(child_errno->size(), sizeof(err)), reinterpret_cast<char*>(&err));

        LOG_DEBUG("Failed to start '{}': '{}'", exec_, get_err_msg(err));

        TRY(kill());

        return ErrorKind::ExecFailure;
    }

    LOG_TRACE("Started {} {} as pid {}", exec_, args_, child_pid_);

    return {};
}

void Subprocess::exec_child(const std::vector<char*>& argv, int devnull_fd, int error_fd) const {
    if (::setpgid(0, 0) == -1) {
        report_child_failure(error_fd);
    }

    if (::dup2(devnull_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_pipe_.write_fd, STDERR_FILENO) == -1) {
        report_child_failure(error_fd);
    }

    if (!cwd_.empty() && ::chdir(cwd_.c_str()) == -1) {
        report_child_failure(error_fd);
    }

    ::execvp(argv.front(), argv.data());

    report_child_failure(error_fd);
}

Result<RunResult> Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    DEBUG_ASSERT(child_pid_ != 0, "wait_for_exit called on a process that was never started");

    constexpr auto poll_interval = 50ms;
    const auto deadline = steady_clock::now() + timeout;

    while (!wait_status_ || stdout_pipe_.read_fd != -1 || stderr_pipe_.read_fd != -1) {
        const auto now = steady_clock::now();

        if (now >= deadline) {
            LOG_DEBUG("pid {} did not finish within {}ms; killing its process group", child_pid_, timeout.count());
            TRY(kill());
            return ErrorKind::TimedOut;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        TRY(drain_pipes(std::min<std::chrono::milliseconds>(remaining, poll_interval)));

        if (output_truncated_) {
            LOG_DEBUG("pid {} wrote more than {} bytes; killing its process group", child_pid_, output_limit_);
            TRY(kill());
            return ErrorKind::OutputLimitExceeded;
        }

        if (!wait_status_) {
            TRY(try_reap());

            if (wait_status_) {
                // Descendants may still be holding the pipes open
                kill_group();
            }
        }
    }

    return RunResult::from_wait_status(*wait_status_);
}

Result<void> Subprocess::drain_pipes(std::chrono::milliseconds poll_timeout) {
    std::vector<pollfd> fds;

    for (int fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        if (fd != -1) {
            fds.push_back(pollfd{.fd = fd, .events = POLLIN, .revents = 0});
        }
    }

    // Child closed both of its outputs but is still running
    if (fds.empty()) {
        std::this_thread::sleep_for(poll_timeout);
        return {};
    }

    int num_ready = TRYE(linux::poll(fds, gsl::narrow_cast<int>(poll_timeout.count())), SyscallFailure);

    if (num_ready == 0) {
        return {};
    }

    auto read_into = [this](int& fd, std::string& buffer) -> Result<void> {
        constexpr std::size_t chunk_size = 4096;

        std::string chunk = TRYE(linux::read(fd, chunk_size), SyscallFailure);

        if (chunk.empty()) {
            TRYE(linux::close(fd), SyscallFailure);
            fd = -1;
            return {};
        }

        const std::size_t room = output_limit_ - std::min(output_limit_, buffer.size());

        if (chunk.size() > room) {
            buffer.append(chunk, 0, room);
            output_truncated_ = true;
        } else {
            buffer += chunk;
        }

        return {};
    };

    for (const pollfd& pfd : fds) {
        if (pfd.revents == 0) {
            continue;
        }

        if (pfd.fd == stdout_pipe_.read_fd) {
            TRY(read_into(stdout_pipe_.read_fd, stdout_buffer_));
        } else {
            TRY(read_into(stderr_pipe_.read_fd, stderr_buffer_));
        }
    }

    return {};
}

Result<void> Subprocess::try_reap() {
    std::optional<int> status = TRYE(linux::waitpid(child_pid_, WNOHANG), SyscallFailure);

    if (status) {
        wait_status_ = status;
        end_time_ = std::chrono::steady_clock::now();
        LOG_TRACE("pid {} {}", child_pid_, RunResult::from_wait_status(*status));
    }

    return {};
}

void Subprocess::kill_group() const {
    auto res = linux::kill(-child_pid_, SIGKILL);

    // ESRCH -> every process in the group has already exited
    if (!res && res.error() != std::errc::no_such_process) {
        LOG_WARN("Failed to kill process group {}: '{}'", child_pid_, res.error().message());
    }
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0) {
        return {};
    }

    kill_group();

    if (!wait_status_) {
        std::optional<int> status = TRYE(linux::waitpid(child_pid_), SyscallFailure);
        wait_status_ = status;
        end_time_ = std::chrono::steady_clock::now();
    }

    TRY(close_pipes());

    return {};
}

bool Subprocess::is_running() const {
    return child_pid_ != 0 && !wait_status_.has_value();
}

std::chrono::milliseconds Subprocess::get_elapsed() const {
    const auto end = wait_status_ ? end_time_ : std::chrono::steady_clock::now();

    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start_time_);
}

Result<void> Subprocess::close_pipes() {
    for (int* fd : {&stdout_pipe_.read_fd, &stdout_pipe_.write_fd, &stderr_pipe_.read_fd, &stderr_pipe_.write_fd}) {
        if (*fd != -1) {
            TRYE(linux::close(*fd), SyscallFailure);
            *fd = -1;
        }
    }

    return {};
}

Result<CommandOutput> run_command(const std::string& exec, const std::vector<std::string>& args,
                                  const std::filesystem::path& cwd, std::chrono::milliseconds timeout,
                                  std::size_t output_limit) {
    Subprocess proc{exec, args, cwd};
    proc.set_output_limit(output_limit);

    TRY(proc.start());

    RunResult result = TRY(proc.wait_for_exit(timeout));

    return CommandOutput{.result = result,
                         .stdout_str = proc.get_stdout(),
                         .stderr_str = proc.get_stderr(),
                         .elapsed = proc.get_elapsed()};
}

} // namespace polygrader
