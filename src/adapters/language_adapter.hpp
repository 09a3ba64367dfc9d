#pragma once

#include "subprocess/subprocess.hpp"

#include <polygrader/common/class_traits.hpp>
#include <polygrader/common/error_types.hpp>
#include <polygrader/common/formatters/macros.hpp>
#include <polygrader/language.hpp>
#include <polygrader/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

/// What came of one compile+run of a harness
struct RunOutcome
{
    enum class Status {
        Success,         ///< Compiled and ran; ``output`` is the program's stdout
        CompileError,    ///< ``output`` is the redacted compiler output
        RuntimeError,    ///< The program failed in a way the language treats as an error
        TimedOut,        ///< The compiler or program exceeded the time limit
        CompilerMissing, ///< The toolchain could not be started
        Error            ///< Unexpected filesystem or process failure
    };

    Status status;

    /// Program stdout on success, otherwise a human-readable diagnostic
    std::string output;

    bool succeeded() const { return status == Status::Success; }

    bool timed_out() const { return status == Status::TimedOut; }

    static RunOutcome make(Status status, std::string output) { return {.status = status, .output = std::move(output)}; }
};

/// Compiles one harness against the student's files and runs it, for one language
///
/// Every toolchain invocation runs with the sandbox as its working directory and under a hard time limit.
/// Implementations hold no mutable state, so one instance may serve concurrent students.
class LanguageAdapter : NonMovable
{
public:
    /// ``timeout`` and ``output_limit`` apply to each toolchain step separately
    explicit LanguageAdapter(std::chrono::milliseconds timeout,
                             std::size_t output_limit = Subprocess::DEFAULT_OUTPUT_LIMIT)
        : timeout_{timeout}
        , output_limit_{output_limit} {}

    virtual ~LanguageAdapter() = default;

    virtual LanguageKind get_kind() const = 0;

    /// Whether the language's toolchain is installed; runs its cheap version command
    virtual bool probe_toolchain() const;

    /// Compile ``test_file`` (a harness inside ``working_dir``) and run the result
    virtual RunOutcome compile_and_run(const std::filesystem::path& test_file,
                                       const std::filesystem::path& working_dir) const = 0;

    std::chrono::milliseconds get_timeout() const { return timeout_; }

    std::size_t get_output_limit() const { return output_limit_; }

    /// Rewrite absolute paths in compiler output to bare file names
    static std::string redact_paths(std::string_view text);

    static constexpr std::string_view TIMEOUT_MESSAGE = "TIMEOUT";
    static constexpr std::string_view OUTPUT_LIMIT_MESSAGE = "FAILED - Output limit exceeded";
    static constexpr std::string_view COMPILE_ERROR_PREFIX = "FAILED - Compilation Error\n";

protected:
    /// Run one toolchain step in ``working_dir`` under the adapter's time limit
    /// Failures to run at all are mapped to the matching outcome.
    Expected<CommandOutput, RunOutcome> run_tool(const std::string& exec, const std::vector<std::string>& args,
                                                 const std::filesystem::path& working_dir) const;

    /// Compile step: an outcome if the compiler failed, nothing if it succeeded
    std::optional<RunOutcome> check_compile(const std::string& exec, const std::vector<std::string>& args,
                                            const std::filesystem::path& working_dir) const;

    static RunOutcome from_error(ErrorKind error, std::string_view exec);

private:
    std::chrono::milliseconds timeout_;
    std::size_t output_limit_;
};

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::RunOutcome::Status, Success, CompileError, RuntimeError, TimedOut, CompilerMissing,
                   Error);
