#include "adapters/language_adapter.hpp"

#include "subprocess/subprocess.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

bool LanguageAdapter::probe_toolchain() const {
    const auto& traits = traits_of(get_kind());
    const auto& [exec, arg] = traits.probe_command;

    // The probe must never be what stalls a run
    constexpr std::chrono::seconds PROBE_TIMEOUT{60};

    auto res = run_command(std::string{exec}, {std::string{arg}}, {}, PROBE_TIMEOUT);

    if (!res) {
        LOG_DEBUG("{} toolchain probe '{} {}' failed: {}", traits.display_name, exec, arg, res.error());
        return false;
    }

    if (!res->result.succeeded()) {
        LOG_DEBUG("{} toolchain probe '{} {}' {}", traits.display_name, exec, arg, res->result);
        return false;
    }

    return true;
}

std::string LanguageAdapter::redact_paths(std::string_view text) {
    // An absolute path: at least one directory component followed by a file name with an extension
    static const std::regex ABSOLUTE_PATH{R"((?:/[^\s:/'"()]+)+/([^\s:/'"()]+\.\w+))"};

    return std::regex_replace(std::string{text}, ABSOLUTE_PATH, "$1");
}

RunOutcome LanguageAdapter::from_error(ErrorKind error, std::string_view exec) {
    using enum RunOutcome::Status;

    switch (error) {
    case ErrorKind::TimedOut:
        return RunOutcome::make(TimedOut, std::string{TIMEOUT_MESSAGE});
    case ErrorKind::ExecFailure:
        return RunOutcome::make(CompilerMissing, fmt::format("FAILED - '{}' could not be started", exec));
    case ErrorKind::OutputLimitExceeded:
        return RunOutcome::make(RuntimeError, std::string{OUTPUT_LIMIT_MESSAGE});
    default:
        return RunOutcome::make(Error, fmt::format("ERROR - running '{}' failed ({})", exec, error));
    }
}

Expected<CommandOutput, RunOutcome> LanguageAdapter::run_tool(const std::string& exec,
                                                              const std::vector<std::string>& args,
                                                              const std::filesystem::path& working_dir) const {
    LOG_TRACE("Running {} {} in {}", exec, args, working_dir.string());

    auto res = run_command(exec, args, working_dir, timeout_, output_limit_);

    if (!res) {
        return from_error(res.error(), exec);
    }

    return res.value();
}

std::optional<RunOutcome> LanguageAdapter::check_compile(const std::string& exec, const std::vector<std::string>& args,
                                                         const std::filesystem::path& working_dir) const {
    auto res = run_tool(exec, args, working_dir);

    if (!res) {
        return res.error();
    }

    if (!res->result.succeeded()) {
        LOG_DEBUG("Compilation in {} failed: {}", working_dir.string(), res->result);
        return RunOutcome::make(RunOutcome::Status::CompileError,
                                std::string{COMPILE_ERROR_PREFIX} + redact_paths(res->combined()));
    }

    return std::nullopt;
}

} // namespace polygrader
