#include "adapters/native_adapter.hpp"

#include "adapters/language_adapter.hpp"

#include <polygrader/logging.hpp>

#include <filesystem>
#include <string>

namespace polygrader {

RunOutcome NativeAdapter::compile_and_run(const std::filesystem::path& test_file,
                                          const std::filesystem::path& working_dir) const {
    const std::filesystem::path executable = working_dir / EXECUTABLE_NAME;

    if (auto failure = check_compile("g++", {"-o", executable.string(), test_file.string()}, working_dir)) {
        return *failure;
    }

    auto res = run_tool(executable.string(), {}, working_dir);

    if (!res) {
        // The compiler was there a moment ago; failing to start what it produced is not a missing toolchain
        if (res.error().status == RunOutcome::Status::CompilerMissing) {
            return RunOutcome::make(RunOutcome::Status::Error, res.error().output);
        }
        return res.error();
    }

    LOG_TRACE("{} {}", executable.string(), res->result);

    return {.status = RunOutcome::Status::Success, .output = res->stdout_str};
}

} // namespace polygrader
