#include "adapters/managed_il_adapter.hpp"

#include "adapters/language_adapter.hpp"
#include "grader/output_comparator.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace polygrader {

Expected<void, std::string> ManagedIlAdapter::ensure_system_using(const std::filesystem::path& harness) {
    constexpr std::string_view SYSTEM_USING = "using System;";

    std::string contents = TRY(read_text_file(harness));

    if (contents.find(SYSTEM_USING) != std::string::npos) {
        return {};
    }

    std::ofstream out{harness, std::ios::trunc};
    out << SYSTEM_USING << '\n' << contents;

    if (!out) {
        return fmt::format("Error rewriting {}", harness.string());
    }

    return {};
}

Expected<void, std::string> ManagedIlAdapter::write_project_file(const std::filesystem::path& project_path) {
    std::ofstream out{project_path, std::ios::trunc};
    out << PROJECT_TEMPLATE;

    if (!out) {
        return fmt::format("Error writing {}", project_path.string());
    }

    return {};
}

RunOutcome ManagedIlAdapter::compile_and_run(const std::filesystem::path& test_file,
                                             const std::filesystem::path& working_dir) const {
    using enum RunOutcome::Status;

    const std::filesystem::path project = working_dir / PROJECT_FILE_NAME;

    if (auto res = ensure_system_using(test_file); !res) {
        return RunOutcome::make(Error, fmt::format("FAILED - Error preparing test file: {}", res.error()));
    }

    if (auto res = write_project_file(project); !res) {
        return RunOutcome::make(Error, fmt::format("ERROR - {}", res.error()));
    }

    const std::string config{BUILD_CONFIGURATION};

    // Build servers would outlive the build and keep its output pipes open
    if (auto failure = check_compile(
            "dotnet", {"build", project.string(), "-c", config, "--verbosity", "quiet", "-nodeReuse:false"},
            working_dir)) {
        return *failure;
    }

    auto res = run_tool("dotnet", {"run", "--no-build", "--project", project.string(), "-c", config}, working_dir);

    if (!res) {
        return res.error();
    }

    LOG_TRACE("dotnet run in {} {}", working_dir.string(), res->result);

    return {.status = Success, .output = res->stdout_str};
}

} // namespace polygrader
