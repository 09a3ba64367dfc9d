#pragma once

#include "output/verbosity.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/common/formatters/debug.hpp>
#include <polygrader/common/formatters/macros.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace polygrader {

struct ProgramOptions
{

    // ###### Argument fields

    enum class Mode { Correctness, Time, Prepare } mode = Mode::Correctness;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Level of verbosity for cli output
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// YAML assignment description
    std::filesystem::path config_path;

    /// Roster CSV; ``<input>/<assignment>.csv`` if not given
    std::optional<std::filesystem::path> roster_path;

    std::filesystem::path input_dir = DEFAULT_INPUT_DIR;
    std::filesystem::path output_dir = DEFAULT_OUTPUT_DIR;

    // ###### Overrides of the assignment config (unset = use the config's value)

    std::optional<int> jobs;
    bool clean_start = false;
    bool reload_tests = false;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_INPUT_DIR = "input";
    static constexpr std::string_view DEFAULT_OUTPUT_DIR = "output";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          std::string_view description) {
        if (!std::filesystem::exists(path)) {
            return fmt::format("{} \"{}\" does not exist", description, path.string());
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              std::string_view description) {
        TRY(ensure_file_exists(path, description));

        if (!std::filesystem::is_regular_file(path)) {
            return fmt::format("{} \"{}\" is not a regular file", description, path.string());
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           std::string_view description) {
        TRY(ensure_file_exists(path, description));

        if (!std::filesystem::is_directory(path)) {
            return fmt::format("{} \"{}\" is not a directory", description, path.string());
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        TRY(ensure_is_regular_file(config_path, "Assignment config"));
        TRY(ensure_is_directory(input_dir, "Input directory"));

        if (roster_path) {
            TRY(ensure_is_regular_file(*roster_path, "Roster file"));
        }

        if (jobs && *jobs < 1) {
            return fmt::format("Number of jobs must be at least 1 (got {})", *jobs);
        }

        return {};
    }
};

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::ProgramOptions::Mode, Correctness, Time, Prepare);
FMT_SERIALIZE_ENUM(::polygrader::ProgramOptions::ColorizeOpt, Auto, Always, Never);

template <>
struct fmt::formatter<::polygrader::ProgramOptions> : ::polygrader::DebugFormatter
{
    /// ``{}`` names the mode and config file; ``{:?}`` lists every field
    auto format(const ::polygrader::ProgramOptions& from, fmt::format_context& ctx) const {
        if (!is_debug_format) {
            return fmt::format_to(ctx.out(), "{} run of {}", from.mode, from.config_path.string());
        }

        return fmt::format_to(ctx.out(),
                              "{{mode={}, verbosity={}, color_opt={}, config={}, roster={}, input={}, output={}, "
                              "jobs={}, clean_start={}, reload_tests={}}}",
                              from.mode, from.verbosity, from.colorize_option, from.config_path.string(),
                              from.roster_path ? from.roster_path->string() : "<default>", from.input_dir.string(),
                              from.output_dir.string(), from.jobs ? fmt::to_string(*from.jobs) : "<config>",
                              from.clean_start, from.reload_tests);
    }
};
