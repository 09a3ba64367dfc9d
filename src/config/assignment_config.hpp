#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/common/formatters/macros.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Everything that describes one assignment and how it is graded
///
/// Loaded once, adjusted by command line overrides, and then passed by const reference to everything
/// that needs it. Nothing reads configuration from global state.
struct AssignmentConfig
{
    /// How roster names are turned into archive search keys
    enum class NameOrder { FirstLast, LastFirst };

    std::string name;

    /// Base names (without extension) of the files every submission must contain
    std::vector<std::string> required_files;

    /// Base names of instructor-supplied support files, copied into every sandbox
    std::vector<std::string> provided_files;

    /// Lines of the instructor's expected output that begin each test's section
    std::vector<std::string> test_headers;

    std::string expected_output_file = std::string{DEFAULT_EXPECTED_OUTPUT_FILE};

    NameOrder name_order = NameOrder::FirstLast;

    /// Rebuild every sandbox (and re-extract the combined archive) from scratch
    bool clean_start = false;

    std::chrono::seconds timeout{DEFAULT_TIMEOUT_SECONDS};

    /// Total attempts for one compile+run; only timeouts are retried
    int max_attempts = DEFAULT_MAX_ATTEMPTS;

    /// Output kept per stream of one toolchain step; a program writing more is stopped and fails
    std::size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;

    /// Strings that must all appear in the output of a timing run
    std::vector<std::string> time_check_strings;

    /// Usernames that are never graded
    std::vector<std::string> ignore_names;

    /// Number of students graded concurrently
    int jobs = 1;

    bool halt_on_missing_toolchain = true;

    static constexpr std::string_view DEFAULT_EXPECTED_OUTPUT_FILE = "ExpectedOutput.txt";
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 900;
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr std::size_t DEFAULT_MAX_OUTPUT_BYTES = std::size_t{64} * 1024 * 1024;

    /// Parse a YAML document. Only ``name`` and ``required_files`` are mandatory
    static Expected<AssignmentConfig, std::string> parse(const std::string& yaml_text);

    /// Read and parse a YAML file
    static Expected<AssignmentConfig, std::string> load(const std::filesystem::path& path);

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const;

    bool is_ignored(std::string_view username) const;
};

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::AssignmentConfig::NameOrder, FirstLast, LastFirst);
