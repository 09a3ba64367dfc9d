#pragma once

#include <polygrader/common/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

struct Comparison
{
    bool matches{};

    /// Includes the full actual output on mismatch; empty on match
    std::string diagnostic;
};

/// The non-blank lines of ``text``, each with surrounding whitespace removed
std::vector<std::string> normalized_lines(std::string_view text);

/// Compare program output with the expected output, ignoring blank lines and surrounding whitespace
Comparison compare_output(std::string_view actual, std::string_view expected);

/// Like ``compare_output``, reading the expected output from ``expected_file``
/// An unreadable file yields a mismatch whose diagnostic says so.
Comparison compare_output_to_file(std::string_view actual, const std::filesystem::path& expected_file);

/// Read a whole file into a string
Expected<std::string, std::string> read_text_file(const std::filesystem::path& path);

} // namespace polygrader
