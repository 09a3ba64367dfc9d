#pragma once

#include "config/assignment_config.hpp"

#include <polygrader/common/expected.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// One test's slice of the instructor's expected output
struct ExpectedSection
{
    /// 1-based index of the test header that starts this section
    std::size_t test_index;
    std::string text;
};

/// Derives per-test assets from the instructor's originals, before any student is graded
class AssignmentPreparer
{
public:
    /// ``assets_root`` is the assignment's input directory
    AssignmentPreparer(const AssignmentConfig& config, std::filesystem::path assets_root);

    /// Split ``content`` at the first occurrence of each header
    /// Sections are cut in order of position, and each runs up to the next found header (or the end).
    /// Headers that do not occur are skipped with a warning.
    static std::vector<ExpectedSection> split_expected_output(std::string_view content,
                                                              const std::vector<std::string>& headers);

    /// Write ``expectedoutput<i>.txt`` for each found header, and the whole file as ``expectedoutput.txt``
    /// Returns the number of per-test files written
    Expected<std::size_t, std::string> write_expected_outputs() const;

    /// Copy each language's ``TestCorrectness`` harness to ``TestCorrectness1 .. TestCorrectness<num_tests>``
    /// Languages without an asset directory or harness are skipped. Returns the number of files written
    Expected<std::size_t, std::string> create_numbered_harnesses(std::size_t num_tests) const;

    Expected<void, std::string> prepare(std::size_t num_tests) const;

    static constexpr std::string_view HARNESS_NAME = "TestCorrectness";

private:
    const AssignmentConfig* config_;
    std::filesystem::path assets_root_;
};

} // namespace polygrader
