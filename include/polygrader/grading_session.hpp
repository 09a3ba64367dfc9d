/// \file
/// Defines data classes to store result data for the current run session
#pragma once

#include <polygrader/common/formatters/macros.hpp>
#include <polygrader/language.hpp>

#include <gsl/util>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// One roster entry
struct StudentInfo
{
    std::string first_name; // for groups, this holds the whole (single token) name
    std::string last_name;  // empty for groups

    /// The name as written in the roster
    std::string display_name;

    bool is_group() const { return last_name.empty(); }
};

/// One student's uploaded archive, once matched to a roster entry
struct Submission
{
    std::string username;
    std::filesystem::path archive_path;
    std::filesystem::path extraction_path;

    /// Languages with at least one source file in the extraction tree
    std::set<LanguageKind> languages;
};

struct TestResult
{
    std::string name;
    bool passed{};

    /// Captured output of the test program (or compiler output, on compile failure)
    std::string output;

    /// Explanation of a failure; empty on success
    std::string diagnostic;
};

enum class GradeStatus {
    NotGraded,       ///< Grading has not happened (yet), e.g. the run was halted early
    NotSubmitted,    ///< No archive matched, or the archive holds no recognized source files
    Ignored,         ///< Listed in the assignment's ignore list
    Tested,          ///< Tests ran; see the individual results
    Failed,          ///< Grading could not proceed due to the submission (e.g., missing required files)
    CompilerMissing, ///< The toolchain for the submission's language is not installed
    Error            ///< Unexpected filesystem or process failure
};

struct StudentResult
{
    StudentInfo info;
    GradeStatus status = GradeStatus::NotGraded;

    std::optional<Submission> submission;

    /// The language whose results were committed
    std::optional<LanguageKind> language;

    /// Every language grading was attempted with, in order
    std::vector<LanguageKind> attempted_languages;

    /// One per configured test, in configured order
    std::vector<TestResult> tests;

    bool full_output_passed{};
    std::string full_output;

    /// Wall-clock time of the combined run; only recorded by timing checks
    std::optional<std::chrono::milliseconds> full_runtime;

    std::string diagnostic;

    /// Human-readable account of the grading steps (files found, per-test verdicts, fallback decisions)
    std::string grading_log;

    const std::string& username() const {
        static const std::string none;
        return submission ? submission->username : none;
    }

    int num_tests_passed() const { return gsl::narrow_cast<int>(ranges::count_if(tests, &TestResult::passed)); }

    bool all_passed() const { return !tests.empty() && ranges::all_of(tests, &TestResult::passed); }
};

struct RunMetadata
{
    std::string_view version_string;
    std::string assignment_name;
    std::string mode_name;
    std::chrono::system_clock::time_point start_time;
};

struct MultiStudentResult
{
    std::vector<StudentResult> results;

    /// Set when the run was stopped early because a toolchain is missing
    bool halted{};
};

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::GradeStatus, NotGraded, NotSubmitted, Ignored, Tested, Failed, CompilerMissing,
                   Error);
