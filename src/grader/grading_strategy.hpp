#pragma once

#include "adapters/language_adapter.hpp"
#include "config/assignment_config.hpp"
#include "grader/output_comparator.hpp"
#include "grader/sandbox_builder.hpp"

#include <polygrader/common/formatters/macros.hpp>

#include <filesystem>
#include <functional>
#include <string>

namespace polygrader {

/// What differs between kinds of grading run; everything else is shared by the engine
struct GradingStrategy
{
    enum class Kind { Correctness, Timing };

    Kind kind;

    SandboxLayout layout;

    /// Verdict on a successful combined run
    std::function<Comparison(const RunOutcome&)> combined_verdict;

    /// Whether the elapsed time of the combined run is recorded and reported
    bool record_runtime{};

    /// Directory names (below the output directory) for per-student results and combined output
    std::string results_dir_name;
    std::string full_output_dir_name;

    /// Per-test sandboxes plus ``full_test``, judged against the expected output files in ``assets_root``
    static GradingStrategy correctness(const std::filesystem::path& assets_root);

    /// A single freshly built ``time_test`` sandbox; passes if every configured check string is printed
    static GradingStrategy timing(const AssignmentConfig& config);
};

/// ``expectedoutput<test_index>.txt``, or ``expectedoutput.txt`` for the combined run
std::filesystem::path expected_output_path(const std::filesystem::path& assets_root, std::size_t test_index);
std::filesystem::path expected_output_path(const std::filesystem::path& assets_root);

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::GradingStrategy::Kind, Correctness, Timing);
