#include "grader/grading_strategy.hpp"

#include "adapters/language_adapter.hpp"
#include "config/assignment_config.hpp"
#include "grader/output_comparator.hpp"
#include "grader/sandbox_builder.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace polygrader {

std::filesystem::path expected_output_path(const std::filesystem::path& assets_root, std::size_t test_index) {
    return assets_root / fmt::format("expectedoutput{}.txt", test_index);
}

std::filesystem::path expected_output_path(const std::filesystem::path& assets_root) {
    return assets_root / "expectedoutput.txt";
}

GradingStrategy GradingStrategy::correctness(const std::filesystem::path& assets_root) {
    return GradingStrategy{
        .kind = Kind::Correctness,
        .layout = {.harness_name = "TestCorrectness",
                   .indexed_tests = true,
                   .combined_dir_name = "full_test",
                   .always_rebuild_combined = false},
        .combined_verdict =
            [expected = expected_output_path(assets_root)](const RunOutcome& outcome) {
                return compare_output_to_file(outcome.output, expected);
            },
        .record_runtime = false,
        .results_dir_name = "results",
        .full_output_dir_name = "full_output",
    };
}

GradingStrategy GradingStrategy::timing(const AssignmentConfig& config) {
    return GradingStrategy{
        .kind = Kind::Timing,
        .layout = {.harness_name = "TestTime",
                   .indexed_tests = false,
                   .combined_dir_name = "time_test",
                   .always_rebuild_combined = true},
        .combined_verdict =
            [checks = config.time_check_strings](const RunOutcome& outcome) {
                std::vector<std::string> missing;

                for (const std::string& check : checks) {
                    if (outcome.output.find(check) == std::string::npos) {
                        missing.push_back(check);
                    }
                }

                if (missing.empty()) {
                    return Comparison{.matches = true, .diagnostic = ""};
                }

                return Comparison{.matches = false,
                                  .diagnostic = fmt::format("Output is missing: {}", fmt::join(missing, ", "))};
            },
        .record_runtime = true,
        .results_dir_name = "time_results",
        .full_output_dir_name = "time_full_output",
    };
}

} // namespace polygrader
