#include "prep/assignment_preparer.hpp"

#include "config/assignment_config.hpp"
#include "grader/grading_strategy.hpp"
#include "grader/output_comparator.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace polygrader {

namespace fs = std::filesystem;

namespace {

Expected<void, std::string> write_text_file(const fs::path& path, std::string_view contents) {
    std::ofstream out{path, std::ios::trunc | std::ios::binary};
    out << contents;

    if (!out) {
        return fmt::format("Error writing {}", path.string());
    }

    return {};
}

} // namespace

AssignmentPreparer::AssignmentPreparer(const AssignmentConfig& config, fs::path assets_root)
    : config_{&config}
    , assets_root_{std::move(assets_root)} {}

std::vector<ExpectedSection> AssignmentPreparer::split_expected_output(std::string_view content,
                                                                       const std::vector<std::string>& headers) {
    // (position, 1-based header index)
    std::vector<std::pair<std::size_t, std::size_t>> positions;

    for (std::size_t i = 0; i < headers.size(); ++i) {
        std::size_t pos = content.find(headers[i]);

        if (pos == std::string_view::npos) {
            LOG_WARN("Header {}: \"{}\" not found in the expected output", i + 1, headers[i]);
            continue;
        }

        LOG_DEBUG("Found header {}: \"{}\" at position {}", i + 1, headers[i], pos);
        positions.emplace_back(pos, i + 1);
    }

    ranges::sort(positions);

    std::vector<ExpectedSection> sections;
    sections.reserve(positions.size());

    for (std::size_t i = 0; i < positions.size(); ++i) {
        const auto [start, test_index] = positions[i];
        const std::size_t end = i + 1 < positions.size() ? positions[i + 1].first : content.size();

        sections.push_back({.test_index = test_index, .text = std::string{content.substr(start, end - start)}});
    }

    return sections;
}

Expected<std::size_t, std::string> AssignmentPreparer::write_expected_outputs() const {
    const fs::path source = assets_root_ / config_->expected_output_file;

    std::string content = TRY(read_text_file(source));

    std::vector<ExpectedSection> sections = split_expected_output(content, config_->test_headers);

    for (const ExpectedSection& section : sections) {
        fs::path dest = expected_output_path(assets_root_, section.test_index);
        TRY(write_text_file(dest, section.text));
        LOG_INFO("Created {}", dest.filename().string());
    }

    TRY(write_text_file(expected_output_path(assets_root_), content));

    return sections.size();
}

Expected<std::size_t, std::string> AssignmentPreparer::create_numbered_harnesses(std::size_t num_tests) const {
    std::size_t num_written = 0;

    for (const LanguageTraits& traits : LANGUAGE_TABLE) {
        const fs::path language_dir = assets_root_ / traits.asset_dir;
        const fs::path original = language_dir / fmt::format("{}{}", HARNESS_NAME, traits.harness_ext);

        std::error_code err;

        if (!fs::is_directory(language_dir, err)) {
            LOG_WARN("Directory {} does not exist", language_dir.string());
            continue;
        }

        if (!fs::exists(original, err)) {
            LOG_WARN("File {} does not exist", original.string());
            continue;
        }

        for (std::size_t i = 1; i <= num_tests; ++i) {
            fs::path copy = language_dir / fmt::format("{}{}{}", HARNESS_NAME, i, traits.harness_ext);

            fs::copy_file(original, copy, fs::copy_options::overwrite_existing, err);
            if (err) {
                return fmt::format("Error copying {} to {}: {}", original.string(), copy.string(), err.message());
            }

            LOG_DEBUG("Created {}", copy.string());
            ++num_written;
        }
    }

    return num_written;
}

Expected<void, std::string> AssignmentPreparer::prepare(std::size_t num_tests) const {
    std::size_t num_harnesses = TRY(create_numbered_harnesses(num_tests));
    LOG_INFO("Created {} numbered test harnesses", num_harnesses);

    std::size_t num_sections = TRY(write_expected_outputs());
    LOG_INFO("Split expected output into {} of {} sections", num_sections, config_->test_headers.size());

    return {};
}

} // namespace polygrader
