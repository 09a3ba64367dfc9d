#include "grader/output_comparator.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/equal.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

std::vector<std::string> normalized_lines(std::string_view text) {
    std::vector<std::string> result;

    std::size_t begin = 0;
    while (begin <= text.size()) {
        std::size_t end = text.find('\n', begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string line = boost::algorithm::trim_copy(std::string{text.substr(begin, end - begin)});

        if (!line.empty()) {
            result.push_back(std::move(line));
        }

        begin = end + 1;
    }

    return result;
}

Comparison compare_output(std::string_view actual, std::string_view expected) {
    if (ranges::equal(normalized_lines(actual), normalized_lines(expected))) {
        return {.matches = true, .diagnostic = ""};
    }

    return {.matches = false,
            .diagnostic = fmt::format("Output does not match expected output:\nActual output:\n{}\n", actual)};
}

Comparison compare_output_to_file(std::string_view actual, const std::filesystem::path& expected_file) {
    auto expected = read_text_file(expected_file);

    if (!expected) {
        LOG_WARN("Cannot compare against {}: {}", expected_file.string(), expected.error());
        return {.matches = false, .diagnostic = fmt::format("Error comparing results: {}", expected.error())};
    }

    return compare_output(actual, *expected);
}

Expected<std::string, std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream file{path};

    if (!file) {
        return {UnexpectedT{}, fmt::format("Could not open {}", path.string())};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        return {UnexpectedT{}, fmt::format("IO error reading {}", path.string())};
    }

    return buffer.str();
}

} // namespace polygrader
