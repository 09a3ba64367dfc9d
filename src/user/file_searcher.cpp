#include "user/file_searcher.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>

#include <range/v3/algorithm/sort.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

namespace polygrader {

FileSearcher::FileSearcher(std::string expr, std::map<std::string, std::string> args, bool case_insensitive)
    : expr_{std::move(expr)}
    , args_{std::move(args)}
    , case_insensitive_{case_insensitive} {}

void FileSearcher::exclude_directories(std::set<std::string> names) {
    excluded_dirs_ = std::move(names);
}

std::string FileSearcher::set_arg(const std::string& key, std::string_view value) {
    if (auto iter = args_.find(key); iter != args_.end()) {
        return std::exchange(iter->second, std::string{value});
    }

    args_[key] = value;
    return "";
}

std::string FileSearcher::get_expr() const {
    return subst_args();
}

Expected<std::vector<std::filesystem::path>> FileSearcher::search(const std::filesystem::path& base) const {
    return search_recursive(base, 0);
}

Expected<std::vector<std::filesystem::path>> FileSearcher::search_recursive(const std::filesystem::path& base,
                                                                            int max_depth) const {
    namespace fs = std::filesystem;

    auto flags = std::regex::ECMAScript;
    if (case_insensitive_) {
        flags |= std::regex::icase;
    }

    std::regex regex{subst_args(), flags};

    LOG_DEBUG("Searching {} with ReGex string: {}", base.string(), subst_args());

    // (depth, path) pairs, so that shallower matches sort first
    std::vector<std::pair<int, fs::path>> matches;
    std::size_t search_counter = 0;

    std::error_code err;
    auto iter = fs::recursive_directory_iterator{base, err};

    if (err) {
        LOG_DEBUG("Failed to open {} for searching: '{}'", base.string(), err.message());
        return err;
    }

    for (; iter != fs::recursive_directory_iterator{}; iter.increment(err)) {
        if (err) {
            LOG_DEBUG("Directory iteration failed below {}: '{}'", base.string(), err.message());
            return err;
        }

        search_counter++;

        const fs::directory_entry& entry = *iter;

        if (entry.is_directory()) {
            if (excluded_dirs_.contains(entry.path().filename().string()) || iter.depth() >= max_depth) {
                iter.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file()) {
            continue;
        }

        if (does_match(regex, entry.path().filename().string())) {
            matches.emplace_back(iter.depth(), entry.path());
        }
    }

    if (err) {
        LOG_DEBUG("Directory iteration failed below {}: '{}'", base.string(), err.message());
        return err;
    }

    LOG_TRACE("Searched through {} entries; {} matched", search_counter, matches.size());

    ranges::sort(matches);

    std::vector<fs::path> result;
    result.reserve(matches.size());

    for (auto& [depth, path] : matches) {
        result.push_back(std::move(path));
    }

    return result;
}

std::string FileSearcher::subst_args() const {
    std::string result = expr_;

    for (const auto& [key, value] : args_) {
        std::string var = "`" + key + "`";

        for (auto pos = result.find(var); pos != std::string::npos; pos = result.find(var, pos + value.size())) {
            result.replace(pos, var.size(), value);
        }
    }

    return result;
}

std::string FileSearcher::escape(std::string_view literal) {
    static constexpr std::string_view METACHARACTERS = R"(\^$.|?*+()[]{})";

    std::string result;
    result.reserve(literal.size());

    for (char chr : literal) {
        if (METACHARACTERS.find(chr) != std::string_view::npos) {
            result += '\\';
        }
        result += chr;
    }

    return result;
}

bool FileSearcher::does_match(const std::regex& expr, std::string_view filename) {
    LOG_TRACE("Attempting to match filename: '{}'", filename);
    return std::regex_match(filename.begin(), filename.end(), expr);
}

} // namespace polygrader
