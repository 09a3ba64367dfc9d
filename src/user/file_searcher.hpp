#pragma once

#include <polygrader/common/expected.hpp>

#include <filesystem>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Finds files whose name matches a regular expression
///
/// The expression may contain variables written as `name`, which are substituted with the values given in
/// ``args`` before compiling the expression. Values are inserted verbatim; use ``escape`` for literal text.
class FileSearcher
{
public:
    static constexpr auto DEFAULT_SEARCH_DEPTH = 10;

    explicit FileSearcher(std::string expr, std::map<std::string, std::string> args = {}, bool case_insensitive = false);

    /// Directories with any of these names are not descended into
    void exclude_directories(std::set<std::string> names);

    /// Matching files directly inside ``base``
    Expected<std::vector<std::filesystem::path>> search(const std::filesystem::path& base) const;

    /// Matching files anywhere below ``base``, at most ``max_depth`` directories deep
    /// Results are ordered by depth, then by path, so the first element is the shallowest match.
    Expected<std::vector<std::filesystem::path>> search_recursive(const std::filesystem::path& base,
                                                                  int max_depth = DEFAULT_SEARCH_DEPTH) const;

    std::string set_arg(const std::string& key, std::string_view value);

    std::string get_expr() const;

    /// Escape all regex metacharacters in ``literal``
    static std::string escape(std::string_view literal);

private:
    std::string subst_args() const;
    static bool does_match(const std::regex& expr, std::string_view filename);

    std::string expr_;
    std::map<std::string, std::string> args_;
    bool case_insensitive_;
    std::set<std::string> excluded_dirs_;
};

} // namespace polygrader
