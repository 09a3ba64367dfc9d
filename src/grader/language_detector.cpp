#include "grader/language_detector.hpp"

#include "grader/sandbox_builder.hpp"
#include "user/file_searcher.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace polygrader {

Expected<std::set<LanguageKind>> detect_languages(const std::filesystem::path& extraction_root) {
    std::set<LanguageKind> result;

    std::error_code err;
    if (!std::filesystem::exists(extraction_root, err)) {
        return result;
    }

    std::vector<std::string> extensions;
    for (const LanguageTraits& traits : LANGUAGE_TABLE) {
        extensions.push_back(FileSearcher::escape(traits.source_ext));
    }

    FileSearcher searcher{R"(.*(`exts`))", {{"exts", fmt::format("{}", fmt::join(extensions, "|"))}}};
    searcher.exclude_directories({std::string{SANDBOX_ROOT_NAME}});

    auto matches = searcher.search_recursive(extraction_root);

    if (!matches) {
        return matches.error();
    }

    for (const std::filesystem::path& match : *matches) {
        if (auto language = language_from_source_ext(match.extension().string())) {
            result.insert(*language);
        }
    }

    LOG_DEBUG("Detected languages in {}: {}", extraction_root.string(), result);

    return result;
}

} // namespace polygrader
