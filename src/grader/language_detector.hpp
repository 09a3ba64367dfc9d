#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>

#include <filesystem>
#include <set>

namespace polygrader {

/// Languages with at least one source file anywhere below ``extraction_root``, ignoring the sandbox tree
/// A root that does not exist contains no languages.
Expected<std::set<LanguageKind>> detect_languages(const std::filesystem::path& extraction_root);

} // namespace polygrader
