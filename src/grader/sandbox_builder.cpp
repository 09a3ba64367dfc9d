#include "grader/sandbox_builder.hpp"

#include "config/assignment_config.hpp"
#include "user/file_searcher.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace polygrader {

namespace fs = std::filesystem;

namespace {

/// Copy ``from`` to ``to`` unless ``to`` exists and ``overwrite`` is false
Expected<void, std::string> copy_if_needed(const fs::path& from, const fs::path& to, bool overwrite) {
    std::error_code err;

    if (!overwrite && fs::exists(to, err)) {
        LOG_TRACE("{} already present; not copying", to.string());
        return {};
    }

    fs::copy_file(from, to, fs::copy_options::overwrite_existing, err);

    if (err) {
        return fmt::format("Error copying {} to {}: {}", from.string(), to.parent_path().string(), err.message());
    }

    return {};
}

} // namespace

SandboxBuilder::SandboxBuilder(const AssignmentConfig& config, fs::path assets_root, SandboxLayout layout,
                               Options options)
    : config_{&config}
    , assets_root_{std::move(assets_root)}
    , layout_{std::move(layout)}
    , options_{options} {}

fs::path SandboxBuilder::sandbox_root(const fs::path& extraction_root, LanguageKind language) {
    return extraction_root / SANDBOX_ROOT_NAME / traits_of(language).sandbox_subdir;
}

std::string SandboxBuilder::strip_harness_index(const std::string& filename, std::string_view harness_name) {
    const std::regex numbered{fmt::format(R"(({})\d+(\.\w+))", FileSearcher::escape(harness_name))};

    return std::regex_replace(filename, numbered, "$1$2");
}

Expected<RequiredFiles, std::string> SandboxBuilder::find_required_files(const fs::path& extraction_root,
                                                                         LanguageKind language) const {
    const auto& traits = traits_of(language);

    auto with_ext = [&traits](const std::string& base) { return base + std::string{traits.source_ext}; };
    auto escaped = [&](const std::string& base) { return FileSearcher::escape(with_ext(base)); };

    std::vector<std::string> alternatives =
        config_->required_files | ranges::views::transform(escaped) | ranges::to<std::vector<std::string>>();

    FileSearcher searcher{"(`names`)", {{"names", fmt::format("{}", fmt::join(alternatives, "|"))}}};
    searcher.exclude_directories({std::string{SANDBOX_ROOT_NAME}});

    auto matches = searcher.search_recursive(extraction_root);

    if (!matches) {
        return fmt::format("Error searching {}: {}", extraction_root.string(), matches.error().message());
    }

    RequiredFiles result;

    // Matches are ordered shallowest first, so the first one seen for each name wins
    for (const fs::path& match : *matches) {
        result.found.try_emplace(match.filename().string(), match);
    }

    for (const std::string& base : config_->required_files) {
        if (!result.found.contains(with_ext(base))) {
            result.missing.push_back(with_ext(base));
        }
    }

    LOG_DEBUG("Found {} of {} required {} files in {}", result.found.size(), config_->required_files.size(),
              traits.display_name, extraction_root.string());

    return result;
}

Expected<Sandbox, std::string> SandboxBuilder::build_one(const fs::path& dir, const fs::path& harness_source,
                                                         bool rebuild, LanguageKind language,
                                                         const RequiredFiles& required) const {
    const auto& traits = traits_of(language);
    std::error_code err;

    if (rebuild) {
        fs::remove_all(dir, err);
        if (err) {
            return fmt::format("Error removing {}: {}", dir.string(), err.message());
        }
    }

    fs::create_directories(dir, err);
    if (err) {
        return fmt::format("Error creating {}: {}", dir.string(), err.message());
    }

    Sandbox sandbox{.dir = dir,
                    .harness = dir / strip_harness_index(harness_source.filename().string(), layout_.harness_name),
                    .problem = ""};

    if (fs::exists(harness_source, err)) {
        TRY(copy_if_needed(harness_source, sandbox.harness, options_.refresh_harness));
    } else {
        LOG_WARN("Test harness {} does not exist", harness_source.string());
        sandbox.problem = fmt::format("Test harness {} not found", harness_source.filename().string());
    }

    for (const auto& [name, source] : required.found) {
        TRY(copy_if_needed(source, dir / name, /*overwrite=*/false));
    }

    for (const std::string& provided : config_->provided_files) {
        std::string provided_name = provided + std::string{traits.source_ext};
        fs::path source = assets_root_ / traits.asset_dir / provided_name;

        if (!fs::exists(source, err)) {
            LOG_WARN("Provided file {} does not exist; skipping", source.string());
            continue;
        }

        TRY(copy_if_needed(source, dir / provided_name, /*overwrite=*/false));
    }

    return sandbox;
}

Expected<SandboxSet, std::string> SandboxBuilder::build(const fs::path& extraction_root, LanguageKind language,
                                                        const RequiredFiles& required, std::size_t num_tests) const {
    DEBUG_ASSERT(required.complete(), "Sandboxes must not be built for an incomplete submission");

    const auto& traits = traits_of(language);
    const fs::path root = sandbox_root(extraction_root, language);
    const fs::path asset_dir = assets_root_ / traits.asset_dir;

    SandboxSet result;

    if (layout_.indexed_tests) {
        result.tests.reserve(num_tests);

        for (std::size_t i = 1; i <= num_tests; ++i) {
            fs::path harness_source = asset_dir / fmt::format("{}{}{}", layout_.harness_name, i, traits.harness_ext);

            Sandbox sandbox = TRY(build_one(root / fmt::format("test_{}", i), harness_source, options_.clean_start,
                                            language, required));
            result.tests.push_back(std::move(sandbox));
        }
    }

    fs::path combined_source = asset_dir / fmt::format("{}{}", layout_.harness_name, traits.harness_ext);
    result.combined = TRY(build_one(root / layout_.combined_dir_name, combined_source,
                                    options_.clean_start || layout_.always_rebuild_combined, language, required));

    LOG_DEBUG("Built {} sandboxes under {}", result.tests.size() + 1, root.string());

    return result;
}

} // namespace polygrader
