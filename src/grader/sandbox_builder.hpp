#pragma once

#include "config/assignment_config.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Name of the directory, directly inside a submission's extraction tree, that holds all of its sandboxes
inline constexpr std::string_view SANDBOX_ROOT_NAME = "temp_test";

/// Which sandboxes a grading strategy needs, and what they are called
struct SandboxLayout
{
    /// Base name of the instructor's harness, e.g. "TestCorrectness"
    std::string harness_name;

    /// Build one sandbox per configured test (``test_<i>``), each with harness ``<harness_name><i>``
    bool indexed_tests = true;

    /// Sandbox for the combined run, which uses the un-numbered harness
    std::string combined_dir_name;

    /// Delete and rebuild the combined sandbox on every run
    bool always_rebuild_combined = false;
};

/// One isolated directory holding copies of a harness and every file it needs
struct Sandbox
{
    std::filesystem::path dir;

    /// The harness inside ``dir``, with any numeric suffix removed from its name
    std::filesystem::path harness;

    /// Why this sandbox cannot be used (e.g. its harness does not exist); empty if usable
    std::string problem;

    bool is_usable() const { return problem.empty(); }
};

struct SandboxSet
{
    /// Index i holds the sandbox of test i + 1; empty if the layout has no indexed tests
    std::vector<Sandbox> tests;

    Sandbox combined;
};

/// Result of searching a submission for the files every implementation must provide
struct RequiredFiles
{
    /// File name (with extension) -> first occurrence in the submission
    std::map<std::string, std::filesystem::path> found;

    /// File names (with extension) that do not occur anywhere, in configured order
    std::vector<std::string> missing;

    bool complete() const { return missing.empty(); }
};

/// Assembles per-test sandboxes from copies of the harness, the student's files, and provided files
///
/// Building is idempotent: existing directories and files are left alone, unless ``clean_start`` is set (the
/// sandbox directory is deleted first) or ``refresh_harness`` is set (the harness copy is overwritten).
/// The student's original files are never modified.
class SandboxBuilder
{
public:
    struct Options
    {
        bool clean_start = false;
        bool refresh_harness = false;
    };

    /// ``assets_root`` is the assignment's input directory, holding one asset subdirectory per language
    SandboxBuilder(const AssignmentConfig& config, std::filesystem::path assets_root, SandboxLayout layout,
                   Options options);

    /// Search ``extraction_root`` (outside the sandbox tree) for every required file of ``language``
    Expected<RequiredFiles, std::string> find_required_files(const std::filesystem::path& extraction_root,
                                                             LanguageKind language) const;

    /// Build every sandbox of the layout. ``required`` must be complete.
    /// Any filesystem failure aborts the whole build; a missing harness only marks its own sandbox unusable.
    Expected<SandboxSet, std::string> build(const std::filesystem::path& extraction_root, LanguageKind language,
                                            const RequiredFiles& required, std::size_t num_tests) const;

    /// Directory holding all sandboxes of ``language`` for one submission
    static std::filesystem::path sandbox_root(const std::filesystem::path& extraction_root, LanguageKind language);

    /// ``TestCorrectness3.cpp`` -> ``TestCorrectness.cpp``, for ``harness_name`` = "TestCorrectness"
    static std::string strip_harness_index(const std::string& filename, std::string_view harness_name);

    const SandboxLayout& get_layout() const { return layout_; }

private:
    Expected<Sandbox, std::string> build_one(const std::filesystem::path& dir,
                                             const std::filesystem::path& harness_source, bool rebuild,
                                             LanguageKind language, const RequiredFiles& required) const;

    const AssignmentConfig* config_;
    std::filesystem::path assets_root_;
    SandboxLayout layout_;
    Options options_;
};

} // namespace polygrader
