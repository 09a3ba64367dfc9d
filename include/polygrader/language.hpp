/// \file
/// The closed set of languages that submissions may be written in, and the static properties of each
#pragma once

#include <polygrader/common/formatters/macros.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace polygrader {

/// Enumerators are listed in fallback preference order
enum class LanguageKind {
    Native,   ///< Natively compiled (C++)
    Bytecode, ///< Compiled to JVM bytecode (Java)
    ManagedIL ///< Compiled to .NET IL (C#)
};

inline constexpr std::array ALL_LANGUAGES = {LanguageKind::Native, LanguageKind::Bytecode, LanguageKind::ManagedIL};

struct LanguageTraits
{
    LanguageKind kind;

    std::string_view display_name;

    /// Extension of student implementation files and of provided support files
    std::string_view source_ext;

    /// Extension of instructor test harness files
    std::string_view harness_ext;

    /// Subdirectory of the assignment's input directory holding harnesses and provided files
    std::string_view asset_dir;

    /// Subdirectory of a submission's sandbox root used for this language
    std::string_view sandbox_subdir;

    /// A cheap invocation that succeeds iff the toolchain is installed
    std::array<std::string_view, 2> probe_command;
};

inline constexpr std::array LANGUAGE_TABLE = {
    LanguageTraits{.kind = LanguageKind::Native,
                   .display_name = "C++",
                   .source_ext = ".h",
                   .harness_ext = ".cpp",
                   .asset_dir = "CPP",
                   .sandbox_subdir = "cpp",
                   .probe_command = {"g++", "--version"}},
    LanguageTraits{.kind = LanguageKind::Bytecode,
                   .display_name = "Java",
                   .source_ext = ".java",
                   .harness_ext = ".java",
                   .asset_dir = "JAVA",
                   .sandbox_subdir = "java",
                   .probe_command = {"javac", "-version"}},
    LanguageTraits{.kind = LanguageKind::ManagedIL,
                   .display_name = "C#",
                   .source_ext = ".cs",
                   .harness_ext = ".cs",
                   .asset_dir = "C#",
                   .sandbox_subdir = "csharp",
                   .probe_command = {"dotnet", "--version"}},
};

static_assert(LANGUAGE_TABLE.size() == ALL_LANGUAGES.size());

constexpr const LanguageTraits& traits_of(LanguageKind kind) {
    for (const LanguageTraits& traits : LANGUAGE_TABLE) {
        if (traits.kind == kind) {
            return traits;
        }
    }

    // Unreachable; every enumerator has an entry
    return LANGUAGE_TABLE.front();
}

static_assert(traits_of(LanguageKind::Bytecode).kind == LanguageKind::Bytecode &&
              traits_of(LanguageKind::ManagedIL).kind == LanguageKind::ManagedIL);

/// Maps a student source extension (including the leading '.') to its language
constexpr std::optional<LanguageKind> language_from_source_ext(std::string_view ext) {
    for (const LanguageTraits& traits : LANGUAGE_TABLE) {
        if (traits.source_ext == ext) {
            return traits.kind;
        }
    }

    return std::nullopt;
}

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::LanguageKind, Native, Bytecode, ManagedIL);
