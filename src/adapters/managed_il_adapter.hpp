#pragma once

#include "adapters/language_adapter.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace polygrader {

/// C#: writes a minimal SDK-style project beside the harness, ``dotnet build``s it, then runs the build output
class ManagedIlAdapter : public LanguageAdapter
{
public:
    using LanguageAdapter::LanguageAdapter;

    LanguageKind get_kind() const override { return LanguageKind::ManagedIL; }

    RunOutcome compile_and_run(const std::filesystem::path& test_file,
                               const std::filesystem::path& working_dir) const override;

    /// Prepend ``using System;`` to the harness unless it already has it
    static Expected<void, std::string> ensure_system_using(const std::filesystem::path& harness);

    static Expected<void, std::string> write_project_file(const std::filesystem::path& project_path);

    static constexpr std::string_view PROJECT_FILE_NAME = "TestProject.csproj";
    static constexpr std::string_view BUILD_CONFIGURATION = "Release";

    static constexpr std::string_view PROJECT_TEMPLATE = R"(<Project Sdk="Microsoft.NET.Sdk">
  <PropertyGroup>
    <OutputType>Exe</OutputType>
    <TargetFramework>net8.0</TargetFramework>
    <ImplicitUsings>enable</ImplicitUsings>
    <Nullable>enable</Nullable>
    <WarningLevel>0</WarningLevel>
  </PropertyGroup>
</Project>
)";
};

} // namespace polygrader
