#pragma once

#include "adapters/language_adapter.hpp"

#include <polygrader/language.hpp>

#include <filesystem>

namespace polygrader {

/// C++: ``g++ -o test <harness>``, then ``./test``
/// The program's output is accepted whatever its exit code, as long as it finishes in time.
class NativeAdapter : public LanguageAdapter
{
public:
    using LanguageAdapter::LanguageAdapter;

    LanguageKind get_kind() const override { return LanguageKind::Native; }

    RunOutcome compile_and_run(const std::filesystem::path& test_file,
                               const std::filesystem::path& working_dir) const override;

    static constexpr auto EXECUTABLE_NAME = "test";
};

} // namespace polygrader
