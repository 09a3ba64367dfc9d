#pragma once

#include "adapters/language_adapter.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Java: strips package declarations, ``javac <harness>``, then ``java <HarnessClass>``
/// A non-zero exit of the program is a runtime error.
class BytecodeAdapter : public LanguageAdapter
{
public:
    using LanguageAdapter::LanguageAdapter;

    LanguageKind get_kind() const override { return LanguageKind::Bytecode; }

    RunOutcome compile_and_run(const std::filesystem::path& test_file,
                               const std::filesystem::path& working_dir) const override;

    /// ``source`` without its package declaration, if its first non-blank line is one; otherwise nullopt
    static std::optional<std::string> strip_package_declaration(std::string_view source);

    /// Apply ``strip_package_declaration`` to every Java source file directly inside ``dir``
    /// Returns the names of the files that were changed
    static Expected<std::vector<std::string>, std::string> strip_package_declarations(const std::filesystem::path& dir);
};

} // namespace polygrader
