#pragma once

#include "adapters/language_adapter.hpp"

#include <polygrader/common/class_traits.hpp>
#include <polygrader/language.hpp>

#include <map>
#include <mutex>

namespace polygrader {

/// Remembers, for the duration of a run, whether each language's toolchain is installed
/// Safe to share between threads; each language is probed at most once.
class ToolchainProbe : NonMovable
{
public:
    bool is_available(const LanguageAdapter& adapter);

private:
    std::mutex mutex_;
    std::map<LanguageKind, bool> cache_;
};

} // namespace polygrader
