#include "grader/toolchain_probe.hpp"

#include "adapters/language_adapter.hpp"

#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <mutex>

namespace polygrader {

bool ToolchainProbe::is_available(const LanguageAdapter& adapter) {
    std::scoped_lock lock{mutex_};

    LanguageKind kind = adapter.get_kind();

    if (auto iter = cache_.find(kind); iter != cache_.end()) {
        return iter->second;
    }

    bool available = adapter.probe_toolchain();

    if (available) {
        LOG_DEBUG("{} toolchain is available", traits_of(kind).display_name);
    } else {
        LOG_ERROR("{} toolchain not found ('{} {}' failed)", traits_of(kind).display_name,
                  traits_of(kind).probe_command[0], traits_of(kind).probe_command[1]);
    }

    cache_.emplace(kind, available);

    return available;
}

} // namespace polygrader
