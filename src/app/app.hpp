#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <polygrader/common/class_traits.hpp>
#include <polygrader/logging.hpp>

#include <optional>
#include <utility>

namespace polygrader {

/// Base of the runnable modes. Owns the parsed options and turns
/// exceptions escaping a mode into a failing exit code.
class App : NonCopyable
{
public:
    /// Process exit codes
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_SETUP_FAILED = 1;
    static constexpr int EXIT_HALTED = 2;

    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        if (!res) {
            LOG_ERROR("Run aborted by an unhandled exception");
        }

        return res.value_or(EXIT_SETUP_FAILED);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace polygrader
