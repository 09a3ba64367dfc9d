#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>

namespace polygrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,            ///< Program / operation surpassed maximum timeout (generally specified)
    SyscallFailure,      ///< A Linux syscall failed
    ExecFailure,         ///< A child process could not be started (e.g., the executable was not found)
    OutputLimitExceeded, ///< A child process wrote more output than it is allowed to
    BadState,            ///< An operation was attempted on an object in an unsuitable state
    UnknownError,        ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::ErrorKind, TimedOut, SyscallFailure, ExecFailure, OutputLimitExceeded, BadState, UnknownError,
                   MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::polygrader::ErrorKind;                                                                        \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
