#pragma once

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace polygrader {

/// Messages of `exception` followed by any exceptions nested inside it, outermost first
inline std::vector<std::string> exception_chain(const std::exception& exception) {
    std::vector<std::string> chain{exception.what()};

    try {
        std::rethrow_if_nested(exception);
    } catch (const std::exception& nested) {
        auto rest = exception_chain(nested);
        chain.insert(chain.end(), rest.begin(), rest.end());
    } catch (...) {
        chain.emplace_back("<nested exception not derived from std::exception>");
    }

    return chain;
}

/// Prints `description` and the current call stack to `stream`
inline void print_trace(std::FILE* stream, const std::vector<std::string>& description) {
    boost::stacktrace::stacktrace trace;

    std::string headline = fmt::format("Unhandled exception: {}", description.front());
    fmt::print(stream, "{}\n", headline);
    for (std::size_t i = 1; i < description.size(); ++i) {
        fmt::print(stream, "  caused by: {}\n", description[i]);
    }
    fmt::print(stream, "{}\n", std::string(headline.size(), '='));

    std::string stacktrace_str = fmt::to_string(fmt::streamed(trace));
    fmt::print(stream, "Stacktrace:\n{}\n", stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);
}

inline void trace_exception(const std::exception& exception, std::FILE* stream = stderr) {
    print_trace(stream, exception_chain(exception));
}

inline void trace_exception(const char* description, std::FILE* stream = stderr) {
    print_trace(stream, {description});
}

/// Invokes `fn`, returning nullopt after printing a trace if it throws
template <typename Func, typename... Args>
    requires(std::invocable<Func, Args...>)
std::optional<std::invoke_result_t<Func, Args...>> wrap_throwable_fn(Func&& fn, Args&&... args) {
    try {
        return std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        trace_exception(ex);
    } catch (...) {
        trace_exception("<unknown - not derived from std::exception>");
    }

    return std::nullopt;
}

} // namespace polygrader
