#pragma once

#include <polygrader/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <compare>
#include <concepts>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace polygrader {

struct UnexpectedT
{
};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<ExpectedT, Args...>)
        : data_{std::variant<T, E>{std::in_place_index<0>, std::forward<Args>(args)...}} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::variant<T, E>{std::in_place_index<0>, std::forward<Tu>(value)}} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<T, E> && !std::convertible_to<Eu, T>)
        : data_{make_error_data(std::forward<Eu>(error))} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E>)
        : data_{make_error_data(std::forward<Eu>(error))} {}

    constexpr bool has_value() const { return data_.data.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    U& value()
        requires(!std::is_void_v<U>)
    {
        return const_cast<U&>(const_cast<const Expected*>(this)->value());
    }

    template <typename U = T>
    const U& value() const
        requires(!std::is_void_v<U>)
    {
        static_assert(std::same_as<U, T>,
                      "Do not attempt to instantiate Expected<T,E>::value() for any type other than T");
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_.data);
    }

    template <typename U = T>
    void value() const
        requires(std::is_void_v<U>)
    {
        static_assert(std::same_as<U, T>,
                      "Do not attempt to instantiate Expected<T,E>::value() for any type other than T");
        DEBUG_ASSERT(has_value());
    }

    template <typename U = T>
    U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_.data);
    }

    E error() const {
        DEBUG_ASSERT(!has_value());
        return std::get<1>(data_.data);
    }

    template <typename Eu>
    E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_.data);
    }

    template <typename Func>
    Expected<std::invoke_result_t<Func, const T&>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return {UnexpectedT{}, error()};
        }

        return std::invoke(func, value());
    }

private:
    template <typename Td, typename Ed>
    struct ExpectedData
    {
        std::variant<Td, Ed> data;
        constexpr bool operator==(const ExpectedData& rhs) const = default;
        constexpr auto operator<=>(const ExpectedData& rhs) const = default;
    };

    template <typename Ed>
    struct ExpectedData<void, Ed>
    {
        std::variant<std::monostate, Ed> data;
        constexpr bool operator==(const ExpectedData& rhs) const = default;
        constexpr auto operator<=>(const ExpectedData& rhs) const = default;
    };

    template <typename Eu>
    static constexpr ExpectedData<T, E> make_error_data(Eu&& error) {
        if constexpr (std::is_void_v<T>) {
            return {std::variant<std::monostate, E>{std::in_place_index<1>, std::forward<Eu>(error)}};
        } else {
            return {std::variant<T, E>{std::in_place_index<1>, std::forward<Eu>(error)}};
        }
    }

public:
    constexpr auto operator<=>(const Expected& rhs) const = default;

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
    bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        if (!has_value()) {
            return false;
        }

        return value() == rhs;
    }

    template <typename Eu>
    bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        if (has_value()) {
            return false;
        }

        return error() == rhs;
    }

private:
    ExpectedData<T, E> data_;
};

} // namespace polygrader

template <typename T, typename E>
struct fmt::formatter<::polygrader::Expected<T, E>> : ::polygrader::DebugFormatter
{
    auto format(const ::polygrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", format_impl(from));
    }

private:
    std::string format_impl(const ::polygrader::Expected<T, E>& from) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::same_as<T, void>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
