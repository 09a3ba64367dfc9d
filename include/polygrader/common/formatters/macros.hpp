#pragma once

#include <polygrader/common/formatters/debug.hpp>

#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/size.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>
#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

namespace polygrader::detail {

template <typename Enum, std::size_t N>
constexpr std::string_view enumerator_name(Enum from, const std::array<std::pair<std::string_view, Enum>, N>& names) {
    for (const auto& [name, value] : names) {
        if (value == from) {
            return name;
        }
    }

    return {};
}

template <typename Enum, std::size_t N>
auto format_enumerator(Enum from, const std::array<std::pair<std::string_view, Enum>, N>& names,
                       fmt::format_context& ctx) {
    std::string_view name = enumerator_name(from, names);

    if (name.empty()) {
        return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
    }

    return fmt::format_to(ctx.out(), "{}", name);
}

} // namespace polygrader::detail

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, i, ident)                                                          \
    BOOST_PP_COMMA_IF(i) std::pair<std::string_view, enum_name> { BOOST_PP_STRINGIZE(ident), enum_name::ident }

/// Defines an fmt::formatter for an enum, formatting each enumerator as its identifier
/// Must be used at global scope with a fully qualified enum name
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::polygrader::DebugFormatter                                                    \
    {                                                                                                                  \
        static constexpr std::array ENUMERATORS = {                                                                    \
            BOOST_PP_SEQ_FOR_EACH_I(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name,                                          \
                                    BOOST_PP_TUPLE_TO_SEQ(BOOST_PP_TUPLE_SIZE((__VA_ARGS__)), (__VA_ARGS__)))};        \
                                                                                                                       \
        auto format(const enum_name& from, fmt::format_context& ctx) const {                                           \
            return ::polygrader::detail::format_enumerator(from, ENUMERATORS, ctx);                                    \
        }                                                                                                              \
    }
