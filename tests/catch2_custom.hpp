#pragma once

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <string_view>
#include <type_traits>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Hacky way of overriding the stringification behavior for types Catch2 explicitly specializes
// Multi-line program output is far easier to read with its newlines visible
namespace Catch::Detail {

inline std::string escape_for_display(std::string_view str) {
    std::string result = "\"";

    for (char chr : str) {
        switch (chr) {
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '"':
            result += "\\\"";
            break;
        default:
            result += chr;
        }
    }

    return result + "\"";
}

inline std::string stringify(std::string_view e) {
    return escape_for_display(e);
}

inline std::string stringify(const std::string& e) {
    return escape_for_display(e);
}

inline std::string stringify(const char* e) {
    return escape_for_display(e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_all.hpp>         // IWYU pragma: export
#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

// Enums and other types with an fmt::formatter (e.g. those declared with FMT_SERIALIZE_ENUM)
template <typename T>
    requires(fmt::is_formattable<T>::value && std::is_enum_v<T> && !Catch::Detail::IsStreamInsertable<T>::value)
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", t); }
};

} // namespace Catch
