#include "catch2_custom.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/expected.hpp>

#include <string>
#include <string_view>

using namespace std::literals;
using polygrader::ErrorKind;
using polygrader::Expected;
using polygrader::Result;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Result<int> half_of_even(int num) {
    if (num % 2 != 0) {
        return ErrorKind::BadState;
    }

    return num / 2;
}

Result<int> quarter_of(int num) {
    int half = TRY(half_of_even(num));

    return TRY(half_of_even(half));
}

Result<void> require_positive(int num) {
    if (num <= 0) {
        return ErrorKind::UnknownError;
    }

    return {};
}

Result<int> checked_quarter(int num) {
    TRY(require_positive(num));

    return TRYE(quarter_of(num), TimedOut);
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
}

TEST_CASE("Explicitly tagged errors with ambiguous conversions") {
    using Ambiguous = Expected<std::string, std::string>;

    Ambiguous value{"value"s};
    Ambiguous error{polygrader::UnexpectedT{}, "error"s};

    REQUIRE(value.has_value());
    REQUIRE(*value == "value");

    REQUIRE(error.has_error());
    REQUIRE(error.error() == "error");
}

TEST_CASE("Equality and comparison operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});
    REQUIRE(Et{123} <= Et{456});
    REQUIRE(Et{123} < Et{456});
    REQUIRE(Et{123} >= Et{123});
    REQUIRE(Et{456} > Et{123});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234");

    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != "Exp!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(123.5) == 123);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square) == "no");
}

TEST_CASE("TRY propagates the first error") {
    REQUIRE(quarter_of(12) == 3);
    REQUIRE(quarter_of(7) == ErrorKind::BadState);
    REQUIRE(quarter_of(6) == ErrorKind::BadState);
}

TEST_CASE("TRY works on void results and TRYE substitutes the error") {
    REQUIRE(checked_quarter(8) == 2);
    REQUIRE(checked_quarter(-4) == ErrorKind::UnknownError);
    REQUIRE(checked_quarter(10) == ErrorKind::TimedOut);
}
