#include "catch2_custom.hpp"

#include "grader/retry.hpp"

#include <vector>

TEST_CASE("Retry until the result is acceptable") {
    int calls = 0;
    std::vector<int> retried_attempts;

    int result = polygrader::retry([&calls] { return ++calls; }, 5, [](int res) { return res < 3; },
                                   [&](int attempt, int /*res*/) { retried_attempts.push_back(attempt); });

    REQUIRE(result == 3);
    REQUIRE(calls == 3);
    REQUIRE(retried_attempts == std::vector<int>{1, 2});
}

TEST_CASE("Stop after the maximum number of attempts") {
    int calls = 0;

    bool result = polygrader::retry(
        [&calls] {
            ++calls;
            return false;
        },
        3, [](bool res) { return !res; });

    REQUIRE_FALSE(result);
    REQUIRE(calls == 3);
}

TEST_CASE("A single attempt is never retried") {
    int calls = 0;

    polygrader::retry([&calls] { return ++calls; }, 1, [](int /*res*/) { return true; });

    REQUIRE(calls == 1);
}
