#include "catch2_custom.hpp"

#include "test_helpers.hpp"
#include "user/file_searcher.hpp"

#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <filesystem>
#include <string>
#include <vector>

using Catch::Matchers::UnorderedRangeEquals;
using polygrader::FileSearcher;

namespace {

const auto map_to_basename =
    ranges::views::transform([](const std::filesystem::path& path) { return path.stem().string(); }) |
    ranges::to<std::vector>();

/// a.txt b.txt c.txt x.log
/// nested/d.txt
/// nested/deeper/e.txt
/// temp_test/f.txt
void make_tree(const TempDir& dir) {
    for (const auto* name : {"a.txt", "b.txt", "c.txt", "x.log", "nested/d.txt", "nested/deeper/e.txt",
                             "temp_test/f.txt"}) {
        write_file(dir / name, name);
    }
}

} // namespace

TEST_CASE("Find txt files") {
    TempDir dir;
    make_tree(dir);

    FileSearcher searcher{".*\\.txt"};
    searcher.exclude_directories({"temp_test"});

    auto search_res_first = searcher.search(dir.path());
    REQUIRE(search_res_first);
    REQUIRE_THAT((*search_res_first | map_to_basename), UnorderedRangeEquals(std::vector<std::string>{"a", "b", "c"}));

    auto search_res_second = searcher.search_recursive(dir.path(), 1);
    REQUIRE(search_res_second);
    REQUIRE_THAT((*search_res_second | map_to_basename),
                 UnorderedRangeEquals(std::vector<std::string>{"a", "b", "c", "d"}));

    auto search_res_recursive = searcher.search_recursive(dir.path());
    REQUIRE(search_res_recursive);
    REQUIRE_THAT((*search_res_recursive | map_to_basename),
                 UnorderedRangeEquals(std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST_CASE("Shallower matches come first") {
    TempDir dir;
    write_file(dir / "z/deep/Foo.h", "");
    write_file(dir / "Foo.h", "");
    write_file(dir / "a/Foo.h", "");

    auto res = FileSearcher{"Foo\\.h"}.search_recursive(dir.path());

    REQUIRE(res);
    REQUIRE(res->size() == 3);
    REQUIRE(res->at(0) == dir / "Foo.h");
    REQUIRE(res->at(1) == dir / "a/Foo.h");
    REQUIRE(res->at(2) == dir / "z/deep/Foo.h");
}

TEST_CASE("Find txt files with variable substitution") {
    TempDir dir;
    make_tree(dir);

    FileSearcher abc_searcher{"`name`\\.txt", {{"name", "[abc]"}}};
    FileSearcher de_searcher{"`name`\\.txt", {{"name", "[de]"}}};

    auto search_res_abc = abc_searcher.search_recursive(dir.path());
    REQUIRE(search_res_abc);
    REQUIRE_THAT((*search_res_abc | map_to_basename), UnorderedRangeEquals(std::vector<std::string>{"a", "b", "c"}));

    auto search_res_de = de_searcher.search_recursive(dir.path());
    REQUIRE(search_res_de);
    REQUIRE_THAT((*search_res_de | map_to_basename), UnorderedRangeEquals(std::vector<std::string>{"d", "e"}));

    REQUIRE(de_searcher.set_arg("name", "x") == "[de]");
    REQUIRE(de_searcher.get_expr() == "x\\.txt");
}

TEST_CASE("Case insensitive search") {
    TempDir dir;
    write_file(dir / "JohnSmith_1234.ZIP", "");

    FileSearcher sensitive{"johnsmith.*\\.zip"};
    FileSearcher insensitive{"johnsmith.*\\.zip", {}, /*case_insensitive=*/true};

    REQUIRE(sensitive.search(dir.path())->empty());
    REQUIRE(insensitive.search(dir.path())->size() == 1);
}

TEST_CASE("Escape regex metacharacters") {
    REQUIRE(FileSearcher::escape("a.b") == "a\\.b");
    REQUIRE(FileSearcher::escape("C++") == "C\\+\\+");
    REQUIRE(FileSearcher::escape("plain") == "plain");
}

TEST_CASE("Searching a missing directory is an error") {
    TempDir dir;

    REQUIRE_FALSE(FileSearcher{".*"}.search(dir / "does_not_exist"));
}
