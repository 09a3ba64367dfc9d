#include "catch2_custom.hpp"

#include "grader/language_detector.hpp"
#include "test_helpers.hpp"

#include <polygrader/language.hpp>

#include <set>

using polygrader::LanguageKind;

TEST_CASE("Detect languages by source extension") {
    TempDir dir;

    SECTION("A single language") {
        write_file(dir / "LinkedList.h", "");
        write_file(dir / "README.txt", "");

        auto res = polygrader::detect_languages(dir.path());
        REQUIRE(res);
        REQUIRE(*res == std::set{LanguageKind::Native});
    }

    SECTION("Several languages, in nested directories") {
        write_file(dir / "cpp/LinkedList.h", "");
        write_file(dir / "java/src/LinkedList.java", "");
        write_file(dir / "LinkedList.cs", "");

        auto res = polygrader::detect_languages(dir.path());
        REQUIRE(res);
        REQUIRE(*res == std::set{LanguageKind::Native, LanguageKind::Bytecode, LanguageKind::ManagedIL});
    }

    SECTION("Sandbox copies are not the student's files") {
        write_file(dir / "LinkedList.java", "");
        write_file(dir / "temp_test/cpp/test_1/LinkedList.h", "");

        auto res = polygrader::detect_languages(dir.path());
        REQUIRE(res);
        REQUIRE(*res == std::set{LanguageKind::Bytecode});
    }

    SECTION("Nothing recognizable") {
        write_file(dir / "notes.docx", "");
        write_file(dir / "main.cpp", "");

        auto res = polygrader::detect_languages(dir.path());
        REQUIRE(res);
        REQUIRE(res->empty());
    }
}

TEST_CASE("A missing extraction tree has no languages") {
    TempDir dir;

    auto res = polygrader::detect_languages(dir / "never_extracted");

    REQUIRE(res);
    REQUIRE(res->empty());
}

TEST_CASE("Language table lookups") {
    REQUIRE(polygrader::language_from_source_ext(".h") == LanguageKind::Native);
    REQUIRE(polygrader::language_from_source_ext(".java") == LanguageKind::Bytecode);
    REQUIRE(polygrader::language_from_source_ext(".cs") == LanguageKind::ManagedIL);
    REQUIRE_FALSE(polygrader::language_from_source_ext(".cpp").has_value());

    REQUIRE(polygrader::traits_of(LanguageKind::ManagedIL).display_name == "C#");
}
