#include "catch2_custom.hpp"

#include "config/assignment_config.hpp"
#include "prep/assignment_preparer.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using polygrader::AssignmentConfig;
using polygrader::AssignmentPreparer;

TEST_CASE("Split expected output at test headers") {
    const std::string content = "Welcome\nTest 1: Construction\nsize 0\nTest 2: Insertion\nsize 1\nsize 2\n";

    auto sections = AssignmentPreparer::split_expected_output(content, {"Test 1: Construction", "Test 2: Insertion"});

    REQUIRE(sections.size() == 2);
    REQUIRE(sections[0].test_index == 1);
    REQUIRE(sections[0].text == "Test 1: Construction\nsize 0\n");
    REQUIRE(sections[1].test_index == 2);
    REQUIRE(sections[1].text == "Test 2: Insertion\nsize 1\nsize 2\n");
}

TEST_CASE("Sections follow the order headers appear in") {
    const std::string content = "B header\nbbb\nA header\naaa\n";

    auto sections = AssignmentPreparer::split_expected_output(content, {"A header", "B header"});

    REQUIRE(sections.size() == 2);
    REQUIRE(sections[0].test_index == 2);
    REQUIRE(sections[0].text == "B header\nbbb\n");
    REQUIRE(sections[1].test_index == 1);
    REQUIRE(sections[1].text == "A header\naaa\n");
}

TEST_CASE("Headers that never appear are skipped") {
    auto sections = AssignmentPreparer::split_expected_output("One\n1\nThree\n3\n", {"One", "Two", "Three"});

    REQUIRE(sections.size() == 2);
    REQUIRE(sections[0].test_index == 1);
    REQUIRE(sections[0].text == "One\n1\n");
    REQUIRE(sections[1].test_index == 3);
}

TEST_CASE("Prepare an assignment's input directory") {
    TempDir dir;

    AssignmentConfig config;
    config.name = "LinkedList";
    config.required_files = {"LinkedList"};
    config.test_headers = {"Test 1", "Test 2"};

    write_file(dir / "ExpectedOutput.txt", "Test 1\nok\nTest 2\nfine\n");
    write_file(dir / "CPP/TestCorrectness.cpp", "// harness");
    write_file(dir / "JAVA/Readme.txt", "no harness here");

    AssignmentPreparer preparer{config, dir.path()};

    REQUIRE(preparer.prepare(2));

    REQUIRE(read_file(dir / "expectedoutput1.txt") == "Test 1\nok\n");
    REQUIRE(read_file(dir / "expectedoutput2.txt") == "Test 2\nfine\n");
    REQUIRE(read_file(dir / "expectedoutput.txt") == "Test 1\nok\nTest 2\nfine\n");

    REQUIRE(read_file(dir / "CPP/TestCorrectness1.cpp") == "// harness");
    REQUIRE(read_file(dir / "CPP/TestCorrectness2.cpp") == "// harness");
    REQUIRE_FALSE(fs::exists(dir / "CPP/TestCorrectness3.cpp"));
    REQUIRE_FALSE(fs::exists(dir / "JAVA/TestCorrectness1.java"));
}

TEST_CASE("Preparing without an expected output file fails") {
    TempDir dir;

    AssignmentConfig config;
    config.name = "LinkedList";
    config.required_files = {"LinkedList"};

    AssignmentPreparer preparer{config, dir.path()};

    REQUIRE_FALSE(preparer.write_expected_outputs());
}
