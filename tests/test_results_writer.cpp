#include "catch2_custom.hpp"

#include "config/assignment_config.hpp"
#include "output/results_writer.hpp"
#include "test_helpers.hpp"

#include <polygrader/grading_session.hpp>

#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

using polygrader::AssignmentConfig;
using polygrader::GradeStatus;
using polygrader::ResultsWriter;
using polygrader::StudentResult;
using polygrader::Submission;

namespace {

StudentResult make_result(std::string username, GradeStatus status) {
    return StudentResult{.info = {.first_name = "John", .last_name = "Smith", .display_name = "Smith, John"},
                         .status = status,
                         .submission = Submission{.username = std::move(username),
                                                  .archive_path = "jsmith_1.zip",
                                                  .extraction_path = "jsmith",
                                                  .languages = {}}};
}

} // namespace

TEST_CASE("Write grading logs and combined output per student") {
    TempDir dir;
    AssignmentConfig config;
    ResultsWriter writer{config, dir / "results", dir / "full_output"};

    REQUIRE(writer.prepare());

    auto result = make_result("jsmith", GradeStatus::Tested);
    result.grading_log = "Test 1: PASSED\n";
    result.full_output = "one\ntwo\n";

    REQUIRE(writer.write(result));

    REQUIRE(read_file(dir / "results/jsmith.txt") == "Test 1: PASSED\n");
    REQUIRE(read_file(dir / "full_output/jsmith.txt") == "one\ntwo\n");

    SECTION("A result without a log records its diagnostic") {
        auto failed = make_result("adoe", GradeStatus::Error);
        failed.diagnostic = "Error removing something";

        REQUIRE(writer.write(failed));

        REQUIRE(read_file(dir / "results/adoe.txt") == "Error removing something\n");
        REQUIRE_FALSE(fs::exists(dir / "full_output/adoe.txt"));
    }

    SECTION("Unsubmitted and ignored students have no files") {
        auto not_submitted = make_result("nobody", GradeStatus::NotSubmitted);
        not_submitted.submission.reset();
        REQUIRE(writer.write(not_submitted));

        REQUIRE(writer.write(make_result("instructor", GradeStatus::Ignored)));

        REQUIRE_FALSE(fs::exists(dir / "results/instructor.txt"));
        REQUIRE(std::distance(fs::directory_iterator{dir / "results"}, fs::directory_iterator{}) == 1);
    }
}

TEST_CASE("Preparing removes old results except those of ignored users") {
    TempDir dir;
    AssignmentConfig config;
    config.ignore_names = {"instructor"};

    write_file(dir / "results/jsmith.txt", "old");
    write_file(dir / "results/instructor.txt", "reference");
    write_file(dir / "full_output/jsmith.txt", "old");

    ResultsWriter writer{config, dir / "results", dir / "full_output"};
    REQUIRE(writer.prepare());

    REQUIRE_FALSE(fs::exists(dir / "results/jsmith.txt"));
    REQUIRE_FALSE(fs::exists(dir / "full_output/jsmith.txt"));
    REQUIRE(read_file(dir / "results/instructor.txt") == "reference");
}
