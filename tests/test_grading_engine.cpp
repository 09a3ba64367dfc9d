#include "catch2_custom.hpp"

#include "config/assignment_config.hpp"
#include "grader/grading_engine.hpp"
#include "grader/grading_strategy.hpp"
#include "scripted_adapter.hpp"
#include "test_helpers.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/language.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using Catch::Matchers::ContainsSubstring;
using polygrader::AssignmentConfig;
using polygrader::GradeStatus;
using polygrader::GradingEngine;
using polygrader::GradingStrategy;
using polygrader::LanguageKind;
using polygrader::RunOutcome;
using polygrader::StudentInfo;
using polygrader::Submission;

namespace {

/// An assignment with two tests, whose harnesses contain exactly what a correct program prints
///
/// input/LinkedList/expectedoutput{,1,2}.txt
/// input/LinkedList/{CPP,JAVA}/TestCorrectness{,1,2}.{cpp,java}
/// submissions/jsmith/{LinkedList.h, LinkedList.java}
struct EngineFixture
{
    EngineFixture() {
        config.name = "LinkedList";
        config.required_files = {"LinkedList"};

        write_file(assets / "expectedoutput1.txt", "one\n");
        write_file(assets / "expectedoutput2.txt", "two\n");
        write_file(assets / "expectedoutput.txt", "one\ntwo\n");

        for (const auto* dir_ext : {"CPP/TestCorrectness%.cpp", "JAVA/TestCorrectness%.java"}) {
            std::string pattern = dir_ext;
            auto harness = [&](const std::string& index) {
                std::string name = pattern;
                name.replace(name.find('%'), 1, index);
                return assets / name;
            };

            write_file(harness("1"), "one\n");
            write_file(harness("2"), "two\n");
            write_file(harness(""), "one\ntwo\n");
        }

        write_file(extraction / "LinkedList.h", "");
        write_file(extraction / "LinkedList.java", "");
    }

    GradingEngine make_engine(GradingEngine::AdapterMap adapters) const {
        return make_engine(std::move(adapters), GradingStrategy::correctness(assets));
    }

    GradingEngine make_engine(GradingEngine::AdapterMap adapters, GradingStrategy strategy) const {
        return GradingEngine{config, std::move(strategy), assets, test_names, std::move(adapters), {}};
    }

    Submission make_submission(std::set<LanguageKind> languages) const {
        return Submission{.username = "jsmith",
                          .archive_path = dir / "submissions/jsmith_1.zip",
                          .extraction_path = extraction,
                          .languages = std::move(languages)};
    }

    TempDir dir;
    AssignmentConfig config;
    fs::path assets = dir / "input/LinkedList";
    fs::path extraction = dir / "submissions/jsmith";
    std::vector<std::string> test_names = {"Construction", "Insertion"};
    StudentInfo student{.first_name = "John", .last_name = "Smith", .display_name = "Smith, John"};
};

std::shared_ptr<ScriptedAdapter> make_adapter(LanguageKind kind, ScriptedAdapter::Behavior behavior,
                                              bool installed = true) {
    return std::make_shared<ScriptedAdapter>(kind, std::move(behavior), installed);
}

} // namespace

TEST_CASE_METHOD(EngineFixture, "Students without a submission are not submitted") {
    auto engine = make_engine({});

    auto result = engine.grade(student, std::nullopt);

    REQUIRE(result.status == GradeStatus::NotSubmitted);
    REQUIRE(result.tests.empty());
    REQUIRE(result.diagnostic == "No submission found");

    auto empty = engine.grade(student, make_submission({}));

    REQUIRE(empty.status == GradeStatus::NotSubmitted);
    REQUIRE(empty.diagnostic == "No recognized source files in submission");
}

TEST_CASE_METHOD(EngineFixture, "Grade a single-language submission") {
    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo);
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.language == LanguageKind::Native);
    REQUIRE(result.attempted_languages == std::vector{LanguageKind::Native});

    REQUIRE(result.tests.size() == 2);
    REQUIRE(result.tests[0].name == "Construction");
    REQUIRE(result.tests[0].passed);
    REQUIRE(result.tests[1].passed);
    REQUIRE(result.all_passed());
    REQUIRE(result.full_output_passed);
    REQUIRE_FALSE(result.full_runtime.has_value());

    // One run per test, plus the combined run
    REQUIRE(native->get_calls() == 3);

    REQUIRE_THAT(result.grading_log, ContainsSubstring("Found LinkedList.h"));
    REQUIRE_THAT(result.grading_log, ContainsSubstring("Test 1: PASSED"));
    REQUIRE_THAT(result.grading_log, ContainsSubstring("Full output: PASSED"));

    // Sandboxes live inside the extraction tree
    REQUIRE(fs::exists(extraction / "temp_test/cpp/test_1/TestCorrectness.cpp"));
    REQUIRE(fs::exists(extraction / "temp_test/cpp/full_test/LinkedList.h"));
}

TEST_CASE_METHOD(EngineFixture, "Wrong output fails only the affected test") {
    auto native = make_adapter(LanguageKind::Native, [](const std::string& harness) {
        return ScriptedAdapter::echo(harness == "two\n" ? "too\n" : harness);
    });
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.tests[0].passed);
    REQUIRE_FALSE(result.tests[1].passed);
    REQUIRE(result.tests[1].output == "too\n");
    REQUIRE_THAT(result.tests[1].diagnostic, ContainsSubstring("Output does not match expected output"));
    REQUIRE(result.num_tests_passed() == 1);
}

TEST_CASE_METHOD(EngineFixture, "Compile errors fail every test") {
    auto native = make_adapter(LanguageKind::Native,
                               ScriptedAdapter::always(RunOutcome::Status::CompileError,
                                                       "FAILED - Compilation Error\nLinkedList.h:3: error"));
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.num_tests_passed() == 0);
    REQUIRE(result.tests[0].diagnostic == "FAILED - Compilation Error");
    REQUIRE_THAT(result.tests[0].output, ContainsSubstring("LinkedList.h:3: error"));
    REQUIRE_FALSE(result.full_output_passed);

    // Compile errors are not retried
    REQUIRE(native->get_calls() == 3);
}

TEST_CASE_METHOD(EngineFixture, "Timeouts are retried up to the attempt limit") {
    auto native = make_adapter(LanguageKind::Native, ScriptedAdapter::always(RunOutcome::Status::TimedOut, "TIMEOUT"));
    test_names = {"Construction"};
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.tests.size() == 1);
    REQUIRE(result.tests[0].diagnostic == "FAILED - TIMEOUT");

    // Three attempts for the test, three for the combined run
    REQUIRE(native->get_calls() == 2 * AssignmentConfig::DEFAULT_MAX_ATTEMPTS);
}

TEST_CASE_METHOD(EngineFixture, "A timeout followed by a good run passes") {
    int attempt = 0;
    auto native = make_adapter(LanguageKind::Native, [&attempt](const std::string& harness) {
        if (++attempt == 1) {
            return RunOutcome::make(RunOutcome::Status::TimedOut, "TIMEOUT");
        }
        return ScriptedAdapter::echo(harness);
    });
    test_names = {"Construction"};
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.tests[0].passed);
    REQUIRE(native->get_calls() == 3);
}

TEST_CASE_METHOD(EngineFixture, "Missing required files stop grading") {
    config.required_files = {"LinkedList", "Node"};
    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo);
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Failed);
    REQUIRE(result.tests.empty());
    REQUIRE(result.diagnostic == "Missing required implementation files: Node.h");
    REQUIRE_THAT(result.grading_log, ContainsSubstring("Cannot proceed with grading without these files."));
    REQUIRE(native->get_calls() == 0);
    REQUIRE_FALSE(fs::exists(extraction / "temp_test"));
}

TEST_CASE_METHOD(EngineFixture, "A missing harness fails only its own test") {
    fs::remove(assets / "CPP/TestCorrectness2.cpp");
    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo);
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.tests[0].passed);
    REQUIRE_FALSE(result.tests[1].passed);
    REQUIRE_THAT(result.tests[1].diagnostic, ContainsSubstring("TestCorrectness2.cpp"));
    REQUIRE(native->get_calls() == 2);
}

TEST_CASE_METHOD(EngineFixture, "A missing toolchain is its own status") {
    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo, /*installed=*/false);
    auto engine = make_engine({{LanguageKind::Native, native}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::CompilerMissing);
    REQUIRE(result.diagnostic == "C++ toolchain is not installed");
    REQUIRE(native->get_calls() == 0);
}

TEST_CASE_METHOD(EngineFixture, "Fall back to the next language when the first passes nothing") {
    auto native = make_adapter(LanguageKind::Native,
                               ScriptedAdapter::always(RunOutcome::Status::CompileError, "FAILED - Compilation Error\n"));
    auto java = make_adapter(LanguageKind::Bytecode, [](const std::string& harness) {
        // Only the second test produces the right output
        return ScriptedAdapter::echo(harness == "two\n" ? harness : "wrong\n");
    });
    auto engine = make_engine({{LanguageKind::Native, native}, {LanguageKind::Bytecode, java}});

    auto result = engine.grade(student, make_submission({LanguageKind::Bytecode, LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.language == LanguageKind::Bytecode);
    REQUIRE(result.attempted_languages == std::vector{LanguageKind::Native, LanguageKind::Bytecode});
    REQUIRE_FALSE(result.tests[0].passed);
    REQUIRE(result.tests[1].passed);

    REQUIRE_THAT(result.grading_log, ContainsSubstring("Grading C++ submission for Smith, John"));
    REQUIRE_THAT(result.grading_log, ContainsSubstring("Successfully graded Smith, John using Java files."));
}

TEST_CASE_METHOD(EngineFixture, "The first passing language wins") {
    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo);
    auto java = make_adapter(LanguageKind::Bytecode, &ScriptedAdapter::echo);
    auto engine = make_engine({{LanguageKind::Native, native}, {LanguageKind::Bytecode, java}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native, LanguageKind::Bytecode}));

    REQUIRE(result.language == LanguageKind::Native);
    REQUIRE(result.attempted_languages == std::vector{LanguageKind::Native});
    REQUIRE(java->get_calls() == 0);
}

TEST_CASE_METHOD(EngineFixture, "When every language fails, all of their output is kept") {
    auto native = make_adapter(LanguageKind::Native,
                               ScriptedAdapter::always(RunOutcome::Status::CompileError, "native broke"));
    auto java = make_adapter(LanguageKind::Bytecode,
                             ScriptedAdapter::always(RunOutcome::Status::RuntimeError, "java broke"));
    auto engine = make_engine({{LanguageKind::Native, native}, {LanguageKind::Bytecode, java}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native, LanguageKind::Bytecode}));

    REQUIRE(result.status == GradeStatus::Failed);
    REQUIRE_FALSE(result.language.has_value());
    REQUIRE(result.diagnostic == "All file types failed for Smith, John.");

    REQUIRE(result.tests.size() == 2);
    REQUIRE(result.tests[0].output == "C++:\nnative broke\nJava:\njava broke\n");
    REQUIRE(result.tests[1].diagnostic == "FAILED - No submitted language passed any test");
    REQUIRE(result.full_output == "C++:\nnative broke\nJava:\njava broke\n");
}

TEST_CASE_METHOD(EngineFixture, "Missing toolchains for every language") {
    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo, false);
    auto java = make_adapter(LanguageKind::Bytecode, &ScriptedAdapter::echo, false);
    auto engine = make_engine({{LanguageKind::Native, native}, {LanguageKind::Bytecode, java}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native, LanguageKind::Bytecode}));

    REQUIRE(result.status == GradeStatus::CompilerMissing);
}

TEST_CASE_METHOD(EngineFixture, "Infrastructure errors stop the fallback") {
    // No adapter is registered for C++
    auto java = make_adapter(LanguageKind::Bytecode, &ScriptedAdapter::echo);
    auto engine = make_engine({{LanguageKind::Bytecode, java}});

    auto result = engine.grade(student, make_submission({LanguageKind::Native, LanguageKind::Bytecode}));

    REQUIRE(result.status == GradeStatus::Error);
    REQUIRE(result.attempted_languages == std::vector{LanguageKind::Native});
    REQUIRE(java->get_calls() == 0);
}

TEST_CASE_METHOD(EngineFixture, "Timing runs check for the configured strings") {
    config.time_check_strings = {"Finished", "Sorted"};
    write_file(assets / "CPP/TestTime.cpp", "Sorted 100000 items\nFinished\n");

    auto native = make_adapter(LanguageKind::Native, &ScriptedAdapter::echo);
    auto engine = make_engine({{LanguageKind::Native, native}}, GradingStrategy::timing(config));

    auto result = engine.grade(student, make_submission({LanguageKind::Native}));

    REQUIRE(result.status == GradeStatus::Tested);
    REQUIRE(result.tests.empty());
    REQUIRE(result.full_output_passed);
    REQUIRE(result.full_runtime.has_value());
    REQUIRE(native->get_calls() == 1);
    REQUIRE_THAT(result.grading_log, ContainsSubstring("Runtime: "));
    REQUIRE_THAT(result.grading_log, ContainsSubstring("Time Test passed!"));

    SECTION("Missing strings fail the run") {
        config.time_check_strings = {"Finished", "Verified"};
        auto strict = make_engine({{LanguageKind::Native, native}}, GradingStrategy::timing(config));

        auto failed = strict.grade(student, make_submission({LanguageKind::Native}));

        REQUIRE_FALSE(failed.full_output_passed);
        REQUIRE_THAT(failed.grading_log, ContainsSubstring("Output is missing: Verified"));
        REQUIRE_THAT(failed.grading_log, ContainsSubstring("Time Test failed!"));
    }
}
