#include "grader/grading_engine.hpp"

#include "adapters/bytecode_adapter.hpp"
#include "adapters/language_adapter.hpp"
#include "adapters/managed_il_adapter.hpp"
#include "adapters/native_adapter.hpp"
#include "config/assignment_config.hpp"
#include "grader/grading_strategy.hpp"
#include "grader/output_comparator.hpp"
#include "grader/retry.hpp"
#include "grader/sandbox_builder.hpp"
#include "grader/toolchain_probe.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

std::string_view failure_summary(RunOutcome::Status status) {
    switch (status) {
    case RunOutcome::Status::CompileError:
        return "Compilation Error";
    case RunOutcome::Status::RuntimeError:
        return "Runtime error";
    case RunOutcome::Status::TimedOut:
        return LanguageAdapter::TIMEOUT_MESSAGE;
    case RunOutcome::Status::CompilerMissing:
        return "Toolchain not installed";
    case RunOutcome::Status::Error:
        return "Internal error";
    case RunOutcome::Status::Success:
        break;
    }

    UNREACHABLE(status);
}

template <typename... Args>
void log_line(std::string& log, fmt::format_string<Args...> fmt_str, Args&&... args) {
    fmt::format_to(std::back_inserter(log), fmt_str, std::forward<Args>(args)...);
    log += '\n';
}

} // namespace

bool LanguageGrade::passes(bool has_indexed_tests) const {
    if (outcome != Outcome::Graded) {
        return false;
    }

    if (has_indexed_tests) {
        return ranges::any_of(tests, &TestResult::passed);
    }

    return full_output_passed;
}

GradingEngine::GradingEngine(const AssignmentConfig& config, GradingStrategy strategy,
                             std::filesystem::path assets_root, std::vector<std::string> test_names,
                             AdapterMap adapters, SandboxBuilder::Options sandbox_options,
                             std::shared_ptr<ToolchainProbe> probe)
    : config_{&config}
    , strategy_{std::move(strategy)}
    , assets_root_{std::move(assets_root)}
    , test_names_{std::move(test_names)}
    , adapters_{std::move(adapters)}
    , sandbox_builder_{config, assets_root_, strategy_.layout, sandbox_options}
    , probe_{std::move(probe)} {
    ASSERT(probe_ != nullptr);
}

GradingEngine::AdapterMap GradingEngine::default_adapters(std::chrono::milliseconds timeout, std::size_t output_limit) {
    return {
        {LanguageKind::Native, std::make_shared<NativeAdapter>(timeout, output_limit)},
        {LanguageKind::Bytecode, std::make_shared<BytecodeAdapter>(timeout, output_limit)},
        {LanguageKind::ManagedIL, std::make_shared<ManagedIlAdapter>(timeout, output_limit)},
    };
}

StudentResult GradingEngine::grade(const StudentInfo& info, const std::optional<Submission>& submission) const {
    StudentResult result{.info = info, .submission = submission};

    if (!submission || submission->languages.empty()) {
        LOG_DEBUG("{}: not submitted ({})", info.display_name,
                  submission ? "no recognized source files" : "no matching archive");
        result.status = GradeStatus::NotSubmitted;
        result.diagnostic = submission ? "No recognized source files in submission" : "No submission found";
        return result;
    }

    std::vector<LanguageKind> languages;
    for (LanguageKind kind : ALL_LANGUAGES) {
        if (submission->languages.contains(kind)) {
            languages.push_back(kind);
        }
    }

    if (languages.size() == 1) {
        LOG_DEBUG("{}: single language ({})", info.display_name, languages.front());
        result.attempted_languages.push_back(languages.front());
        commit(result, grade_language(info, *submission, languages.front()));
        return result;
    }

    LOG_DEBUG("{}: multiple languages {}; trying each in order", info.display_name, languages);

    const bool has_indexed_tests = strategy_.layout.indexed_tests;
    std::vector<LanguageGrade> failed;

    for (LanguageKind kind : languages) {
        result.attempted_languages.push_back(kind);

        LanguageGrade grade = grade_language(info, *submission, kind);

        if (grade.outcome == LanguageGrade::Outcome::Error) {
            LOG_DEBUG("{}: {} grading hit an infrastructural error; stopping", info.display_name, kind);
            commit(result, std::move(grade));
            return result;
        }

        if (grade.passes(has_indexed_tests)) {
            LOG_DEBUG("{}: committing {} results", info.display_name, kind);
            log_line(grade.log, "Successfully graded {} using {} files.", info.display_name,
                     traits_of(kind).display_name);

            std::string previous_log = std::move(result.grading_log);
            commit(result, std::move(grade));
            result.grading_log.insert(0, previous_log);
            return result;
        }

        LOG_DEBUG("{}: {} yielded no passing tests ({})", info.display_name, kind, grade.outcome);
        result.grading_log += grade.log;
        result.grading_log += '\n';
        failed.push_back(std::move(grade));
    }

    commit_all_failed(result, failed);
    return result;
}

LanguageGrade GradingEngine::grade_language(const StudentInfo& info, const Submission& submission,
                                            LanguageKind language) const {
    const auto& traits = traits_of(language);
    LanguageGrade grade{.language = language};

    log_line(grade.log, "Grading {} submission for {}", traits.display_name, info.display_name);

    auto adapter_iter = adapters_.find(language);
    if (adapter_iter == adapters_.end() || adapter_iter->second == nullptr) {
        grade.outcome = LanguageGrade::Outcome::Error;
        grade.diagnostic = fmt::format("No adapter available for {}", traits.display_name);
        LOG_ERROR("{}", grade.diagnostic);
        log_line(grade.log, "{}", grade.diagnostic);
        return grade;
    }

    const LanguageAdapter& adapter = *adapter_iter->second;

    if (!probe_->is_available(adapter)) {
        grade.outcome = LanguageGrade::Outcome::CompilerMissing;
        grade.diagnostic = fmt::format("{} toolchain is not installed", traits.display_name);
        log_line(grade.log, "{}", grade.diagnostic);
        return grade;
    }

    auto required = sandbox_builder_.find_required_files(submission.extraction_path, language);
    if (!required) {
        grade.outcome = LanguageGrade::Outcome::Error;
        grade.diagnostic = required.error();
        LOG_ERROR("{}: {}", info.display_name, grade.diagnostic);
        log_line(grade.log, "{}", grade.diagnostic);
        return grade;
    }

    for (const auto& [name, path] : required->found) {
        log_line(grade.log, "Found {}", name);
    }

    if (!required->complete()) {
        grade.outcome = LanguageGrade::Outcome::MissingFiles;
        grade.diagnostic = fmt::format("Missing required implementation files: {}", fmt::join(required->missing, ", "));
        log_line(grade.log, "{}\nCannot proceed with grading without these files.", grade.diagnostic);
        return grade;
    }

    auto sandboxes = sandbox_builder_.build(submission.extraction_path, language, *required, test_names_.size());
    if (!sandboxes) {
        grade.outcome = LanguageGrade::Outcome::Error;
        grade.diagnostic = sandboxes.error();
        LOG_ERROR("{}: {}", info.display_name, grade.diagnostic);
        log_line(grade.log, "{}", grade.diagnostic);
        return grade;
    }

    for (std::size_t i = 0; i < sandboxes->tests.size(); ++i) {
        const Sandbox& sandbox = sandboxes->tests[i];
        TestResult test{.name = test_names_[i]};

        if (sandbox.is_usable()) {
            RunOutcome outcome = run_with_retries(adapter, sandbox, sandbox.dir.string()).outcome;

            // The probe succeeded, so this means the toolchain vanished mid-run
            if (outcome.status == RunOutcome::Status::CompilerMissing) {
                grade.outcome = LanguageGrade::Outcome::CompilerMissing;
                grade.tests.clear();
                grade.diagnostic = outcome.output;
                log_line(grade.log, "Test {}: FAILED - {}", i + 1, failure_summary(outcome.status));
                return grade;
            }

            test = judge_test(i + 1, std::move(outcome));
        } else {
            test.diagnostic = fmt::format("FAILED - {}", sandbox.problem);
        }

        if (test.passed) {
            log_line(grade.log, "Test {}: PASSED", i + 1);
        } else {
            log_line(grade.log, "Test {}: {}", i + 1, test.diagnostic);
        }

        grade.tests.push_back(std::move(test));
    }

    run_combined(adapter, sandboxes->combined, grade);

    return grade;
}

GradingEngine::TimedRun GradingEngine::run_with_retries(const LanguageAdapter& adapter, const Sandbox& sandbox,
                                                        const std::string& what) const {
    std::chrono::milliseconds attempt_time{};

    auto attempt = [&] {
        const auto start = std::chrono::steady_clock::now();
        RunOutcome outcome = adapter.compile_and_run(sandbox.harness, sandbox.dir);
        attempt_time =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return outcome;
    };

    auto on_retry = [&](int attempt_num, const RunOutcome& /*outcome*/) {
        LOG_WARN("{} timed out (attempt {} of {}); retrying", what, attempt_num, config_->max_attempts);
    };

    RunOutcome outcome = retry(attempt, config_->max_attempts, &RunOutcome::timed_out, on_retry);

    return {.outcome = std::move(outcome), .attempt_time = attempt_time};
}

TestResult GradingEngine::judge_test(std::size_t test_index, RunOutcome outcome) const {
    DEBUG_ASSERT(test_index >= 1 && test_index <= test_names_.size());

    TestResult test{.name = test_names_[test_index - 1], .output = std::move(outcome.output)};

    if (!outcome.succeeded()) {
        test.diagnostic = fmt::format("FAILED - {}", failure_summary(outcome.status));
        return test;
    }

    Comparison comparison = compare_output_to_file(test.output, expected_output_path(assets_root_, test_index));

    test.passed = comparison.matches;
    if (!comparison.matches) {
        test.diagnostic = fmt::format("FAILED - {}", comparison.diagnostic);
    }

    return test;
}

void GradingEngine::run_combined(const LanguageAdapter& adapter, const Sandbox& sandbox, LanguageGrade& grade) const {
    if (!sandbox.is_usable()) {
        grade.full_output = sandbox.problem;
        log_line(grade.log, "Full output: FAILED - {}", sandbox.problem);
        return;
    }

    auto [outcome, attempt_time] = run_with_retries(adapter, sandbox, sandbox.dir.string());

    Comparison verdict{.matches = false, .diagnostic = ""};
    if (outcome.succeeded()) {
        verdict = strategy_.combined_verdict(outcome);
    } else {
        verdict.diagnostic = fmt::format("FAILED - {}", failure_summary(outcome.status));
    }

    grade.full_output_passed = verdict.matches;
    grade.full_output = std::move(outcome.output);

    if (!strategy_.record_runtime) {
        log_line(grade.log, "Full output: {}", verdict.matches ? "PASSED" : "FAILED");
        return;
    }

    grade.full_runtime = attempt_time;

    log_line(grade.log, "\nRuntime: {:.2f} seconds", std::chrono::duration<double>(attempt_time).count());
    if (!verdict.matches) {
        log_line(grade.log, "{}", verdict.diagnostic);
    }
    log_line(grade.log, "Time Test {}!", verdict.matches ? "passed" : "failed");
}

void GradingEngine::commit(StudentResult& result, LanguageGrade grade) const {
    result.language = grade.language;
    result.tests = std::move(grade.tests);
    result.full_output_passed = grade.full_output_passed;
    result.full_output = std::move(grade.full_output);
    result.full_runtime = grade.full_runtime;
    result.diagnostic = std::move(grade.diagnostic);
    result.grading_log = std::move(grade.log);

    switch (grade.outcome) {
    case LanguageGrade::Outcome::Graded:
        result.status = GradeStatus::Tested;
        break;
    case LanguageGrade::Outcome::MissingFiles:
        result.status = GradeStatus::Failed;
        break;
    case LanguageGrade::Outcome::CompilerMissing:
        result.status = GradeStatus::CompilerMissing;
        break;
    case LanguageGrade::Outcome::Error:
        result.status = GradeStatus::Error;
        break;
    }
}

void GradingEngine::commit_all_failed(StudentResult& result, const std::vector<LanguageGrade>& grades) const {
    DEBUG_ASSERT(!grades.empty());

    const bool all_missing_toolchain = ranges::all_of(
        grades, [](const LanguageGrade& grade) { return grade.outcome == LanguageGrade::Outcome::CompilerMissing; });

    if (all_missing_toolchain) {
        result.status = GradeStatus::CompilerMissing;
    } else {
        result.status = GradeStatus::Failed;

        if (ranges::any_of(grades, [](const LanguageGrade& grade) {
                return grade.outcome == LanguageGrade::Outcome::CompilerMissing;
            })) {
            LOG_ERROR("{}: some submitted languages could not be graded for lack of a toolchain",
                      result.info.display_name);
        }
    }

    result.language.reset();
    result.tests.clear();
    result.full_output.clear();
    result.full_output_passed = false;

    for (std::size_t i = 0; i < test_names_.size() && strategy_.layout.indexed_tests; ++i) {
        TestResult test{.name = test_names_[i], .passed = false};

        for (const LanguageGrade& grade : grades) {
            const std::string& text = i < grade.tests.size() ? grade.tests[i].output : grade.diagnostic;
            fmt::format_to(std::back_inserter(test.output), "{}:\n{}\n", traits_of(grade.language).display_name,
                           text);
        }

        test.diagnostic = "FAILED - No submitted language passed any test";
        result.tests.push_back(std::move(test));
    }

    for (const LanguageGrade& grade : grades) {
        fmt::format_to(std::back_inserter(result.full_output), "{}:\n{}\n", traits_of(grade.language).display_name,
                       grade.full_output.empty() ? grade.diagnostic : grade.full_output);
    }

    result.diagnostic = fmt::format("All file types failed for {}.", result.info.display_name);
    log_line(result.grading_log, "{}", result.diagnostic);
}

} // namespace polygrader
