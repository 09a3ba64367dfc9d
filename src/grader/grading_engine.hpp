#pragma once

#include "adapters/language_adapter.hpp"
#include "config/assignment_config.hpp"
#include "grader/grading_strategy.hpp"
#include "grader/sandbox_builder.hpp"
#include "grader/toolchain_probe.hpp"
#include "subprocess/subprocess.hpp"

#include <polygrader/common/formatters/macros.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/language.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace polygrader {

/// Everything that came of grading one submission in one language
struct LanguageGrade
{
    enum class Outcome {
        Graded,          ///< The per-test loop ran; see ``tests``
        MissingFiles,    ///< Required implementation files are absent; no tests were created
        CompilerMissing, ///< The toolchain is not installed
        Error            ///< Sandbox construction or process management failed
    };

    LanguageKind language;
    Outcome outcome = Outcome::Graded;

    std::vector<TestResult> tests;

    bool full_output_passed{};
    std::string full_output;
    std::optional<std::chrono::milliseconds> full_runtime;

    std::string diagnostic;
    std::string log;

    /// Whether this language counts as the student's language in the fallback protocol
    /// With per-test sandboxes, that is any passing test; otherwise, a passing combined run.
    bool passes(bool has_indexed_tests) const;
};

/// Drives grading of one student: language detection, sandboxing, compile/run with retries, comparison,
/// and falling back across languages when a submission holds more than one
///
/// The engine is immutable after construction and may grade several students concurrently.
class GradingEngine
{
public:
    using AdapterMap = std::map<LanguageKind, std::shared_ptr<const LanguageAdapter>>;

    GradingEngine(const AssignmentConfig& config, GradingStrategy strategy, std::filesystem::path assets_root,
                  std::vector<std::string> test_names, AdapterMap adapters, SandboxBuilder::Options sandbox_options,
                  std::shared_ptr<ToolchainProbe> probe = std::make_shared<ToolchainProbe>());

    /// One adapter per language, each with ``timeout`` and ``output_limit`` per toolchain step
    static AdapterMap default_adapters(std::chrono::milliseconds timeout,
                                       std::size_t output_limit = Subprocess::DEFAULT_OUTPUT_LIMIT);

    /// Grade a student; an absent submission is the "not submitted" state
    StudentResult grade(const StudentInfo& info, const std::optional<Submission>& submission) const;

    /// Run the whole per-test loop for one language
    LanguageGrade grade_language(const StudentInfo& info, const Submission& submission, LanguageKind language) const;

    const GradingStrategy& get_strategy() const { return strategy_; }

    const std::vector<std::string>& get_test_names() const { return test_names_; }

private:
    struct TimedRun
    {
        RunOutcome outcome;
        /// Wall-clock time of the final attempt, compile step included
        std::chrono::milliseconds attempt_time{};
    };

    /// compile_and_run with retry on timeout
    TimedRun run_with_retries(const LanguageAdapter& adapter, const Sandbox& sandbox,
                                const std::string& what) const;

    /// Verdict on one indexed test; the comparator only sees output of a successful run
    TestResult judge_test(std::size_t test_index, RunOutcome outcome) const;

    void run_combined(const LanguageAdapter& adapter, const Sandbox& sandbox, LanguageGrade& grade) const;

    void commit(StudentResult& result, LanguageGrade grade) const;

    /// The terminal result when every attempted language failed
    void commit_all_failed(StudentResult& result, const std::vector<LanguageGrade>& grades) const;

    const AssignmentConfig* config_;
    GradingStrategy strategy_;
    std::filesystem::path assets_root_;
    std::vector<std::string> test_names_;
    AdapterMap adapters_;
    SandboxBuilder sandbox_builder_;
    std::shared_ptr<ToolchainProbe> probe_;
};

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::LanguageGrade::Outcome, Graded, MissingFiles, CompilerMissing, Error);
