#include "multi_student_runner.hpp"

#include "app/trace_exception.hpp"
#include "config/assignment_config.hpp"
#include "grader/grading_engine.hpp"
#include "grader/language_detector.hpp"
#include "output/results_writer.hpp"
#include "output/serializer.hpp"
#include "resolver/submission_resolver.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace polygrader {

MultiStudentRunner::MultiStudentRunner(const AssignmentConfig& config, SubmissionResolver& resolver,
                                       const GradingEngine& engine, const std::shared_ptr<Serializer>& serializer,
                                       const ResultsWriter* writer)
    : config_{&config}
    , resolver_{&resolver}
    , engine_{&engine}
    , serializer_{serializer}
    , writer_{writer} {}

MultiStudentResult MultiStudentRunner::run_all_students(const std::vector<StudentInfo>& students) const {
    MultiStudentResult result;

    // One slot per student, so that workers never touch the same element
    result.results.reserve(students.size());
    for (const StudentInfo& info : students) {
        result.results.push_back(StudentResult{.info = info});
    }

    std::atomic<std::size_t> next_student{0};
    std::atomic<bool> halted{false};

    auto worker = [&] {
        while (!halted.load()) {
            std::size_t idx = next_student.fetch_add(1);
            if (idx >= students.size()) {
                return;
            }

            StudentResult res = run_student(students[idx]);
            report(res);

            if (res.status == GradeStatus::CompilerMissing && config_->halt_on_missing_toolchain) {
                LOG_ERROR("Halting: a required toolchain is missing (while grading {})", res.info.display_name);
                halted.store(true);
            }

            result.results[idx] = std::move(res);
        }
    };

    const auto num_workers = std::min(gsl::narrow_cast<std::size_t>(std::max(config_->jobs, 1)), students.size());

    LOG_DEBUG("Grading {} students with {} workers", students.size(), num_workers);

    if (num_workers <= 1) {
        worker();
    } else {
        std::vector<std::jthread> pool;
        pool.reserve(num_workers);

        for (std::size_t i = 0; i < num_workers; ++i) {
            pool.emplace_back(worker);
        }
        // jthreads join on destruction
    }

    result.halted = halted.load();

    return result;
}

StudentResult MultiStudentRunner::run_student(const StudentInfo& info) const {
    try {
        return resolve_and_grade(info);
    } catch (const std::exception& ex) {
        const std::string what = fmt::format("{}", fmt::join(exception_chain(ex), ": "));
        LOG_ERROR("Unexpected exception while grading {}: {}", info.display_name, what);

        return StudentResult{.info = info,
                             .status = GradeStatus::Error,
                             .diagnostic = fmt::format("Unexpected error: {}", what)};
    }
}

StudentResult MultiStudentRunner::resolve_and_grade(const StudentInfo& info) const {
    auto resolved = resolver_->resolve(info);

    if (!resolved) {
        LOG_ERROR("Could not resolve submission of {}: {}", info.display_name, resolved.error());
        return StudentResult{.info = info, .status = GradeStatus::Error, .diagnostic = resolved.error()};
    }

    std::optional<Submission> submission = *resolved;

    if (!submission) {
        return engine_->grade(info, std::nullopt);
    }

    if (config_->is_ignored(submission->username)) {
        LOG_DEBUG("Ignoring {} ({})", info.display_name, submission->username);
        return StudentResult{.info = info, .status = GradeStatus::Ignored, .submission = std::move(submission)};
    }

    std::scoped_lock submission_guard{submission_lock(submission->extraction_path, info)};

    auto languages = detect_languages(submission->extraction_path);

    if (!languages) {
        std::string msg = fmt::format("Error scanning {}: {}", submission->extraction_path.string(),
                                      languages.error().message());
        LOG_ERROR("{}", msg);
        return StudentResult{
            .info = info, .status = GradeStatus::Error, .submission = std::move(submission), .diagnostic = msg};
    }

    submission->languages = *languages;

    return engine_->grade(info, submission);
}

std::mutex& MultiStudentRunner::submission_lock(const std::filesystem::path& extraction_path,
                                                const StudentInfo& info) const {
    std::scoped_lock lock{submission_locks_mutex_};

    auto [iter, inserted] = submission_locks_.try_emplace(extraction_path);

    if (!inserted) {
        LOG_WARN("{} resolves to {}, which another roster entry also resolved to; grading them one at a time",
                 info.display_name, extraction_path.string());
    }

    return iter->second;
}

void MultiStudentRunner::report(const StudentResult& result) const {
    std::scoped_lock lock{report_mutex_};

    serializer_->on_student_begin(result.info);
    serializer_->on_student_result(result);
    serializer_->on_student_end(result.info);

    if (writer_ == nullptr) {
        return;
    }

    if (auto written = writer_->write(result); !written) {
        serializer_->on_error(written.error());
    }
}

} // namespace polygrader
