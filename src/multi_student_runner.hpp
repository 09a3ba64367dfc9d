#pragma once

#include "config/assignment_config.hpp"
#include "grader/grading_engine.hpp"
#include "output/results_writer.hpp"
#include "output/serializer.hpp"
#include "resolver/submission_resolver.hpp"

#include <polygrader/grading_session.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace polygrader {

/// Resolves, grades and reports every student of a roster, ``config.jobs`` students at a time
class MultiStudentRunner
{
public:
    /// ``writer`` may be null, in which case no per-student files are written
    MultiStudentRunner(const AssignmentConfig& config, SubmissionResolver& resolver, const GradingEngine& engine,
                       const std::shared_ptr<Serializer>& serializer, const ResultsWriter* writer = nullptr);

    /// Results are in roster order whatever order students finish in
    MultiStudentResult run_all_students(const std::vector<StudentInfo>& students) const;

    /// Resolve and grade a single student. Never throws; every failure becomes a status
    StudentResult run_student(const StudentInfo& info) const;

private:
    StudentResult resolve_and_grade(const StudentInfo& info) const;

    /// Hand a finished student to the serializer and writer, one student at a time
    void report(const StudentResult& result) const;

    /// Lock guarding the extraction tree at ``extraction_path``
    /// Roster entries that resolve to the same archive share one tree, so they are graded one after another.
    std::mutex& submission_lock(const std::filesystem::path& extraction_path, const StudentInfo& info) const;

    const AssignmentConfig* config_;
    SubmissionResolver* resolver_;
    const GradingEngine* engine_;
    std::shared_ptr<Serializer> serializer_;
    const ResultsWriter* writer_;

    mutable std::mutex report_mutex_;

    mutable std::mutex submission_locks_mutex_;
    mutable std::map<std::filesystem::path, std::mutex> submission_locks_;
};

} // namespace polygrader
