#pragma once

#include "config/assignment_config.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <filesystem>
#include <string>

namespace polygrader {

/// Persists each graded student's log and combined-run output as ``<username>.txt`` files
class ResultsWriter
{
public:
    ResultsWriter(const AssignmentConfig& config, std::filesystem::path results_dir,
                  std::filesystem::path full_output_dir);

    /// Create both directories, deleting files left by a previous run except those of ignored users
    Expected<void, std::string> prepare() const;

    /// Write the artifacts of one student; students without a submission have none
    Expected<void, std::string> write(const StudentResult& result) const;

    const std::filesystem::path& get_results_dir() const { return results_dir_; }
    const std::filesystem::path& get_full_output_dir() const { return full_output_dir_; }

private:
    Expected<void, std::string> clean_directory(const std::filesystem::path& dir) const;

    static Expected<void, std::string> write_file(const std::filesystem::path& path, const std::string& contents);

    const AssignmentConfig* config_;
    std::filesystem::path results_dir_;
    std::filesystem::path full_output_dir_;
};

} // namespace polygrader
