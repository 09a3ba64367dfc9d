#pragma once

#include "config/assignment_config.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace polygrader {

/// Matches roster entries to uploaded archives and extracts them
///
/// ``submissions_dir`` holds one ``<username>_<anything>.zip`` archive per student. Each archive is
/// extracted into ``submissions_dir/<username>``, once; later runs reuse the extracted tree.
class SubmissionResolver
{
public:
    static constexpr std::size_t MAX_SEARCH_KEY_LENGTH = 8;
    static constexpr std::chrono::minutes EXTRACTION_TIMEOUT{10};

    SubmissionResolver(std::filesystem::path submissions_dir, AssignmentConfig::NameOrder name_order);

    /// Lowercase, whitespace-free concatenation of the names in configured order, at most 8 characters
    /// Groups use their whole name instead.
    static std::string make_search_key(const StudentInfo& info, AssignmentConfig::NameOrder name_order);

    /// The part of the archive's file name before the first underscore
    static std::string username_from_archive(const std::filesystem::path& archive);

    /// The first archive whose file name starts with the student's search key, ignoring case
    Expected<std::optional<std::filesystem::path>, std::string> find_archive(const StudentInfo& info) const;

    /// Locate and extract a student's submission
    /// Returns nullopt when no archive matches; that is the "not submitted" state, not an error.
    Expected<std::optional<Submission>, std::string> resolve(const StudentInfo& info);

    /// Extract ``archive`` into ``destination``, unless ``destination`` already exists
    /// A failed extraction leaves nothing behind, so that the next run tries again.
    static Expected<void, std::string> extract_archive(const std::filesystem::path& archive,
                                                       const std::filesystem::path& destination);

    /// Make sure ``submissions_dir`` exists, and fill it from ``combined_archive`` (if that exists) when it is
    /// empty. ``clean_start`` wipes the directory first.
    static Expected<void, std::string> prepare_submissions_dir(const std::filesystem::path& combined_archive,
                                                               const std::filesystem::path& submissions_dir,
                                                               bool clean_start);

    const std::filesystem::path& get_submissions_dir() const { return submissions_dir_; }

private:
    std::filesystem::path submissions_dir_;
    AssignmentConfig::NameOrder name_order_;

    /// Two roster entries may match the same archive; extractions are serialized so they never interleave
    std::mutex extraction_mutex_;
};

} // namespace polygrader
