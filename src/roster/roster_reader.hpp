#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

struct Roster
{
    /// Names of the configured tests, in report order
    std::vector<std::string> test_names;

    std::vector<StudentInfo> students;
};

/// Small CSV reader for the class roster
///
/// Expects a header row of the form ``Student,<test names...>,Language[,...]`` followed by one row per
/// student whose first field is ``"Last, First"`` (or a single token for groups). Fields may be quoted
/// as per RFC 4180; quoted fields may not span lines.
class RosterReader
{
public:
    explicit RosterReader(std::filesystem::path path);

    Expected<Roster, std::string> read() const;

    /// Split one CSV record into its fields
    static Expected<std::vector<std::string>, std::string> split_record(std::string_view line);

    /// Interpret a roster name cell. Single-token names denote groups.
    static StudentInfo parse_student_name(std::string_view cell);

    static constexpr std::string_view LANGUAGE_COLUMN = "Language";

private:
    std::filesystem::path path_;
};

} // namespace polygrader
