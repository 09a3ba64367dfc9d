#include "roster/roster_reader.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/slice.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

std::string trimmed(std::string_view str) {
    return boost::algorithm::trim_copy(std::string{str});
}

} // namespace

RosterReader::RosterReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<std::vector<std::string>, std::string> RosterReader::split_record(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char chr = line[i];

        if (in_quotes) {
            if (chr != '"') {
                current += chr;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                // Escaped quote
                current += '"';
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (chr == '"') {
            in_quotes = true;
        } else if (chr == ',') {
            fields.push_back(std::exchange(current, {}));
        } else {
            current += chr;
        }
    }

    if (in_quotes) {
        return std::string{"Unterminated quoted field"};
    }

    fields.push_back(std::move(current));

    return fields;
}

StudentInfo RosterReader::parse_student_name(std::string_view cell) {
    std::string name = trimmed(cell);

    // Quotes may remain when the file was written with non-standard quoting
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
        name = trimmed(std::string_view{name}.substr(1, name.size() - 2));
    }

    auto comma_pos = name.find(',');

    if (comma_pos == std::string::npos) {
        return StudentInfo{.first_name = name, .last_name = "", .display_name = name};
    }

    std::string_view name_view{name};
    std::string last_name = trimmed(name_view.substr(0, comma_pos));

    // Anything after a second comma (e.g. a suffix) is not part of the first name
    std::string_view rest = name_view.substr(comma_pos + 1);
    std::string first_name = trimmed(rest.substr(0, rest.find(',')));

    return StudentInfo{.first_name = first_name, .last_name = last_name, .display_name = name};
}

Expected<Roster, std::string> RosterReader::read() const {
    std::ifstream in_file{path_};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open roster '{}'", path_.string());
    }

    Roster result;
    bool header_read = false;
    std::size_t line_num = 0;

    std::string line;
    while (std::getline(in_file, line)) {
        ++line_num;

        // Remove a CR character; windows linefeed
        // https://datatracker.ietf.org/doc/html/rfc4180
        if (line.ends_with('\r')) {
            line.resize(line.size() - 1);
        }

        if (trimmed(line).empty()) {
            LOG_DEBUG("Skipping empty roster line {}", line_num);
            continue;
        }

        auto fields_res = split_record(line);

        if (!fields_res) {
            return fmt::format("Roster line {}: {}", line_num, fields_res.error());
        }

        std::vector<std::string> fields = std::move(fields_res.value());

        if (!header_read) {
            auto header = fields | ranges::views::transform(trimmed) | ranges::to<std::vector<std::string>>();
            auto language_it = ranges::find(header, LANGUAGE_COLUMN);

            if (language_it == header.end()) {
                return fmt::format("Roster header has no '{}' column", LANGUAGE_COLUMN);
            }

            auto language_idx = static_cast<std::size_t>(language_it - header.begin());

            if (language_idx == 0) {
                return fmt::format("Roster header must begin with a student column before '{}'", LANGUAGE_COLUMN);
            }

            result.test_names = header | ranges::views::slice(std::size_t{1}, language_idx) |
                                ranges::to<std::vector<std::string>>();
            header_read = true;

            continue;
        }

        // Rows with an empty name are padding
        if (trimmed(fields.front()).empty()) {
            LOG_DEBUG("Skipping roster line {} with no name", line_num);
            continue;
        }

        result.students.push_back(parse_student_name(fields.front()));
    }

    if (in_file.bad()) {
        return std::string{"IO error in reading roster"};
    }

    if (!header_read) {
        return std::string{"Roster is empty"};
    }

    LOG_DEBUG("Read {} students and {} test names from roster", result.students.size(), result.test_names.size());

    return result;
}

} // namespace polygrader
