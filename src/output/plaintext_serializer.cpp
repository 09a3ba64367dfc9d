#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include <sys/ioctl.h>

namespace polygrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : PlainTextSerializer{sink, colorize_option, verbosity, get_terminal_width(sink)} {}

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity, std::size_t width)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option, sink)}
    , terminal_width_{width} {}

std::string_view PlainTextSerializer::describe(GradeStatus status) {
    switch (status) {
    case GradeStatus::NotGraded:
        return "Not graded";
    case GradeStatus::NotSubmitted:
        return "Not submitted";
    case GradeStatus::Ignored:
        return "Ignored";
    case GradeStatus::Tested:
        return "Tested";
    case GradeStatus::Failed:
        return "Failed";
    case GradeStatus::CompilerMissing:
        return "Toolchain missing";
    case GradeStatus::Error:
        return "Error";
    }

    return "<unknown>";
}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view header_text = " PolyGrader ";
    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view assignment_label = "Assignment: ";
    constexpr std::string_view date_label = "Date and Time: ";

    std::string assignment_text = fmt::format("{} ({})", data.assignment_name, data.mode_name);
    std::string local_timepoint_text =
        fmt::format("{:%a %b %d %T %Y}", fmt::localtime(std::chrono::system_clock::to_time_t(data.start_time)));

    auto right_aligned = [this](std::string_view label, std::string_view text) {
        std::size_t width = terminal_width_ > label.size() ? terminal_width_ - label.size() : 0;
        return fmt::format("{}{:>{}}\n", label, text, width);
    };

    std::string out = fmt::format("{:#^{}}\n", header_text, terminal_width_);
    out += right_aligned(version_label, data.version_string);
    out += right_aligned(assignment_label, assignment_text);
    out += right_aligned(date_label, local_timepoint_text);
    out += LINE_DIVIDER_2EM(terminal_width_) + "\n\n";

    sink().write(out);
}

void PlainTextSerializer::on_student_begin(const StudentInfo& info) {
    if (!should_output_student_summary(verbosity_)) {
        return;
    }

    std::string student_label = "Student: ";
    std::string student_label_text = student_label + style_str(info.display_name, POP_OUT_STYLE);

    const auto actual_sz = student_label.size() + info.display_name.size();
    const auto padding = terminal_width_ > actual_sz ? (terminal_width_ - actual_sz) / 2 : 0;

    std::string out = fmt::format("{}\n{:>{}}\n\n", LINE_DIVIDER_EM(terminal_width_), student_label_text,
                                  student_label_text.size() + padding);

    // Blank lines to separate each student
    if (!is_first_student_) {
        sink().write("\n\n");
    }
    is_first_student_ = false;

    sink().write(out);
}

void PlainTextSerializer::on_student_result(const StudentResult& data) {
    if (should_output_student_line(verbosity_)) {
        sink().write(fmt::format("{}: {}\n", style_str(data.info.display_name, POP_OUT_STYLE), status_line(data)));
        return;
    }

    if (!should_output_student_summary(verbosity_)) {
        return;
    }

    std::string out;

    if (data.submission) {
        out += fmt::format("Submission: {}\n", data.submission->archive_path.filename().string());
    }

    if (data.attempted_languages.size() > 1) {
        auto names = data.attempted_languages |
                     ranges::views::transform([](LanguageKind kind) { return traits_of(kind).display_name; }) |
                     ranges::to<std::vector<std::string_view>>();
        out += fmt::format("Languages tried: {}\n", fmt::join(names, ", "));
    }

    if (data.language) {
        out += fmt::format("Language: {}\n", style_str(traits_of(*data.language).display_name, VALUE_STYLE));
    }

    if (!data.tests.empty()) {
        out += LINE_DIVIDER(terminal_width_) + "\n";

        std::size_t name_width = ranges::max(data.tests | ranges::views::transform([](const TestResult& test) {
                                                 return test.name.size();
                                             }));

        for (const TestResult& test : data.tests) {
            std::string verdict =
                test.passed ? style_str("PASSED", SUCCESS_STYLE) : style_str("FAILED", ERROR_STYLE);
            out += fmt::format("{:<{}} : {}\n", test.name, name_width, verdict);

            if (should_output_test_details(verbosity_, test.passed) && !test.diagnostic.empty()) {
                out += fmt::format("    {}\n", test.diagnostic);
            }
        }

        out += LINE_DIVIDER(terminal_width_) + "\n";
    }

    if (data.status == GradeStatus::Tested) {
        out += fmt::format("Full output: {}\n", data.full_output_passed ? style_str("PASSED", SUCCESS_STYLE)
                                                                        : style_str("FAILED", ERROR_STYLE));
    }

    if (data.full_runtime) {
        auto seconds = std::chrono::duration<double>(*data.full_runtime).count();
        out += fmt::format("Runtime: {} seconds\n", style_str(fmt::format("{:.2f}", seconds), VALUE_STYLE));
    }

    out += status_line(data) + "\n";

    if (should_output_grading_log(verbosity_) && !data.grading_log.empty()) {
        out += fmt::format("\nGrading log:\n{}", data.grading_log);
        if (!data.grading_log.ends_with('\n')) {
            out += '\n';
        }
    }

    sink().write(out);
}

void PlainTextSerializer::on_student_end([[maybe_unused]] const StudentInfo& info) {
    if (!should_output_student_summary(verbosity_)) {
        return;
    }

    // Line divider at the end to make it easier to differentiate between students
    std::string out = LINE_DIVIDER_EM(terminal_width_) + "\n";
    sink().write(out);
}

void PlainTextSerializer::on_run_result(const MultiStudentResult& data) {
    if (data.halted) {
        on_error("Grading was halted early because a required toolchain is not installed");
    }

    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    auto count = [&data](GradeStatus status) {
        return static_cast<std::size_t>(
            ranges::count_if(data.results, [status](const StudentResult& res) { return res.status == status; }));
    };

    std::vector<std::string> parts;
    for (GradeStatus status : {GradeStatus::Tested, GradeStatus::Failed, GradeStatus::NotSubmitted,
                               GradeStatus::Ignored, GradeStatus::CompilerMissing, GradeStatus::Error,
                               GradeStatus::NotGraded}) {
        if (std::size_t num = count(status); num > 0) {
            parts.push_back(fmt::format("{} {}", num, describe(status)));
        }
    }

    const auto num_all_passed = static_cast<std::size_t>(ranges::count_if(data.results, &StudentResult::all_passed));

    std::string out = fmt::format("\n{}\n", LINE_DIVIDER_2EM(terminal_width_));
    out += fmt::format("{} {}: {}\n", data.results.size(), pluralize("student", data.results.size()),
                       fmt::join(parts, ", "));
    out += fmt::format("{} passed every test\n", style_str(num_all_passed, SUCCESS_STYLE));

    sink().write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink().write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink().write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink().flush();
}

std::string PlainTextSerializer::status_line(const StudentResult& data) const {
    if (data.status == GradeStatus::Tested && !data.tests.empty()) {
        auto num_passed = static_cast<std::size_t>(data.num_tests_passed());
        std::string text = fmt::format("{}/{} {} passed", num_passed, data.tests.size(),
                                       pluralize("test", data.tests.size()));

        return style_str(text, data.all_passed() ? SUCCESS_STYLE : ERROR_STYLE);
    }

    if (data.status == GradeStatus::Tested) {
        return style_str(describe(data.status), data.full_output_passed ? SUCCESS_STYLE : ERROR_STYLE);
    }

    std::string text{describe(data.status)};
    if (!data.diagnostic.empty()) {
        text += fmt::format(" ({})", data.diagnostic);
    }

    auto style = data.status == GradeStatus::Ignored || data.status == GradeStatus::NotSubmitted ? WARNING_STYLE
                                                                                                  : ERROR_STYLE;

    return style_str(text, style);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option, const Sink& sink) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    std::FILE* stream = sink.get_stream();
    if (stream == nullptr) {
        return false;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stream), is_color_terminal());

    return in_terminal(stream) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width(const Sink& sink) {
    std::FILE* stream = sink.get_stream();
    if (stream == nullptr) {
        return DEFAULT_WIDTH;
    }

    auto width = terminal_size(stream).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    std::size_t result = width.value_or(DEFAULT_WIDTH);

    return result == 0 ? DEFAULT_WIDTH : result;
}

} // namespace polygrader
