#pragma once

#include <polygrader/common/formatters/macros.hpp>

namespace polygrader {

/// How much is written to the console while grading
/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing but errors
    Quiet,   ///< One line per student
    Summary, ///< A block per student with each test's verdict
    All,     ///< Also the reason each failing test failed
    Extra,   ///< Also the full grading log of each student
    Max
};

constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level > Silent);
}

constexpr bool should_output_student_line(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level == Quiet);
}

constexpr bool should_output_student_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Summary);
}

constexpr bool should_output_test_details(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All && !passed);
}

constexpr bool should_output_grading_log(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Extra);
}

} // namespace polygrader

FMT_SERIALIZE_ENUM(::polygrader::VerbosityLevel, Silent, Quiet, Summary, All, Extra, Max);
