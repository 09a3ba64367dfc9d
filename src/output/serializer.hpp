#pragma once

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <polygrader/common/class_traits.hpp>
#include <polygrader/grading_session.hpp>

#include <string_view>

namespace polygrader {

/// Receives grading events in order and renders them to a sink
/// Calls for one student (begin, result, end) are never interleaved with another student's.
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : verbosity_{verbosity}
        , sink_{&sink} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;

    virtual void on_student_begin(const StudentInfo& info) = 0;
    virtual void on_student_result(const StudentResult& data) = 0;
    virtual void on_student_end(const StudentInfo& info) = 0;

    virtual void on_run_result(const MultiStudentResult& data) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

    VerbosityLevel get_verbosity() const { return verbosity_; }

protected:
    Sink& sink() { return *sink_; }

    VerbosityLevel verbosity_;

private:
    Sink* sink_;
};

} // namespace polygrader
