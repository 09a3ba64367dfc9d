#pragma once

#include "output/sink.hpp"

#include <cstdio>
#include <string_view>

namespace polygrader {

class ConsoleSink : public Sink
{
public:
    explicit ConsoleSink(std::FILE* stream = stdout)
        : stream_{stream} {}

    void write(std::string_view str) override;
    void flush() override;

    std::FILE* get_stream() const override { return stream_; }

private:
    std::FILE* stream_;
    bool reported_failure_ = false;
};

} // namespace polygrader
