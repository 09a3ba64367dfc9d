#pragma once

#include <cstdio>
#include <string_view>

namespace polygrader {

/// Destination for serialized progress text
class Sink
{
public:
    virtual void write(std::string_view str) = 0;
    virtual void flush() = 0;

    /// Stream backing this sink, or nullptr if it is not file-backed.
    /// Used to decide on colors and line width.
    virtual std::FILE* get_stream() const { return nullptr; }

    virtual ~Sink() = default;
};

} // namespace polygrader
