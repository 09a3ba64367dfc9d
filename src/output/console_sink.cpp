#include "output/console_sink.hpp"

#include <polygrader/logging.hpp>

#include <cerrno>
#include <cstdio>
#include <string_view>

namespace polygrader {

void ConsoleSink::write(std::string_view str) {
    if (std::fwrite(str.data(), 1, str.size(), stream_) == str.size() || reported_failure_) {
        return;
    }

    LOG_WARN("Short write to console output: {}", get_err_msg(errno));
    reported_failure_ = true;
}

void ConsoleSink::flush() {
    std::fflush(stream_);
}

} // namespace polygrader
