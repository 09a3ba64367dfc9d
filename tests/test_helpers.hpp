#pragma once

#include "output/sink.hpp"

#include <polygrader/logging.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

/// A fresh directory below the system temp dir, removed with its contents on destruction
class TempDir
{
public:
    TempDir() {
        std::string templ = (std::filesystem::temp_directory_path() / "polygrader_test_XXXXXX").string();

        if (::mkdtemp(templ.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed: " + polygrader::get_err_msg(errno));
        }

        // Canonical, so that paths printed by child processes compare equal
        path_ = std::filesystem::canonical(templ);
    }

    ~TempDir() {
        std::error_code err;
        std::filesystem::remove_all(path_, err);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::filesystem::path& rhs) const { return path_ / rhs; }

private:
    std::filesystem::path path_;
};

/// Write ``contents`` to ``path``, creating parent directories as needed
inline void write_file(const std::filesystem::path& path, std::string_view contents) {
    std::filesystem::create_directories(path.parent_path());

    std::ofstream out{path, std::ios::trunc | std::ios::binary};
    out << contents;

    if (!out) {
        throw std::runtime_error("Could not write " + path.string());
    }
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in{path, std::ios::binary};

    if (!in) {
        throw std::runtime_error("Could not read " + path.string());
    }

    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

/// Collects everything written to it
class StringSink : public polygrader::Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }
    void flush() override {}

    const std::string& str() const { return buffer_; }

private:
    std::string buffer_;
};
