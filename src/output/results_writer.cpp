#include "output/results_writer.hpp"

#include "config/assignment_config.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace polygrader {

namespace fs = std::filesystem;

ResultsWriter::ResultsWriter(const AssignmentConfig& config, fs::path results_dir, fs::path full_output_dir)
    : config_{&config}
    , results_dir_{std::move(results_dir)}
    , full_output_dir_{std::move(full_output_dir)} {}

Expected<void, std::string> ResultsWriter::prepare() const {
    TRY(clean_directory(results_dir_));
    TRY(clean_directory(full_output_dir_));

    return {};
}

Expected<void, std::string> ResultsWriter::clean_directory(const fs::path& dir) const {
    std::error_code err;

    if (!fs::exists(dir, err)) {
        LOG_DEBUG("Creating directory {}", dir.string());

        fs::create_directories(dir, err);
        if (err) {
            return fmt::format("Error creating {}: {}", dir.string(), err.message());
        }

        return {};
    }

    LOG_DEBUG("Cleaning existing directory {}", dir.string());

    for (const fs::directory_entry& entry : fs::directory_iterator{dir, err}) {
        if (!entry.is_regular_file()) {
            continue;
        }

        if (config_->is_ignored(entry.path().stem().string())) {
            LOG_DEBUG("Preserving {}", entry.path().string());
            continue;
        }

        fs::remove(entry.path(), err);
        if (err) {
            return fmt::format("Error removing {}: {}", entry.path().string(), err.message());
        }
    }

    if (err) {
        return fmt::format("Error listing {}: {}", dir.string(), err.message());
    }

    return {};
}

Expected<void, std::string> ResultsWriter::write(const StudentResult& result) const {
    if (!result.submission || result.status == GradeStatus::Ignored || result.status == GradeStatus::NotGraded) {
        return {};
    }

    const std::string file_name = result.username() + ".txt";

    std::string log = result.grading_log;
    if (log.empty()) {
        log = result.diagnostic + "\n";
    }

    TRY(write_file(results_dir_ / file_name, log));

    if (!result.full_output.empty()) {
        TRY(write_file(full_output_dir_ / file_name, result.full_output));
    }

    return {};
}

Expected<void, std::string> ResultsWriter::write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out{path, std::ios::trunc};
    out << contents;

    if (!out) {
        return fmt::format("Error writing {}", path.string());
    }

    return {};
}

} // namespace polygrader
