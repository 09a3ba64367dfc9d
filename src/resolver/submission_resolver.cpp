#include "resolver/submission_resolver.hpp"

#include "config/assignment_config.hpp"
#include "subprocess/subprocess.hpp"
#include "user/file_searcher.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/remove_if.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace polygrader {

namespace fs = std::filesystem;

namespace {

std::string normalize_for_search(std::string str) {
    str.erase(ranges::remove_if(str, [](unsigned char chr) { return std::isspace(chr) != 0; }), str.end());
    ranges::transform(str, str.begin(), [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });

    return str;
}

Expected<void, std::string> run_unzip(const fs::path& archive, const fs::path& destination) {
    auto res = run_command("unzip", {"-q", "-o", archive.string(), "-d", destination.string()}, {},
                           SubmissionResolver::EXTRACTION_TIMEOUT);

    if (!res) {
        if (res.error() == ErrorKind::ExecFailure) {
            return std::string{"The 'unzip' tool is not installed"};
        }

        return fmt::format("Failed to run unzip on '{}': {}", archive.string(), res.error());
    }

    if (!res->result.succeeded()) {
        return fmt::format("unzip of '{}' {}:\n{}", archive.string(), res->result, res->combined());
    }

    return {};
}

} // namespace

SubmissionResolver::SubmissionResolver(fs::path submissions_dir, AssignmentConfig::NameOrder name_order)
    : submissions_dir_{std::move(submissions_dir)}
    , name_order_{name_order} {}

std::string SubmissionResolver::make_search_key(const StudentInfo& info, AssignmentConfig::NameOrder name_order) {
    if (info.is_group()) {
        return normalize_for_search(info.first_name);
    }

    std::string combined = name_order == AssignmentConfig::NameOrder::FirstLast ? info.first_name + info.last_name
                                                                                : info.last_name + info.first_name;

    std::string key = normalize_for_search(std::move(combined));

    if (key.size() > MAX_SEARCH_KEY_LENGTH) {
        key.resize(MAX_SEARCH_KEY_LENGTH);
    }

    return key;
}

std::string SubmissionResolver::username_from_archive(const fs::path& archive) {
    std::string filename = archive.filename().string();

    if (auto underscore_pos = filename.find('_'); underscore_pos != std::string::npos) {
        return filename.substr(0, underscore_pos);
    }

    return archive.stem().string();
}

Expected<std::optional<fs::path>, std::string> SubmissionResolver::find_archive(const StudentInfo& info) const {
    std::string key = make_search_key(info, name_order_);

    if (key.empty()) {
        LOG_WARN("Roster entry '{}' has an empty search key; it cannot match any archive", info.display_name);
        return std::optional<fs::path>{};
    }

    FileSearcher searcher{R"(`key`.*\.zip)", {{"key", FileSearcher::escape(key)}}, /*case_insensitive=*/true};

    auto matches = searcher.search(submissions_dir_);

    if (!matches) {
        // A std::string also converts to an optional path, so the error must be tagged explicitly
        return {UnexpectedT{},
                fmt::format("Failed to search {} for archives: {}", submissions_dir_.string(),
                            matches.error().message())};
    }

    if (matches->empty()) {
        LOG_DEBUG("No archive matches search key '{}' for {}", key, info.display_name);
        return std::optional<fs::path>{};
    }

    if (matches->size() > 1) {
        LOG_WARN("{} archives match search key '{}' for {}; using {}", matches->size(), key, info.display_name,
                 matches->front().filename().string());
    }

    return std::optional<fs::path>{matches->front()};
}

Expected<std::optional<Submission>, std::string> SubmissionResolver::resolve(const StudentInfo& info) {
    std::optional<fs::path> archive = TRY(find_archive(info));

    if (!archive) {
        return std::optional<Submission>{};
    }

    std::string username = username_from_archive(*archive);
    fs::path extraction_path = submissions_dir_ / username;

    {
        std::scoped_lock lock{extraction_mutex_};
        TRY(extract_archive(*archive, extraction_path));
    }

    LOG_DEBUG("Resolved {} to archive {} (username '{}')", info.display_name, archive->filename().string(), username);

    return std::optional<Submission>{
        Submission{.username = username, .archive_path = *archive, .extraction_path = extraction_path, .languages = {}}};
}

Expected<void, std::string> SubmissionResolver::extract_archive(const fs::path& archive, const fs::path& destination) {
    std::error_code err;

    if (fs::exists(destination, err)) {
        LOG_DEBUG("{} already extracted; skipping", destination.string());
        return {};
    }

    // Extract beside the destination first, so that a partial extraction is never mistaken for a complete one
    fs::path partial = destination;
    partial += ".partial";

    fs::remove_all(partial, err);
    if (err) {
        return fmt::format("Failed to remove stale {}: {}", partial.string(), err.message());
    }

    LOG_INFO("Extracting {}", archive.filename().string());

    auto res = run_unzip(archive, partial);

    if (!res) {
        fs::remove_all(partial, err);
        if (err) {
            LOG_ERROR("Failed to clean up {}: {}", partial.string(), err.message());
        }
        return res.error();
    }

    // An archive of nothing but directories or an empty archive still counts as extracted
    fs::create_directories(partial, err);
    if (!err) {
        fs::rename(partial, destination, err);
    }

    if (err) {
        return fmt::format("Failed to move extracted files into {}: {}", destination.string(), err.message());
    }

    return {};
}

Expected<void, std::string> SubmissionResolver::prepare_submissions_dir(const fs::path& combined_archive,
                                                                        const fs::path& submissions_dir,
                                                                        bool clean_start) {
    std::error_code err;

    if (clean_start && fs::exists(submissions_dir, err)) {
        LOG_INFO("Clean start: deleting {}", submissions_dir.string());
        fs::remove_all(submissions_dir, err);
        if (err) {
            return fmt::format("Failed to delete {}: {}", submissions_dir.string(), err.message());
        }
    }

    fs::create_directories(submissions_dir, err);
    if (err) {
        return fmt::format("Failed to create {}: {}", submissions_dir.string(), err.message());
    }

    bool is_empty = fs::is_empty(submissions_dir, err);
    if (err) {
        return fmt::format("Failed to inspect {}: {}", submissions_dir.string(), err.message());
    }

    if (!is_empty) {
        return {};
    }

    if (!fs::exists(combined_archive, err)) {
        LOG_WARN("{} not found and {} is empty; no submissions will be found", combined_archive.string(),
                 submissions_dir.string());
        return {};
    }

    LOG_INFO("Extracting {} into {}", combined_archive.string(), submissions_dir.string());

    return run_unzip(combined_archive, submissions_dir);
}

} // namespace polygrader
