#include "config/assignment_config.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <yaml-cpp/yaml.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

namespace {

constexpr std::array KNOWN_KEYS = {"name",
                                   "required_files",
                                   "provided_files",
                                   "test_headers",
                                   "expected_output_file",
                                   "name_order",
                                   "clean_start",
                                   "timeout_seconds",
                                   "max_attempts",
                                   "max_output_bytes",
                                   "time_check_strings",
                                   "ignore_names",
                                   "jobs",
                                   "halt_on_missing_toolchain"};

template <typename T>
void read_if_present(const YAML::Node& root, const char* key, T& out) {
    if (const YAML::Node node = root[key]; node && !node.IsNull()) {
        out = node.as<T>();
    }
}

Expected<AssignmentConfig::NameOrder, std::string> parse_name_order(const std::string& str) {
    using enum AssignmentConfig::NameOrder;

    if (str == "first_last") {
        return FirstLast;
    }
    if (str == "last_first") {
        return LastFirst;
    }

    return fmt::format("Invalid name_order '{}'; expected 'first_last' or 'last_first'", str);
}

} // namespace

Expected<AssignmentConfig, std::string> AssignmentConfig::parse(const std::string& yaml_text) {
    AssignmentConfig config;

    try {
        const YAML::Node root = YAML::Load(yaml_text);

        if (!root.IsMap()) {
            return std::string{"Assignment configuration must be a YAML mapping"};
        }

        for (const auto& entry : root) {
            auto key = entry.first.as<std::string>();
            if (ranges::find(KNOWN_KEYS, key) == KNOWN_KEYS.end()) {
                LOG_WARN("Ignoring unknown configuration key '{}'", key);
            }
        }

        if (!root["name"]) {
            return std::string{"Missing required key 'name'"};
        }
        if (!root["required_files"]) {
            return std::string{"Missing required key 'required_files'"};
        }

        read_if_present(root, "name", config.name);
        read_if_present(root, "required_files", config.required_files);
        read_if_present(root, "provided_files", config.provided_files);
        read_if_present(root, "test_headers", config.test_headers);
        read_if_present(root, "expected_output_file", config.expected_output_file);
        read_if_present(root, "clean_start", config.clean_start);
        read_if_present(root, "max_attempts", config.max_attempts);
        read_if_present(root, "max_output_bytes", config.max_output_bytes);
        read_if_present(root, "time_check_strings", config.time_check_strings);
        read_if_present(root, "ignore_names", config.ignore_names);
        read_if_present(root, "jobs", config.jobs);
        read_if_present(root, "halt_on_missing_toolchain", config.halt_on_missing_toolchain);

        int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
        read_if_present(root, "timeout_seconds", timeout_seconds);
        config.timeout = std::chrono::seconds{timeout_seconds};

        if (root["name_order"]) {
            config.name_order = TRY(parse_name_order(root["name_order"].as<std::string>()));
        }
    } catch (const YAML::Exception& ex) {
        return fmt::format("Invalid assignment configuration: {}", ex.what());
    }

    TRY(config.validate());

    LOG_DEBUG("Loaded configuration for assignment '{}' (required: {}, provided: {}, {} test headers)", config.name,
              config.required_files, config.provided_files, config.test_headers.size());

    return config;
}

Expected<AssignmentConfig, std::string> AssignmentConfig::load(const std::filesystem::path& path) {
    std::ifstream file{path};

    if (!file) {
        return fmt::format("Could not open configuration file '{}'", path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto res = parse(buffer.str());

    if (!res) {
        return fmt::format("{}: {}", path.string(), res.error());
    }

    return res;
}

Expected<void, std::string> AssignmentConfig::validate() const {
    if (name.empty()) {
        return std::string{"Assignment name must not be empty"};
    }

    if (required_files.empty()) {
        return std::string{"At least one required file must be listed"};
    }

    if (ranges::any_of(required_files, [](const std::string& file) { return file.empty(); })) {
        return std::string{"Required file names must not be empty"};
    }

    if (max_attempts < 1) {
        return fmt::format("max_attempts must be at least 1 (got {})", max_attempts);
    }

    if (max_output_bytes < 1) {
        return std::string{"max_output_bytes must be at least 1"};
    }

    if (timeout.count() < 1) {
        return fmt::format("timeout_seconds must be at least 1 (got {})", timeout.count());
    }

    if (jobs < 1) {
        return fmt::format("jobs must be at least 1 (got {})", jobs);
    }

    return {};
}

bool AssignmentConfig::is_ignored(std::string_view username) const {
    return ranges::any_of(ignore_names, [username](const std::string& name) { return name == username; });
}

} // namespace polygrader
