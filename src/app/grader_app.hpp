#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "config/assignment_config.hpp"
#include "roster/roster_reader.hpp"

#include <polygrader/common/expected.hpp>

#include <filesystem>
#include <string>

namespace polygrader {

/// Grades (or prepares) one assignment for a whole roster
class GraderApp final : public App
{
public:
    using App::App;

    /// The config file with command line overrides applied
    Expected<AssignmentConfig, std::string> load_config() const;

    std::filesystem::path assets_root(const AssignmentConfig& config) const;
    std::filesystem::path roster_path(const AssignmentConfig& config) const;

private:
    int run_impl() override;

    int prepare(const AssignmentConfig& config, const Roster& roster) const;
    int grade(const AssignmentConfig& config, const Roster& roster) const;
};

} // namespace polygrader
