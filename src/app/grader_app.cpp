#include "app/grader_app.hpp"

#include "config/assignment_config.hpp"
#include "grader/grading_engine.hpp"
#include "grader/grading_strategy.hpp"
#include "grader/toolchain_probe.hpp"
#include "multi_student_runner.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/results_writer.hpp"
#include "output/console_sink.hpp"
#include "prep/assignment_preparer.hpp"
#include "resolver/submission_resolver.hpp"
#include "roster/roster_reader.hpp"
#include "user/program_options.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>
#include <polygrader/version.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace polygrader {

namespace fs = std::filesystem;

Expected<AssignmentConfig, std::string> GraderApp::load_config() const {
    AssignmentConfig config = TRY(AssignmentConfig::load(OPTS.config_path));

    if (OPTS.jobs) {
        config.jobs = *OPTS.jobs;
    }
    config.clean_start = config.clean_start || OPTS.clean_start;

    TRY(config.validate());

    return config;
}

fs::path GraderApp::assets_root(const AssignmentConfig& config) const {
    return OPTS.input_dir / config.name;
}

fs::path GraderApp::roster_path(const AssignmentConfig& config) const {
    return OPTS.roster_path.value_or(OPTS.input_dir / (config.name + ".csv"));
}

int GraderApp::run_impl() {
    auto config = load_config();
    if (!config) {
        fmt::print(stderr, "{}\n", fmt::styled(config.error(), fmt::fg(fmt::color::red)));
        return EXIT_SETUP_FAILED;
    }

    LOG_DEBUG("Loaded assignment \"{}\" with {} required files", config->name, config->required_files.size());

    auto roster = RosterReader{roster_path(*config)}.read();
    if (!roster) {
        fmt::print(stderr, "{}\n", fmt::styled(roster.error(), fmt::fg(fmt::color::red)));
        return EXIT_SETUP_FAILED;
    }

    LOG_DEBUG("Roster: {} tests, {} students", roster->test_names.size(), roster->students.size());

    if (OPTS.mode == ProgramOptions::Mode::Prepare) {
        return prepare(*config, *roster);
    }

    return grade(*config, *roster);
}

int GraderApp::prepare(const AssignmentConfig& config, const Roster& roster) const {
    AssignmentPreparer preparer{config, assets_root(config)};

    if (auto res = preparer.prepare(roster.test_names.size()); !res) {
        fmt::print(stderr, "{}\n", fmt::styled(res.error(), fmt::fg(fmt::color::red)));
        return EXIT_SETUP_FAILED;
    }

    return EXIT_OK;
}

int GraderApp::grade(const AssignmentConfig& config, const Roster& roster) const {
    const bool is_time_mode = OPTS.mode == ProgramOptions::Mode::Time;

    GradingStrategy strategy =
        is_time_mode ? GradingStrategy::timing(config) : GradingStrategy::correctness(assets_root(config));

    ConsoleSink output_sink{stdout};
    std::shared_ptr output_serializer =
        std::make_shared<PlainTextSerializer>(output_sink, OPTS.colorize_option, OPTS.verbosity);

    auto report_setup_error = [&](const std::string& msg) {
        output_serializer->on_error(msg);
        output_serializer->finalize();
        return EXIT_SETUP_FAILED;
    };

    const fs::path submissions_dir = OPTS.output_dir / "submissions";

    if (auto res = SubmissionResolver::prepare_submissions_dir(OPTS.input_dir / "submissions.zip", submissions_dir,
                                                               config.clean_start);
        !res) {
        return report_setup_error(res.error());
    }

    ResultsWriter writer{config, OPTS.output_dir / strategy.results_dir_name,
                         OPTS.output_dir / strategy.full_output_dir_name};

    if (auto res = writer.prepare(); !res) {
        return report_setup_error(res.error());
    }

    GradingEngine engine{config,
                         strategy,
                         assets_root(config),
                         roster.test_names,
                         GradingEngine::default_adapters(config.timeout, config.max_output_bytes),
                         {.clean_start = config.clean_start, .refresh_harness = OPTS.reload_tests}};

    SubmissionResolver resolver{submissions_dir, config.name_order};

    output_serializer->on_run_metadata(RunMetadata{.version_string = get_version_string(),
                                                   .assignment_name = config.name,
                                                   .mode_name = is_time_mode ? "time" : "correctness",
                                                   .start_time = std::chrono::system_clock::now()});

    MultiStudentRunner runner{config, resolver, engine, output_serializer, &writer};
    MultiStudentResult res = runner.run_all_students(roster.students);

    output_serializer->on_run_result(res);
    output_serializer->finalize();

    auto num_errors =
        ranges::count_if(res.results, [](const StudentResult& sres) { return sres.status == GradeStatus::Error; });
    if (num_errors > 0) {
        LOG_WARN("{} students could not be graded due to errors", num_errors);
    }

    return res.halted ? EXIT_HALTED : EXIT_OK;
}

} // namespace polygrader
