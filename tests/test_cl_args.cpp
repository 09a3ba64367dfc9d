#include "catch2_custom.hpp"

#include "output/verbosity.hpp"
#include "test_helpers.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <span>
#include <string>
#include <vector>

using polygrader::CommandLineArgs;
using polygrader::ProgramOptions;
using polygrader::VerbosityLevel;

namespace {

auto parse(const std::vector<std::string>& args) {
    std::vector<const char*> argv{"polygrader"};
    for (const std::string& arg : args) {
        argv.push_back(arg.c_str());
    }

    return CommandLineArgs{std::span{argv}}.parse();
}

} // namespace

TEST_CASE("Parse command line options") {
    TempDir dir;
    write_file(dir / "linked_list.yaml", "name: LinkedList\nrequired_files: [LinkedList]\n");
    write_file(dir / "input/roster.csv", "Student,Language\n");

    const std::string config = (dir / "linked_list.yaml").string();
    const std::string input = (dir / "input").string();

    SECTION("Defaults") {
        auto opts = parse({config, "-i", input});

        REQUIRE(opts);
        REQUIRE(opts->mode == ProgramOptions::Mode::Correctness);
        REQUIRE(opts->verbosity == ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        REQUIRE(opts->config_path == config);
        REQUIRE(opts->input_dir == input);
        REQUIRE(opts->output_dir == ProgramOptions::DEFAULT_OUTPUT_DIR);
        REQUIRE_FALSE(opts->roster_path.has_value());
        REQUIRE_FALSE(opts->jobs.has_value());
        REQUIRE_FALSE(opts->clean_start);
    }

    SECTION("Every option") {
        auto opts = parse({config, "-i", input, "-o", "graded", "-m", "time", "-r", input + "/roster.csv", "-j", "3",
                           "-v", "-v", "--clean-start", "--reload-tests", "-c", "never"});

        REQUIRE(opts);
        REQUIRE(opts->mode == ProgramOptions::Mode::Time);
        REQUIRE(opts->verbosity == VerbosityLevel::Extra);
        REQUIRE(opts->output_dir == "graded");
        REQUIRE(opts->roster_path == input + "/roster.csv");
        REQUIRE(opts->jobs == 3);
        REQUIRE(opts->clean_start);
        REQUIRE(opts->reload_tests);
        REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Never);
    }

    SECTION("Quiet and silent") {
        REQUIRE(parse({config, "-i", input, "-q"})->verbosity == VerbosityLevel::Quiet);
        REQUIRE(parse({config, "-i", input, "--silent"})->verbosity == VerbosityLevel::Silent);
    }

    SECTION("Invalid values are rejected") {
        REQUIRE_FALSE(parse({config, "-i", input, "-j", "0"}));
        REQUIRE_FALSE(parse({config, "-i", input, "-j", "many"}));
        REQUIRE_FALSE(parse({config, "-i", input, "-m", "fast"}));
        REQUIRE_FALSE(parse({config, "-i", input, "-q", "-q", "-q"}));
    }

    SECTION("Paths must exist") {
        REQUIRE_FALSE(parse({(dir / "missing.yaml").string(), "-i", input}));
        REQUIRE_FALSE(parse({config, "-i", (dir / "no_input").string()}));
        REQUIRE_FALSE(parse({config, "-i", input, "-r", input + "/missing.csv"}));
        REQUIRE_FALSE(parse({}));
    }
}

TEST_CASE("Format program options briefly or in full") {
    ProgramOptions opts;
    opts.mode = ProgramOptions::Mode::Time;
    opts.config_path = "linked_list.yaml";
    opts.jobs = 4;

    REQUIRE(fmt::format("{}", opts) == "Time run of linked_list.yaml");

    const std::string full = fmt::format("{:?}", opts);
    REQUIRE_THAT(full, Catch::Matchers::ContainsSubstring("mode=Time"));
    REQUIRE_THAT(full, Catch::Matchers::ContainsSubstring("config=linked_list.yaml"));
    REQUIRE_THAT(full, Catch::Matchers::ContainsSubstring("jobs=4"));
}
