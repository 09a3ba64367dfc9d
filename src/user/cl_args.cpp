#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>
#include <polygrader/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace polygrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), POLYGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(
        fmt::format("PolyGrader v{}\nGrades C++, Java and C# submissions against an instructor's test harnesses.",
                    POLYGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("config")
        .metavar("CONFIG")
        .action([this] (const std::string& opt) {
                opts_buffer_.config_path = opt;
        })
        .help("YAML file describing the assignment");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", POLYGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-m", "--mode")
        .choices("correctness", "time", "prepare")
        .default_value(std::string{"correctness"})
        .metavar("MODE")
        .nargs(1)
        .action([this] (const std::string& opt) {
            using enum ProgramOptions::Mode;

            if (opt == "correctness") {
                opts_buffer_.mode = Correctness;
            } else if (opt == "time") {
                opts_buffer_.mode = Time;
            } else if (opt == "prepare") {
                opts_buffer_.mode = Prepare;
            }
        })
        .help("Check output correctness, check run time, or prepare the assignment's test files");

    arg_parser_.add_argument("-r", "--roster")
        .metavar("FILE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.roster_path = opt;
        })
        .help("Roster CSV file. Defaults to <INPUT>/<assignment name>.csv");

    arg_parser_.add_argument("-i", "--input")
        .default_value(std::string{ProgramOptions::DEFAULT_INPUT_DIR})
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.input_dir = opt;
        })
        .help("Directory holding the roster, submissions.zip and the assignment's test files");

    arg_parser_.add_argument("-o", "--output")
        .default_value(std::string{ProgramOptions::DEFAULT_OUTPUT_DIR})
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.output_dir = opt;
        })
        .help("Directory for extracted submissions and per-student results");

    arg_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                int jobs{};

                try {
                    jobs = std::stoi(opt);
                } catch (const std::exception& /*unused*/) {
                    throw std::invalid_argument(fmt::format("Number of jobs \"{}\" is not an integer", opt));
                }

                if (jobs < 1) {
                    throw std::invalid_argument("Number of jobs must be at least 1");
                }

                opts_buffer_.jobs = jobs;
        })
        .help("Number of students to grade concurrently. Overrides the config file");

    arg_parser_.add_argument("--clean-start")
        .flag()
        .store_into(opts_buffer_.clean_start)
        .help("Re-extract every submission and rebuild every sandbox from scratch");

    arg_parser_.add_argument("--reload-tests")
        .flag()
        .store_into(opts_buffer_.reload_tests)
        .help("Overwrite the test harness copies in existing sandboxes");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (value > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (value < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    opts_buffer_.verbosity = Silent;
                })
            .help("Sets verbosity level to 'Silent', suppressing all output except errors. Useful for scripting.");

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {:?}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print("{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace polygrader
