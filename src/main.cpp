#include "app/grader_app.hpp"
#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <polygrader/logging.hpp>

#include <cstddef>
#include <exception>
#include <span>

int main(int argc, const char* argv[]) {
    using namespace polygrader;

    init_loggers();

    try {
        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        const ProgramOptions options = parse_args_or_exit(args);

        return GraderApp{options}.run();
    } catch (const std::exception& ex) {
        trace_exception(ex);
    } catch (...) {
        trace_exception("<unknown - not derived from std::exception>");
    }

    return App::EXIT_SETUP_FAILED;
}
