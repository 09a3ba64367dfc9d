#include "adapters/bytecode_adapter.hpp"

#include "adapters/language_adapter.hpp"
#include "grader/output_comparator.hpp"
#include "user/file_searcher.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language.hpp>
#include <polygrader/logging.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

std::optional<std::string> BytecodeAdapter::strip_package_declaration(std::string_view source) {
    std::size_t line_begin = 0;

    while (line_begin < source.size()) {
        std::size_t line_end = source.find('\n', line_begin);
        std::size_t next_begin = line_end == std::string_view::npos ? source.size() : line_end + 1;

        std::string line = boost::algorithm::trim_copy(std::string{source.substr(line_begin, next_begin - line_begin)});

        if (!line.empty()) {
            if (!boost::algorithm::starts_with(line, "package ")) {
                return std::nullopt;
            }

            std::string result{source.substr(0, line_begin)};
            result += source.substr(next_begin);
            return result;
        }

        line_begin = next_begin;
    }

    return std::nullopt;
}

Expected<std::vector<std::string>, std::string>
BytecodeAdapter::strip_package_declarations(const std::filesystem::path& dir) {
    FileSearcher searcher{R"(.*`ext`)", {{"ext", FileSearcher::escape(traits_of(LanguageKind::Bytecode).source_ext)}}};

    auto files = searcher.search(dir);

    if (!files) {
        return fmt::format("Error listing {}: {}", dir.string(), files.error().message());
    }

    std::vector<std::string> changed;

    for (const std::filesystem::path& file : *files) {
        std::string contents = TRY(read_text_file(file));

        auto stripped = strip_package_declaration(contents);

        if (!stripped) {
            continue;
        }

        std::ofstream out{file, std::ios::trunc};
        out << *stripped;

        if (!out) {
            return fmt::format("Error rewriting {}", file.string());
        }

        LOG_DEBUG("Removed package declaration from {}", file.string());
        changed.push_back(file.filename().string());
    }

    return changed;
}

RunOutcome BytecodeAdapter::compile_and_run(const std::filesystem::path& test_file,
                                            const std::filesystem::path& working_dir) const {
    if (auto stripped = strip_package_declarations(working_dir); !stripped) {
        return RunOutcome::make(RunOutcome::Status::Error, fmt::format("ERROR - {}", stripped.error()));
    }

    if (auto failure = check_compile("javac", {test_file.filename().string()}, working_dir)) {
        return *failure;
    }

    auto res = run_tool("java", {test_file.stem().string()}, working_dir);

    if (!res) {
        return res.error();
    }

    if (!res->result.succeeded()) {
        return {.status = RunOutcome::Status::RuntimeError,
                .output = fmt::format("FAILED - Runtime error: {}", res->stderr_str)};
    }

    return {.status = RunOutcome::Status::Success, .output = res->stdout_str};
}

} // namespace polygrader
