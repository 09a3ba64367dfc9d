#include "catch2_custom.hpp"

#include "adapters/bytecode_adapter.hpp"
#include "adapters/language_adapter.hpp"
#include "adapters/managed_il_adapter.hpp"
#include "adapters/native_adapter.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using polygrader::BytecodeAdapter;
using polygrader::LanguageAdapter;
using polygrader::ManagedIlAdapter;
using polygrader::NativeAdapter;
using polygrader::RunOutcome;

TEST_CASE("Absolute paths are redacted from compiler output") {
    REQUIRE(LanguageAdapter::redact_paths(
                "/home/grader/output/submissions/jsmith/temp_test/cpp/test_1/LinkedList.h:12:5: error: expected ';'") ==
            "LinkedList.h:12:5: error: expected ';'");

    REQUIRE(LanguageAdapter::redact_paths("In file included from /tmp/x/TestCorrectness.cpp:1:") ==
            "In file included from TestCorrectness.cpp:1:");

    REQUIRE(LanguageAdapter::redact_paths("relative/Node.java:3: error") == "relative/Node.java:3: error");
}

TEST_CASE("Strip Java package declarations") {
    REQUIRE(BytecodeAdapter::strip_package_declaration("package edu.school.lists;\npublic class Node {}\n") ==
            "public class Node {}\n");

    REQUIRE(BytecodeAdapter::strip_package_declaration("\n   package lists;   \n\nclass A {}") == "\n\nclass A {}");

    REQUIRE_FALSE(BytecodeAdapter::strip_package_declaration("import java.util.*;\npackage lists;\n"));
    REQUIRE_FALSE(BytecodeAdapter::strip_package_declaration("// package lists;\nclass A {}"));
    REQUIRE_FALSE(BytecodeAdapter::strip_package_declaration(""));
}

TEST_CASE("Strip package declarations from every Java file in a sandbox") {
    TempDir dir;
    write_file(dir / "Node.java", "package lists;\nclass Node {}\n");
    write_file(dir / "LinkedList.java", "class LinkedList {}\n");
    write_file(dir / "notes.txt", "package lists;\n");

    auto changed = BytecodeAdapter::strip_package_declarations(dir.path());

    REQUIRE(changed);
    REQUIRE(*changed == std::vector<std::string>{"Node.java"});
    REQUIRE(read_file(dir / "Node.java") == "class Node {}\n");
    REQUIRE(read_file(dir / "LinkedList.java") == "class LinkedList {}\n");
    REQUIRE(read_file(dir / "notes.txt") == "package lists;\n");
}

TEST_CASE("Prepare a C# harness and project") {
    TempDir dir;

    SECTION("using System is added once") {
        write_file(dir / "TestCorrectness.cs", "class Program {}\n");

        REQUIRE(ManagedIlAdapter::ensure_system_using(dir / "TestCorrectness.cs"));
        REQUIRE(ManagedIlAdapter::ensure_system_using(dir / "TestCorrectness.cs"));

        REQUIRE(read_file(dir / "TestCorrectness.cs") == "using System;\nclass Program {}\n");
    }

    SECTION("Existing using directives are kept as-is") {
        write_file(dir / "TestCorrectness.cs", "using System;\nusing System.Linq;\nclass Program {}\n");

        REQUIRE(ManagedIlAdapter::ensure_system_using(dir / "TestCorrectness.cs"));

        REQUIRE(read_file(dir / "TestCorrectness.cs") == "using System;\nusing System.Linq;\nclass Program {}\n");
    }

    SECTION("A missing harness is an error") {
        REQUIRE_FALSE(ManagedIlAdapter::ensure_system_using(dir / "TestCorrectness.cs"));
    }

    SECTION("Project file") {
        REQUIRE(ManagedIlAdapter::write_project_file(dir / ManagedIlAdapter::PROJECT_FILE_NAME));

        std::string project = read_file(dir / ManagedIlAdapter::PROJECT_FILE_NAME);
        REQUIRE_THAT(project, Catch::Matchers::ContainsSubstring("<OutputType>Exe</OutputType>"));
        REQUIRE_THAT(project, Catch::Matchers::ContainsSubstring("<TargetFramework>"));
    }
}

TEST_CASE("Compile and run C++ harnesses") {
    NativeAdapter adapter{60s};

    if (!adapter.probe_toolchain()) {
        SKIP("g++ is not installed");
    }

    TempDir dir;
    write_file(dir / "Counter.h", "inline int twice(int x) { return 2 * x; }\n");

    SECTION("Successful run") {
        write_file(dir / "TestCorrectness.cpp", R"(#include <cstdio>
#include "Counter.h"
int main() { std::printf("twice(21) = %d\n", twice(21)); }
)");

        RunOutcome outcome = adapter.compile_and_run(dir / "TestCorrectness.cpp", dir.path());

        REQUIRE(outcome.status == RunOutcome::Status::Success);
        REQUIRE(outcome.output == "twice(21) = 42\n");
        REQUIRE(std::filesystem::exists(dir / NativeAdapter::EXECUTABLE_NAME));
    }

    SECTION("Non-zero exit codes are still a completed run") {
        write_file(dir / "TestCorrectness.cpp", R"(#include <cstdio>
int main() { std::puts("partial"); return 3; }
)");

        RunOutcome outcome = adapter.compile_and_run(dir / "TestCorrectness.cpp", dir.path());

        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.output == "partial\n");
    }

    SECTION("Compilation errors are reported without absolute paths") {
        write_file(dir / "TestCorrectness.cpp", R"(#include "Counter.h"
int main() { return twice(; }
)");

        RunOutcome outcome = adapter.compile_and_run(dir / "TestCorrectness.cpp", dir.path());

        REQUIRE(outcome.status == RunOutcome::Status::CompileError);
        REQUIRE_THAT(outcome.output, Catch::Matchers::StartsWith("FAILED - Compilation Error\n"));
        REQUIRE_THAT(outcome.output, Catch::Matchers::ContainsSubstring("TestCorrectness.cpp"));
        REQUIRE_THAT(outcome.output, !Catch::Matchers::ContainsSubstring(dir.path().string()));
    }
}

TEST_CASE("Runaway output fails the run without a retry") {
    NativeAdapter adapter{60s, 65536};

    if (!adapter.probe_toolchain()) {
        SKIP("g++ is not installed");
    }

    TempDir dir;
    write_file(dir / "TestCorrectness.cpp", R"(#include <cstdio>
int main() { for (;;) std::puts("again"); }
)");

    RunOutcome outcome = adapter.compile_and_run(dir / "TestCorrectness.cpp", dir.path());

    REQUIRE(outcome.status == RunOutcome::Status::RuntimeError);
    REQUIRE(outcome.output == LanguageAdapter::OUTPUT_LIMIT_MESSAGE);
    REQUIRE_FALSE(outcome.timed_out());
}
