// test_compiler_task_config.cpp - Tests for CompilerTaskConfig and path helpers
// Part of cellbuild - native compiler task engine

#include "config/compiler_task_config.hpp"
#include "core/build_types.hpp"
#include "util/file_utils.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace cellbuild;
using Reason = ConfigurationError::Reason;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { \
        tests_run++; \
        std::cout << "  Testing: " << #name << "... "; \
        try { \
            test_##name(); \
            tests_passed++; \
            std::cout << "PASS\n"; \
        } catch (const std::exception& e) { \
            std::cout << "FAIL: " << e.what() << "\n"; \
        } \
    } while(0)

#define ASSERT(cond) \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    }

// Runs `stmt`, which must throw ConfigurationError with `expected` reason
#define ASSERT_CONFIG_ERROR(stmt, expected) \
    do { \
        bool thrown = false; \
        try { \
            stmt; \
        } catch (const ConfigurationError& e) { \
            thrown = true; \
            if (e.reason() != (expected)) { \
                throw std::runtime_error(std::string("Wrong reason: ") + \
                                         reason_to_string(e.reason())); \
            } \
        } \
        if (!thrown) { \
            throw std::runtime_error("Expected ConfigurationError from: " #stmt); \
        } \
    } while(0)

// =============================================================================
// Test Fixtures
// =============================================================================

class TestFixture {
public:
    fs::path test_dir;

    TestFixture() {
        test_dir = fs::temp_directory_path() /
                   ("cellbuild_config_test_" + std::to_string(getpid()));
        fs::create_directories(test_dir / "include");
        fs::create_directories(test_dir / "lib");
        fs::create_directories(test_dir / "src");

        write(test_dir / "src" / "main.cpp", "int main() { return 0; }\n");
        write(test_dir / "lib" / "libfoo.a", "!<arch>\n");
        write(test_dir / "plain.txt", "not a directory\n");
    }

    ~TestFixture() {
        // Cleanup
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    static void write(const fs::path& p, const std::string& content) {
        std::ofstream out(p);
        out << content;
    }
};

static std::unique_ptr<TestFixture> fixture;

// =============================================================================
// Path Helper Tests
// =============================================================================

void test_to_host_path() {
    ASSERT_EQ(util::to_host_path("C:\\tools\\\\vc\\"), "C:/tools/vc");
    ASSERT_EQ(util::to_host_path("/usr//lib/"), "/usr/lib");
    ASSERT_EQ(util::to_host_path("/"), "/");
    ASSERT_EQ(util::to_host_path(""), "");
}

void test_invalid_characters() {
    ASSERT(util::contains_invalid_path_characters("a|b"));
    ASSERT(util::contains_invalid_path_characters(std::string("a\tb")));
    ASSERT(!util::contains_invalid_path_characters("/usr/include"));
    ASSERT(util::contains_invalid_file_name_characters("dir/name"));
    ASSERT(util::contains_invalid_file_name_characters("what?"));
    ASSERT(!util::contains_invalid_file_name_characters("libdemo"));
}

void test_copy_directory_filter() {
    fs::path src = fixture->test_dir / "copy_src";
    fs::path dst = fixture->test_dir / "copy_dst";
    fs::create_directories(src / "nested");
    TestFixture::write(src / "a.h", "");
    TestFixture::write(src / "a.CPP", "");
    TestFixture::write(src / "nested" / "b.hpp", "");
    TestFixture::write(src / "nested" / "b.c", "");

    util::CopyFilter filter;
    filter.excluded = {".c", ".cpp", ".cxx"};

    size_t copied = util::copy_directory(src, dst, true, true, filter);
    ASSERT_EQ(copied, 2u);
    ASSERT(fs::exists(dst / "a.h"));
    ASSERT(!fs::exists(dst / "a.CPP"));
    ASSERT(fs::exists(dst / "nested" / "b.hpp"));
    ASSERT(!fs::exists(dst / "nested" / "b.c"));

    bool thrown = false;
    try {
        util::copy_directory(fixture->test_dir / "nope", dst, true);
    } catch (const fs::filesystem_error&) {
        thrown = true;
    }
    ASSERT(thrown);
}

void test_copy_directory_skips_nested_destination() {
    fs::path root = fixture->test_dir / "nested_copy";
    fs::create_directories(root / "api");
    fs::create_directories(root / "out");
    TestFixture::write(root / "top.h", "");
    TestFixture::write(root / "api" / "api.h", "");

    fs::path dst = root / "out" / "include";
    size_t first = util::copy_directory(root, dst, true);
    size_t second = util::copy_directory(root, dst, true);

    ASSERT_EQ(first, 2u);
    ASSERT_EQ(second, 2u);
    ASSERT(fs::exists(dst / "top.h"));
    ASSERT(fs::exists(dst / "api" / "api.h"));
    ASSERT(!fs::exists(dst / "out" / "include"));

    // Copying the destination onto itself is a no-op
    ASSERT_EQ(util::copy_directory(dst, dst, true), 0u);
}

// =============================================================================
// Strict Path Tests
// =============================================================================

void test_strict_missing_include_keeps_previous() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);

    std::string good = (fixture->test_dir / "include").string();
    config.set_include_paths({good});

    ASSERT_CONFIG_ERROR(
        config.set_include_paths({good, (fixture->test_dir / "missing").string()}),
        Reason::MISSING);

    auto paths = config.include_paths();
    ASSERT_EQ(paths.size(), 1u);
    ASSERT_EQ(paths[0], good);
}

void test_strict_include_not_directory() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(
        config.set_include_paths({(fixture->test_dir / "plain.txt").string()}),
        Reason::NOT_A_DIRECTORY);
    ASSERT(config.include_paths().empty());
}

void test_strict_include_illegal_characters() {
    fs::path odd = fixture->test_dir / "bad|dir";
    fs::create_directories(odd);

    CompilerTaskConfig config;
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(config.set_include_paths({odd.string()}),
                        Reason::ILLEGAL_CHARACTERS);
}

void test_lenient_accepts_missing() {
    CompilerTaskConfig config;
    config.set_include_paths({"/definitely/not/here"});
    config.set_output_directory("/also/not/here");
    ASSERT_EQ(config.include_paths().size(), 1u);
    ASSERT_EQ(config.output_directory(), "/also/not/here");
}

void test_strict_output_directory_missing() {
    CompilerTaskConfig config;
    config.set_output_directory("/previous");
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(
        config.set_output_directory((fixture->test_dir / "out_missing").string()),
        Reason::MISSING);
    ASSERT_EQ(config.output_directory(), "/previous");
}

void test_strict_working_directory_missing() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(
        config.set_working_directory((fixture->test_dir / "nowhere").string()),
        Reason::MISSING);
    ASSERT(config.working_directory().empty());
}

void test_strict_relative_paths_use_working_directory() {
    fs::path previous = fs::current_path();
    fs::current_path("/");

    CompilerTaskConfig config;
    config.set_strict_paths(true);
    config.set_working_directory(fixture->test_dir.string());

    bool accepted = true;
    try {
        config.set_include_paths({"include"});
        config.set_library_paths({"lib"});
        config.set_additional_libraries({"lib/libfoo.a", "libfoo.a"});
    } catch (const ConfigurationError&) {
        accepted = false;
    }

    // A directory that exists only relative to the process must not count
    fs::current_path(fixture->test_dir / "src");
    fs::create_directories(fixture->test_dir / "src" / "only_here");
    bool rejected = false;
    try {
        config.set_include_paths({"only_here"});
    } catch (const ConfigurationError& e) {
        rejected = e.reason() == Reason::MISSING;
    }
    fs::current_path(previous);

    ASSERT(accepted);
    ASSERT_EQ(config.include_paths()[0], "include");
    ASSERT_EQ(config.library_paths()[0], "lib");
    ASSERT_EQ(config.additional_libraries().size(), 2u);
    ASSERT(rejected);
}

// =============================================================================
// Intermediary Directory Tests
// =============================================================================

void test_intermediary_rejects_relative_lenient() {
    CompilerTaskConfig config;
    ASSERT_CONFIG_ERROR(config.set_intermediary_directory("obj/intermediate"),
                        Reason::NOT_ABSOLUTE);
    ASSERT(config.intermediary_directory().empty());
}

void test_intermediary_rejects_relative_strict() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(config.set_intermediary_directory("obj"), Reason::NOT_ABSOLUTE);
    ASSERT_CONFIG_ERROR(config.set_intermediary_directory(""), Reason::NOT_ABSOLUTE);
}

void test_intermediary_rejects_root() {
    CompilerTaskConfig config;
    ASSERT_CONFIG_ERROR(config.set_intermediary_directory("/"), Reason::ROOT_PATH);
    ASSERT_CONFIG_ERROR(config.set_intermediary_directory("/tmp/.."), Reason::ROOT_PATH);
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(config.set_intermediary_directory("//"), Reason::ROOT_PATH);
    ASSERT(config.intermediary_directory().empty());
}

void test_intermediary_absolute() {
    CompilerTaskConfig config;
    config.set_intermediary_directory("/not/yet/created/obj");
    ASSERT_EQ(config.intermediary_directory(), "/not/yet/created/obj");

    config.set_strict_paths(true);
    std::string obj = (fixture->test_dir / "obj").string();
    config.set_intermediary_directory(obj);
    ASSERT_EQ(config.intermediary_directory(), obj);

    ASSERT_CONFIG_ERROR(
        config.set_intermediary_directory((fixture->test_dir / "a" / "b").string()),
        Reason::MISSING_PARENT);
    ASSERT_EQ(config.intermediary_directory(), obj);
}

// =============================================================================
// Source and Library Tests
// =============================================================================

void test_strict_bare_source_without_working_directory() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(config.set_sources({"main.cpp"}), Reason::RELATIVE_WITHOUT_BASE);
}

void test_strict_sources_against_working_directory() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);
    config.set_working_directory((fixture->test_dir / "src").string());
    config.set_sources({"main.cpp"});
    ASSERT_EQ(config.sources().size(), 1u);

    config.set_working_directory(fixture->test_dir.string());
    config.set_sources({"src/main.cpp"});
    ASSERT_EQ(config.sources()[0], "src/main.cpp");

    ASSERT_CONFIG_ERROR(config.set_sources({"src/other.cpp"}), Reason::MISSING);
    ASSERT_EQ(config.sources()[0], "src/main.cpp");
}

void test_strict_library_search() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);

    ASSERT_CONFIG_ERROR(config.set_additional_libraries({"libfoo.a"}),
                        Reason::RELATIVE_WITHOUT_BASE);

    config.set_library_paths({(fixture->test_dir / "lib").string()});
    config.set_additional_libraries({"libfoo.a"});
    ASSERT_EQ(config.additional_libraries().size(), 1u);

    ASSERT_CONFIG_ERROR(config.set_additional_libraries({"libbar.a"}),
                        Reason::NOT_FOUND_IN_SEARCH_PATHS);
    ASSERT_EQ(config.additional_libraries()[0], "libfoo.a");
}

void test_strict_output_file_name() {
    CompilerTaskConfig config;
    config.set_strict_paths(true);
    ASSERT_CONFIG_ERROR(config.set_output_file_name(""), Reason::EMPTY);
    ASSERT_CONFIG_ERROR(config.set_output_file_name("sub/demo"), Reason::ILLEGAL_CHARACTERS);
    config.set_output_file_name("demo");
    ASSERT_EQ(config.output_file_name(), "demo");
}

// =============================================================================
// Value Semantics Tests
// =============================================================================

void test_flags_clone_on_read() {
    CompilerTaskConfig config;
    config.set_compiler_flags({"-Wall"});

    auto flags = config.compiler_flags();
    flags.push_back("-m64");

    ASSERT_EQ(config.compiler_flags().size(), 1u);
    ASSERT_EQ(config.compiler_flags()[0], "-Wall");
}

void test_paths_normalized() {
    CompilerTaskConfig config;
    config.set_include_paths({"C:\\sdk\\\\include\\"});
    ASSERT_EQ(config.include_paths()[0], "C:/sdk/include");
}

void test_missing_requirements() {
    CompilerTaskConfig config;
    ASSERT_EQ(config.missing_requirements().size(), 4u);

    config.set_output_directory("/out");
    config.set_output_file_name("demo");
    config.set_sources({"/src/a.cpp"});
    ASSERT_EQ(config.missing_requirements().size(), 1u);

    config.set_output_assembly_type(AssemblyType::EXECUTABLE);
    ASSERT(config.missing_requirements().empty());
}

// =============================================================================
// Build Type Tests
// =============================================================================

void test_flag_sets() {
    Architecture both = Architecture::X86 | Architecture::X64;
    ASSERT_EQ(flag_count(both), 2u);
    ASSERT_EQ(flag_count(Architecture::NONE), 0u);
    ASSERT(has_flag(both, Architecture::X64));
    ASSERT_EQ(to_string(both), "x86|x64");
    ASSERT_EQ(to_string(BuildConfiguration::RELEASE), "Release");
    ASSERT(parse_architecture("AMD64") == Architecture::X64);
    ASSERT(!parse_configuration("Profile"));
}

void test_toolchain_version() {
    auto v = parse_toolchain_version("v14");
    ASSERT(v.has_value());
    ASSERT_EQ(*v, ToolchainVersion(14));
    ASSERT_EQ(parse_toolchain_version("14.1")->to_string(), "14.1");
    ASSERT(ToolchainVersion(12) < ToolchainVersion(14));
    ASSERT(ToolchainVersion(14) < ToolchainVersion(14, 1));
    ASSERT(!parse_toolchain_version("latest"));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== CompilerTaskConfig Test Suite ===\n\n";

    // Setup
    fixture = std::make_unique<TestFixture>();

    std::cout << "Path Helper Tests:\n";
    TEST(to_host_path);
    TEST(invalid_characters);
    TEST(copy_directory_filter);
    TEST(copy_directory_skips_nested_destination);

    std::cout << "\nStrict Path Tests:\n";
    TEST(strict_missing_include_keeps_previous);
    TEST(strict_include_not_directory);
    TEST(strict_include_illegal_characters);
    TEST(lenient_accepts_missing);
    TEST(strict_output_directory_missing);
    TEST(strict_working_directory_missing);
    TEST(strict_relative_paths_use_working_directory);

    std::cout << "\nIntermediary Directory Tests:\n";
    TEST(intermediary_rejects_relative_lenient);
    TEST(intermediary_rejects_relative_strict);
    TEST(intermediary_rejects_root);
    TEST(intermediary_absolute);

    std::cout << "\nSource and Library Tests:\n";
    TEST(strict_bare_source_without_working_directory);
    TEST(strict_sources_against_working_directory);
    TEST(strict_library_search);
    TEST(strict_output_file_name);

    std::cout << "\nValue Semantics Tests:\n";
    TEST(flags_clone_on_read);
    TEST(paths_normalized);
    TEST(missing_requirements);

    std::cout << "\nBuild Type Tests:\n";
    TEST(flag_sets);
    TEST(toolchain_version);

    // Cleanup
    fixture.reset();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
