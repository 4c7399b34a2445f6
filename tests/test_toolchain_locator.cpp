// test_toolchain_locator.cpp - Tests for ToolchainLocator and the backends
// Part of cellbuild - native compiler task engine

#include "toolchain/toolchain_locator.hpp"
#include "toolchain/gcc_backend.hpp"
#include "toolchain/msvc_backend.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace cellbuild;

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

// =============================================================================
// Test Fixtures
// =============================================================================

class TestFixture {
public:
    fs::path test_dir;
    fs::path vs14_root;
    fs::path gcc_bin;
    fs::path gcc_root;

    TestFixture() {
        test_dir = fs::temp_directory_path() /
                   ("cellbuild_locator_test_" + std::to_string(getpid()));

        // Fake Visual Studio 2015 layout
        vs14_root = test_dir / "VS14";
        fs::create_directories(vs14_root / "Common7" / "Tools");
        fs::create_directories(vs14_root / "VC" / "bin");
        touch(vs14_root / "VC" / "bin" / "cl.exe");

        // Fake VS 2013 without a compiler
        fs::create_directories(test_dir / "VS12" / "Common7" / "Tools");

        // g++-12 on a PATH directory
        gcc_bin = test_dir / "path_bin";
        fs::create_directories(gcc_bin);
        touch(gcc_bin / "g++-12");

        // GCC 13 install prefix with an unversioned driver
        gcc_root = test_dir / "gcc13";
        fs::create_directories(gcc_root / "bin");
        touch(gcc_root / "bin" / "g++");
    }

    ~TestFixture() {
        // Cleanup
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    static void touch(const fs::path& p) {
        std::ofstream out(p);
        out << "#!/bin/sh\n";
    }
};

static std::unique_ptr<TestFixture> fixture;

// =============================================================================
// Discovery Tests
// =============================================================================

void test_empty_environment_empty_registry() {
    MsvcBackend msvc;
    GccBackend gcc;

    ASSERT(ToolchainLocator(msvc).discover(EnvironmentSnapshot()).empty());
    ASSERT(ToolchainLocator(gcc).discover(EnvironmentSnapshot()).empty());
}

void test_msvc_probe() {
    MsvcBackend msvc;
    EnvironmentSnapshot env({
        {"VS140COMNTOOLS", (fixture->vs14_root / "Common7" / "Tools").string() + "/"},
        {"VS120COMNTOOLS", (fixture->test_dir / "VS12" / "Common7" / "Tools").string()},
        {"VS110COMNTOOLS", (fixture->test_dir / "VS11" / "Common7" / "Tools").string()},
    });

    ToolchainRegistry registry = ToolchainLocator(msvc).discover(env);
    ASSERT_EQ(registry.size(), 1u);
    ASSERT(registry.count(ToolchainVersion(14)) == 1);
    ASSERT_EQ(registry[ToolchainVersion(14)], (fixture->vs14_root / "VC" / "bin").string());
}

void test_msvc_probe_backslashes() {
    MsvcBackend msvc;
    std::string tools = (fixture->vs14_root / "Common7" / "Tools").string();
    std::replace(tools.begin(), tools.end(), '/', '\\');

    EnvironmentSnapshot env(EnvironmentSnapshot::Assignments{{"vs140comntools", tools + "\\"}});
    auto registry = ToolchainLocator(msvc).discover({MsvcBackend::V14}, env);
    ASSERT_EQ(registry.size(), 1u);
}

void test_candidates_limit_discovery() {
    MsvcBackend msvc;
    EnvironmentSnapshot env({
        {"VS140COMNTOOLS", (fixture->vs14_root / "Common7" / "Tools").string()},
    });
    ASSERT(ToolchainLocator(msvc).discover({MsvcBackend::V12}, env).empty());
}

void test_gcc_path_probe() {
    GccBackend gcc;
    EnvironmentSnapshot env(EnvironmentSnapshot::Assignments{{"PATH", "/nonexistent:" + fixture->gcc_bin.string()}});

    auto registry = ToolchainLocator(gcc).discover(env);
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_EQ(registry.begin()->first, ToolchainVersion(12));
    ASSERT_EQ(registry.begin()->second, fixture->gcc_bin.string());
}

void test_gcc_root_probe() {
    GccBackend gcc;
    EnvironmentSnapshot env(EnvironmentSnapshot::Assignments{{"GCC13_ROOT", fixture->gcc_root.string()}});

    auto registry = ToolchainLocator(gcc).discover(env);
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_EQ(registry[ToolchainVersion(13)], (fixture->gcc_root / "bin").string());

    ToolLocation cc = gcc.compiler(ToolchainVersion(13), registry[ToolchainVersion(13)]);
    ASSERT_EQ(cc.executable, "g++");
}

void test_discovery_deterministic() {
    GccBackend gcc;
    EnvironmentSnapshot env({
        {"PATH", fixture->gcc_bin.string()},
        {"GCC13_ROOT", fixture->gcc_root.string()},
    });
    ToolchainLocator locator(gcc);
    ASSERT(locator.discover(env) == locator.discover(env));
    ASSERT_EQ(locator.discover(env).size(), 2u);
}

// =============================================================================
// Backend Tests
// =============================================================================

void test_supported_versions() {
    MsvcBackend msvc;
    GccBackend gcc;
    auto vs = msvc.supported_versions();
    ASSERT_EQ(vs.size(), 3u);
    ASSERT_EQ(vs.front(), MsvcBackend::V11);
    ASSERT_EQ(MsvcBackend::tools_variable(MsvcBackend::V14), "VS140COMNTOOLS");
    ASSERT_EQ(gcc.supported_versions().size(), 6u);
}

void test_make_backend() {
    ASSERT_EQ(make_backend("MSVC")->name(), "msvc");
    ASSERT_EQ(make_backend("gcc")->name(), "gcc");

    bool thrown = false;
    try {
        make_backend("borland");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    ASSERT(thrown);
}

void test_msvc_command_layout() {
    MsvcBackend msvc;

    CompileStep step;
    step.compiler_flags = {"/Od"};
    step.sources = {"C:/src/a.cpp"};
    step.linker_flags = {"/MACHINE:x86"};
    step.output = "C:/out/demo.dll";
    auto args = msvc.compile_arguments(step);

    std::vector<std::string> expected = {"/Od", "C:/src/a.cpp", "/link", "/MACHINE:x86",
                                         "/OUT:C:/out/demo.dll"};
    ASSERT(args == expected);

    step.merged_link = false;
    ASSERT_EQ(msvc.compile_arguments(step).size(), 2u);

    ArchiveStep archive;
    archive.output = "C:/out/demo.lib";
    archive.objects = {"a.obj"};
    archive.library_paths = {"C:/lib"};
    archive.architecture = Architecture::X64;
    std::vector<std::string> archive_expected = {"/OUT:C:/out/demo.lib", "/MACHINE:x64",
                                                 "/LIBPATH:C:/lib", "a.obj"};
    ASSERT(msvc.archive_arguments(archive) == archive_expected);
}

void test_gcc_command_layout() {
    GccBackend gcc;

    CompileStep step;
    step.compiler_flags = {"-O2"};
    step.sources = {"/src/a.cpp"};
    step.linker_flags = {"-m64", "-L/lib", "-lz"};
    step.output = "/out/demo";
    std::vector<std::string> expected = {"-O2", "/src/a.cpp", "-m64", "-L/lib", "-lz",
                                         "-o", "/out/demo"};
    ASSERT(gcc.compile_arguments(step) == expected);

    ArchiveStep archive;
    archive.output = "/out/libdemo.a";
    archive.objects = {"/obj/a.o", "/obj/b.o"};
    std::vector<std::string> archive_expected = {"rcs", "/out/libdemo.a", "/obj/a.o",
                                                 "/obj/b.o"};
    ASSERT(gcc.archive_arguments(archive) == archive_expected);

    ASSERT_EQ(gcc.library_flags("z")[0], "-lz");
    ASSERT_EQ(gcc.library_flags("/opt/lib/libq.a")[0], "/opt/lib/libq.a");
    ASSERT_EQ(gcc.extension(AssemblyType::SHARED_LIBRARY), ".so");
    ASSERT_EQ(gcc.extension(AssemblyType::EXECUTABLE), "");
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== ToolchainLocator Test Suite ===\n\n";

    // Setup
    fixture = std::make_unique<TestFixture>();

    std::cout << "Discovery Tests:\n";
    TEST(empty_environment_empty_registry);
    TEST(msvc_probe);
    TEST(msvc_probe_backslashes);
    TEST(candidates_limit_discovery);
    TEST(gcc_path_probe);
    TEST(gcc_root_probe);
    TEST(discovery_deterministic);

    std::cout << "\nBackend Tests:\n";
    TEST(supported_versions);
    TEST(make_backend);
    TEST(msvc_command_layout);
    TEST(gcc_command_layout);

    // Cleanup
    fixture.reset();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
