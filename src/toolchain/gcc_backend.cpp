/**
 * gcc_backend.cpp
 * GCC flag spelling and detection
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "toolchain/gcc_backend.hpp"
#include "util/file_utils.hpp"

#include <filesystem>

namespace cellbuild {

namespace fs = std::filesystem;

namespace {

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<ToolchainVersion> GccBackend::supported_versions() const {
    std::vector<ToolchainVersion> versions;
    for (int major = OLDEST_MAJOR; major <= NEWEST_MAJOR; ++major) {
        versions.emplace_back(major);
    }
    return versions;
}

std::string GccBackend::versioned_driver(const ToolchainVersion& version) {
    return "g++-" + std::to_string(version.major_version);
}

std::optional<std::string> GccBackend::probe(const ToolchainVersion& version,
                                             const EnvironmentSnapshot& environment) const {
    const std::string driver = versioned_driver(version);

    // Explicit install prefix wins over PATH
    auto root = environment.get("GCC" + std::to_string(version.major_version) + "_ROOT");
    if (root && !root->empty()) {
        fs::path bin = fs::path(util::to_host_path(*root)) / "bin";
        if (is_file(bin / driver) || is_file(bin / "g++")) {
            return bin.string();
        }
        return std::nullopt;
    }

    for (const auto& dir : environment.path_entries()) {
        fs::path candidate = fs::path(util::to_host_path(dir)) / driver;
        if (is_file(candidate)) {
            return candidate.parent_path().string();
        }
    }
    return std::nullopt;
}

ShellCommand GccBackend::environment_setup_command(const std::string& install_path,
                                                   Architecture) const {
    ShellCommand cmd;
    cmd.executable = "/bin/sh";
    // The install path travels as $1 so the shell never parses it
    cmd.args = {"-c", "PATH=\"$1:$PATH\"; export PATH; env", "sh", install_path};
    return cmd;
}

ToolLocation GccBackend::compiler(const ToolchainVersion& version,
                                  const std::string& install_path) const {
    std::string driver = versioned_driver(version);
    if (!install_path.empty() && !is_file(fs::path(install_path) / driver)) {
        driver = "g++";
    }
    return {driver, install_path};
}

ToolLocation GccBackend::archiver(const ToolchainVersion&, const std::string&) const {
    return {"ar", ""};
}

std::vector<std::string> GccBackend::configuration_flags(BuildConfiguration config) const {
    if (config == BuildConfiguration::DEBUG) {
        return {"-O0", "-g", "-D_DEBUG"};
    }
    if (config == BuildConfiguration::RELEASE) {
        return {"-O2", "-DNDEBUG"};
    }
    return {};
}

// g++ writes objects into its working directory, which is the cell directory
std::vector<std::string> GccBackend::intermediate_output_flags(const std::string&) const {
    return {};
}

std::vector<std::string> GccBackend::include_flags(const std::string& dir) const {
    return {"-I" + dir};
}

std::vector<std::string> GccBackend::architecture_compiler_flags(Architecture arch) const {
    if (arch == Architecture::X86) return {"-m32"};
    if (arch == Architecture::X64) return {"-m64"};
    return {};
}

std::vector<std::string> GccBackend::architecture_linker_flags(Architecture arch) const {
    return architecture_compiler_flags(arch);
}

std::vector<std::string> GccBackend::library_path_flags(const std::string& dir) const {
    return {"-L" + dir};
}

std::vector<std::string> GccBackend::library_flags(const std::string& library) const {
    // Paths and archive files go on the command line as-is, bare names use -l
    if (util::has_directory_component(library) || has_suffix(library, ".a") ||
        has_suffix(library, ".so")) {
        return {library};
    }
    return {"-l" + library};
}

std::vector<std::string> GccBackend::shared_library_compiler_flags() const {
    return {"-fPIC"};
}

std::vector<std::string> GccBackend::shared_library_linker_flags() const {
    return {"-shared"};
}

std::string GccBackend::extension(AssemblyType type) const {
    switch (type) {
        case AssemblyType::SHARED_LIBRARY: return ".so";
        case AssemblyType::STATIC_LIBRARY: return ".a";
        case AssemblyType::EXECUTABLE:     return "";
        case AssemblyType::UNSPECIFIED:    break;
    }
    return "";
}

std::vector<std::string> GccBackend::compile_arguments(const CompileStep& step) const {
    std::vector<std::string> args = step.compiler_flags;
    args.insert(args.end(), step.sources.begin(), step.sources.end());

    if (step.merged_link) {
        args.insert(args.end(), step.linker_flags.begin(), step.linker_flags.end());
        args.push_back("-o");
        args.push_back(step.output);
    }
    return args;
}

std::vector<std::string> GccBackend::archive_arguments(const ArchiveStep& step) const {
    std::vector<std::string> args = {"rcs", step.output};
    args.insert(args.end(), step.objects.begin(), step.objects.end());
    return args;
}

} // namespace cellbuild
