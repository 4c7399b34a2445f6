/**
 * msvc_backend.cpp
 * Microsoft Visual C++ flag spelling and detection
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "toolchain/msvc_backend.hpp"
#include "util/file_utils.hpp"

#include <filesystem>

namespace cellbuild {

namespace fs = std::filesystem;

std::vector<ToolchainVersion> MsvcBackend::supported_versions() const {
    return {V11, V12, V14};
}

std::string MsvcBackend::tools_variable(const ToolchainVersion& version) {
    return "VS" + std::to_string(version.major_version) +
           std::to_string(version.minor_version) + "COMNTOOLS";
}

std::optional<std::string> MsvcBackend::probe(const ToolchainVersion& version,
                                              const EnvironmentSnapshot& environment) const {
    auto tools = environment.get(tools_variable(version));
    if (!tools || tools->empty()) return std::nullopt;

    // "<root>\Common7\Tools\" -> "<root>"
    std::string path = util::to_host_path(*tools);
    std::string root = path;
    auto common = path.find("/Common7");
    if (common != std::string::npos) {
        root = path.substr(0, common);
    }
    if (root.empty()) return std::nullopt;

    fs::path bin = fs::path(root) / "VC" / "bin";
    std::error_code ec;
    if (!fs::is_regular_file(bin / "cl.exe", ec)) return std::nullopt;

    return bin.string();
}

ShellCommand MsvcBackend::environment_setup_command(const std::string& install_path,
                                                    Architecture arch) const {
    // vcvarsall.bat sits in VC\, one level above VC\bin
    fs::path vc = fs::path(util::to_host_path(install_path)).parent_path();
    std::string script = (vc / "vcvarsall.bat").string();

    ShellCommand cmd;
    cmd.executable = "cmd.exe";
    cmd.args = {"/C", "call \"" + script + "\" " + to_string(arch) + " && SET"};
    return cmd;
}

// cl.exe and lib.exe come from the captured PATH
ToolLocation MsvcBackend::compiler(const ToolchainVersion&, const std::string&) const {
    return {"cl.exe", ""};
}

ToolLocation MsvcBackend::archiver(const ToolchainVersion&, const std::string&) const {
    return {"lib.exe", ""};
}

std::vector<std::string> MsvcBackend::configuration_flags(BuildConfiguration config) const {
    if (config == BuildConfiguration::DEBUG) {
        return {"/Od", "/Zi", "/MDd", "/D_DEBUG"};
    }
    if (config == BuildConfiguration::RELEASE) {
        return {"/O2", "/MD", "/DNDEBUG"};
    }
    return {};
}

std::vector<std::string> MsvcBackend::intermediate_output_flags(const std::string& dir) const {
    // Trailing separator makes /Fo name a directory
    return {"/Fo" + dir + "/"};
}

std::vector<std::string> MsvcBackend::include_flags(const std::string& dir) const {
    return {"/I" + dir};
}

std::vector<std::string> MsvcBackend::architecture_compiler_flags(Architecture) const {
    // cl.exe targets whatever the captured environment put on PATH
    return {};
}

std::vector<std::string> MsvcBackend::architecture_linker_flags(Architecture arch) const {
    return {"/MACHINE:" + to_string(arch)};
}

std::vector<std::string> MsvcBackend::library_path_flags(const std::string& dir) const {
    return {"/LIBPATH:" + dir};
}

std::vector<std::string> MsvcBackend::library_flags(const std::string& library) const {
    return {library};
}

std::vector<std::string> MsvcBackend::shared_library_compiler_flags() const {
    return {"/D_USRDLL", "/D_WINDLL"};
}

std::vector<std::string> MsvcBackend::shared_library_linker_flags() const {
    return {"/DLL"};
}

std::string MsvcBackend::extension(AssemblyType type) const {
    switch (type) {
        case AssemblyType::SHARED_LIBRARY: return ".dll";
        case AssemblyType::STATIC_LIBRARY: return ".lib";
        case AssemblyType::EXECUTABLE:     return ".exe";
        case AssemblyType::UNSPECIFIED:    break;
    }
    return "";
}

std::vector<std::string> MsvcBackend::compile_arguments(const CompileStep& step) const {
    std::vector<std::string> args = step.compiler_flags;
    args.insert(args.end(), step.sources.begin(), step.sources.end());

    if (step.merged_link) {
        args.push_back("/link");
        args.insert(args.end(), step.linker_flags.begin(), step.linker_flags.end());
        args.push_back("/OUT:" + step.output);
    }
    return args;
}

std::vector<std::string> MsvcBackend::archive_arguments(const ArchiveStep& step) const {
    std::vector<std::string> args;
    args.push_back("/OUT:" + step.output);
    for (const auto& flag : architecture_linker_flags(step.architecture)) {
        args.push_back(flag);
    }
    for (const auto& dir : step.library_paths) {
        args.push_back("/LIBPATH:" + dir);
    }
    args.insert(args.end(), step.objects.begin(), step.objects.end());
    return args;
}

} // namespace cellbuild
