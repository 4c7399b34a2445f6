/**
 * msvc_backend.hpp
 * Microsoft Visual C++ (cl.exe / lib.exe)
 *
 * Detection: VS<NN>0COMNTOOLS points at "<root>\Common7\Tools\"; the release
 * is installed when "<root>\VC\bin\cl.exe" exists. The registry records the
 * VC\bin directory.
 *
 * Environment: "cmd.exe /C call <root>\VC\vcvarsall.bat <arch> && SET".
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_MSVC_BACKEND_HPP
#define CELLBUILD_MSVC_BACKEND_HPP

#include "toolchain/toolchain_backend.hpp"

namespace cellbuild {

class MsvcBackend : public ToolchainBackend {
public:
    // Visual Studio 2012, 2013, 2015
    static constexpr ToolchainVersion V11{11};
    static constexpr ToolchainVersion V12{12};
    static constexpr ToolchainVersion V14{14};

    std::string name() const override { return "msvc"; }

    std::vector<ToolchainVersion> supported_versions() const override;
    std::optional<std::string> probe(const ToolchainVersion& version,
                                     const EnvironmentSnapshot& environment) const override;
    ShellCommand environment_setup_command(const std::string& install_path,
                                           Architecture arch) const override;

    ToolLocation compiler(const ToolchainVersion& version,
                          const std::string& install_path) const override;
    ToolLocation archiver(const ToolchainVersion& version,
                          const std::string& install_path) const override;

    std::vector<std::string> configuration_flags(BuildConfiguration config) const override;
    std::vector<std::string> intermediate_output_flags(const std::string& dir) const override;
    std::vector<std::string> include_flags(const std::string& dir) const override;
    std::vector<std::string> architecture_compiler_flags(Architecture arch) const override;
    std::vector<std::string> architecture_linker_flags(Architecture arch) const override;
    std::vector<std::string> library_path_flags(const std::string& dir) const override;
    std::vector<std::string> library_flags(const std::string& library) const override;
    std::vector<std::string> shared_library_compiler_flags() const override;
    std::vector<std::string> shared_library_linker_flags() const override;
    std::string compile_only_flag() const override { return "/c"; }
    std::string extension(AssemblyType type) const override;
    std::string object_extension() const override { return ".obj"; }

    std::vector<std::string> compile_arguments(const CompileStep& step) const override;
    std::vector<std::string> archive_arguments(const ArchiveStep& step) const override;

    // "VS140COMNTOOLS" for v14
    static std::string tools_variable(const ToolchainVersion& version);
};

} // namespace cellbuild

#endif // CELLBUILD_MSVC_BACKEND_HPP
