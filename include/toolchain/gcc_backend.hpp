/**
 * gcc_backend.hpp
 * GNU Compiler Collection (g++ / ar)
 *
 * Detection: GCC<N>_ROOT names an install prefix holding bin/g++-<N> or
 * bin/g++; without it, each PATH directory of the injected environment is
 * searched for g++-<N>. The registry records the bin directory.
 *
 * Environment: the bin directory is prepended to PATH in a POSIX shell which
 * then dumps its environment with `env`.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_GCC_BACKEND_HPP
#define CELLBUILD_GCC_BACKEND_HPP

#include "toolchain/toolchain_backend.hpp"

namespace cellbuild {

class GccBackend : public ToolchainBackend {
public:
    static constexpr int OLDEST_MAJOR = 9;
    static constexpr int NEWEST_MAJOR = 14;

    std::string name() const override { return "gcc"; }

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
    std::string compile_only_flag() const override { return "-c"; }
    std::string extension(AssemblyType type) const override;
    std::string object_extension() const override { return ".o"; }

    std::vector<std::string> compile_arguments(const CompileStep& step) const override;
    std::vector<std::string> archive_arguments(const ArchiveStep& step) const override;

private:
    // "g++-12"
    static std::string versioned_driver(const ToolchainVersion& version);
};

} // namespace cellbuild

#endif // CELLBUILD_GCC_BACKEND_HPP
