/**
 * toolchain_backend.hpp
 * Capability interface for one compiler family
 *
 * Everything toolchain-specific lives behind this interface:
 * - which releases exist and how to detect an installed one
 * - how to capture the per-architecture environment
 * - which tools to run and which flag tokens express each concept
 * - how the final compiler and archiver argument lists are laid out
 *
 * BuildMatrixExecutor decides *what* goes on a command line (task flags,
 * configuration defaults, includes, architecture selection, libraries) and in
 * which order; the backend decides how each item is spelled.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_TOOLCHAIN_BACKEND_HPP
#define CELLBUILD_TOOLCHAIN_BACKEND_HPP

#include "core/build_types.hpp"
#include "toolchain/environment.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cellbuild {

// An executable plus the directory it lives in (empty = PATH lookup)
struct ToolLocation {
    std::string executable;
    std::string directory;
};

struct ShellCommand {
    std::string executable;
    std::vector<std::string> args;
};

// Inputs to the compiler invocation of one cell
struct CompileStep {
    std::vector<std::string> compiler_flags;  // Fully composed for the cell
    std::vector<std::string> sources;         // Absolute paths
    std::vector<std::string> linker_flags;    // Fully composed for the cell
    std::string output;                       // Final artifact path
    bool merged_link = true;                  // false = compile only
};

// Inputs to the archiver invocation of a static-library cell
struct ArchiveStep {
    std::string output;
    std::vector<std::string> objects;
    std::vector<std::string> library_paths;
    Architecture architecture = Architecture::NONE;
};

class ToolchainBackend {
public:
    virtual ~ToolchainBackend() = default;

    // "msvc", "gcc"
    virtual std::string name() const = 0;

    // =========================================================================
    // Discovery and environment
    // =========================================================================

    // Releases this backend knows how to detect, oldest first
    virtual std::vector<ToolchainVersion> supported_versions() const = 0;

    /**
     * Install path of `version` if it is installed, judged only from
     * `environment` and the filesystem. Never throws for absence.
     */
    virtual std::optional<std::string> probe(const ToolchainVersion& version,
                                             const EnvironmentSnapshot& environment) const = 0;

    /**
     * Shell command that runs the toolchain's environment-setup script for
     * `arch` and then prints every variable as NAME=VALUE on stdout.
     */
    virtual ShellCommand environment_setup_command(const std::string& install_path,
                                                   Architecture arch) const = 0;

    // =========================================================================
    // Tools
    // =========================================================================

    virtual ToolLocation compiler(const ToolchainVersion& version,
                                  const std::string& install_path) const = 0;

    virtual ToolLocation archiver(const ToolchainVersion& version,
                                  const std::string& install_path) const = 0;

    // =========================================================================
    // Flag spelling
    // =========================================================================

    // Optimization/runtime/define defaults for one configuration
    virtual std::vector<std::string> configuration_flags(BuildConfiguration config) const = 0;

    // Directs object files into `dir`; may be empty if the tool writes
    // objects to its working directory
    virtual std::vector<std::string> intermediate_output_flags(const std::string& dir) const = 0;

    virtual std::vector<std::string> include_flags(const std::string& dir) const = 0;

    virtual std::vector<std::string> architecture_compiler_flags(Architecture arch) const = 0;
    virtual std::vector<std::string> architecture_linker_flags(Architecture arch) const = 0;

    virtual std::vector<std::string> library_path_flags(const std::string& dir) const = 0;
    virtual std::vector<std::string> library_flags(const std::string& library) const = 0;

    virtual std::vector<std::string> shared_library_compiler_flags() const = 0;
    virtual std::vector<std::string> shared_library_linker_flags() const = 0;

    // Compile without linking ("/c", "-c")
    virtual std::string compile_only_flag() const = 0;

    // Platform extension for the artifact, including the dot (may be empty)
    virtual std::string extension(AssemblyType type) const = 0;

    virtual std::string object_extension() const = 0;

    // =========================================================================
    // Command layout
    // =========================================================================

    virtual std::vector<std::string> compile_arguments(const CompileStep& step) const = 0;
    virtual std::vector<std::string> archive_arguments(const ArchiveStep& step) const = 0;
};

/**
 * Backend selected by name ("msvc" or "gcc", case-insensitive).
 * @throws std::invalid_argument for unknown names
 */
std::unique_ptr<ToolchainBackend> make_backend(const std::string& name);

} // namespace cellbuild

#endif // CELLBUILD_TOOLCHAIN_BACKEND_HPP
