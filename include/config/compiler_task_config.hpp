/**
 * compiler_task_config.hpp
 * Validated description of one compilation request
 *
 * Strict paths:
 *   When strict_paths() is true every path-valued setter checks the value
 *   against the filesystem before committing it. A rejected value throws
 *   ConfigurationError and the field keeps its previous value.
 *
 *   The intermediary directory is always required to be absolute, strict or
 *   not: clean() deletes it recursively.
 *
 *   Bare library names are looked up in the library paths configured at the
 *   moment set_additional_libraries() is called, so set library paths first.
 *
 * All sequences are stored and returned by value. Callers mutating a list
 * they obtained from a getter never affect the configuration.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_COMPILER_TASK_CONFIG_HPP
#define CELLBUILD_COMPILER_TASK_CONFIG_HPP

#include "core/build_types.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cellbuild {

class CompilerTaskConfig {
public:
    CompilerTaskConfig() = default;

    // =========================================================================
    // Validation mode
    // =========================================================================

    // Not retroactive: values already set are not re-validated
    void set_strict_paths(bool strict) { strict_paths_ = strict; }
    bool strict_paths() const { return strict_paths_; }

    // =========================================================================
    // Path-valued fields
    // =========================================================================

    // Directory relative sources are resolved against and tools run from
    void set_working_directory(const std::string& dir);
    const std::string& working_directory() const { return working_directory_; }

    void set_sources(std::vector<std::string> sources);
    std::vector<std::string> sources() const { return sources_; }

    void set_include_paths(std::vector<std::string> paths);
    std::vector<std::string> include_paths() const { return include_paths_; }

    void set_library_paths(std::vector<std::string> paths);
    std::vector<std::string> library_paths() const { return library_paths_; }

    void set_additional_libraries(std::vector<std::string> libraries);
    std::vector<std::string> additional_libraries() const { return additional_libraries_; }

    // Throws ConfigurationError(NOT_ABSOLUTE) for relative or empty paths
    void set_intermediary_directory(const std::string& dir);
    const std::string& intermediary_directory() const { return intermediary_directory_; }

    void set_output_directory(const std::string& dir);
    const std::string& output_directory() const { return output_directory_; }

    // Base name without extension; the platform extension is appended per cell
    void set_output_file_name(const std::string& name);
    const std::string& output_file_name() const { return output_file_name_; }

    // =========================================================================
    // Flags and options
    // =========================================================================

    void set_compiler_flags(std::vector<std::string> flags) { compiler_flags_ = std::move(flags); }
    std::vector<std::string> compiler_flags() const { return compiler_flags_; }

    void set_linker_flags(std::vector<std::string> flags) { linker_flags_ = std::move(flags); }
    std::vector<std::string> linker_flags() const { return linker_flags_; }

    void set_output_assembly_type(AssemblyType type) { output_assembly_type_ = type; }
    AssemblyType output_assembly_type() const { return output_assembly_type_; }

    // Copy headers to <output>/include after a successful library build
    void set_auto_copy_includes(bool enabled) { auto_copy_includes_ = enabled; }
    bool auto_copy_includes() const { return auto_copy_includes_; }

    // =========================================================================
    // Run preconditions
    // =========================================================================

    /**
     * Problems that prevent the task from running at all: missing output
     * directory, output name or sources, or an unspecified assembly type.
     * Empty when the task is runnable.
     */
    std::vector<std::string> missing_requirements() const;

private:
    // Relative paths resolve against the working directory when one is set
    std::filesystem::path resolved(const std::string& path) const;

    void validate_directory(const char* field, const std::string& path,
                            const std::filesystem::path& target) const;
    void validate_source(const std::string& entry) const;
    void validate_library(const std::string& entry) const;

    bool strict_paths_ = false;
    bool auto_copy_includes_ = false;

    std::string working_directory_;
    std::vector<std::string> sources_;
    std::vector<std::string> include_paths_;
    std::vector<std::string> library_paths_;
    std::vector<std::string> additional_libraries_;
    std::vector<std::string> compiler_flags_;
    std::vector<std::string> linker_flags_;

    std::string intermediary_directory_;
    std::string output_directory_;
    std::string output_file_name_;

    AssemblyType output_assembly_type_ = AssemblyType::UNSPECIFIED;
};

} // namespace cellbuild

#endif // CELLBUILD_COMPILER_TASK_CONFIG_HPP
