/**
 * task_file.hpp
 * Declarative task description reader
 *
 * Format (INI-like):
 *
 *   # comment
 *   [toolchain]
 *   backend = "gcc"
 *   minimum_version = "12"
 *
 *   [matrix]
 *   configurations = ["Debug", "Release"]
 *   architectures = ["x86", "x64"]
 *
 *   [task]
 *   working_directory = "/abs/project"
 *   strict_paths = true
 *   sources = ["src/a.cpp", "src/b.cpp"]
 *   include_paths = ["include"]
 *   output_directory = "out"
 *   output_name = "demo"
 *   output_type = "static"     # shared | static | executable
 *
 * Relative directories are resolved against working_directory, which itself
 * defaults to the directory holding the file. Fields are applied to the
 * CompilerTaskConfig in dependency order (working directory and strictness
 * first, library paths before libraries) regardless of their order in the
 * file.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_TASK_FILE_HPP
#define CELLBUILD_TASK_FILE_HPP

#include "config/compiler_task_config.hpp"
#include "core/build_types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace cellbuild {

namespace fs = std::filesystem;

/**
 * Malformed task file. line() is 1-based; 0 when not tied to a line.
 */
class TaskFileError : public std::runtime_error {
public:
    TaskFileError(size_t line, const std::string& message);

    size_t line() const { return line_; }

private:
    size_t line_;
};

struct TaskFile {
    std::string backend = "gcc";
    std::optional<ToolchainVersion> minimum_version;

    BuildConfiguration configurations = BuildConfiguration::NONE;
    Architecture architectures = Architecture::NONE;

    CompilerTaskConfig task;
};

/**
 * Parse task file text.
 *
 * @param base_dir Default working directory when the text names none
 * @throws TaskFileError on syntax errors, unknown sections/keys/names
 * @throws ConfigurationError when a strict-path field rejects its value
 */
TaskFile parse_task_file(const std::string& text, const fs::path& base_dir = {});

/**
 * Read and parse a task file from disk.
 */
TaskFile load_task_file(const fs::path& path);

} // namespace cellbuild

#endif // CELLBUILD_TASK_FILE_HPP
