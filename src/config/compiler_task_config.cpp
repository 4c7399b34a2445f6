/**
 * compiler_task_config.cpp
 * Validate-then-commit setters for CompilerTaskConfig
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "config/compiler_task_config.hpp"
#include "util/file_utils.hpp"

#include <filesystem>

namespace cellbuild {

namespace fs = std::filesystem;

using Reason = ConfigurationError::Reason;

namespace {

std::vector<std::string> normalized(std::vector<std::string> paths) {
    for (auto& p : paths) {
        p = util::to_host_path(p);
    }
    return paths;
}

bool regular_file_at(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

} // namespace

// =============================================================================
// Validators
// =============================================================================

fs::path CompilerTaskConfig::resolved(const std::string& path) const {
    fs::path p(path);
    if (p.is_relative() && !working_directory_.empty()) {
        return fs::path(working_directory_) / p;
    }
    return p;
}

void CompilerTaskConfig::validate_directory(const char* field, const std::string& path,
                                            const fs::path& target) const {
    std::error_code ec;

    // Existence first; the directory and character checks are only
    // meaningful for something that exists
    if (!fs::exists(target, ec)) {
        throw ConfigurationError(field, path, Reason::MISSING,
            std::string("Supplied ") + field + " does not exist: " + path);
    }

    if (!fs::is_directory(target, ec)) {
        throw ConfigurationError(field, path, Reason::NOT_A_DIRECTORY,
            std::string("Supplied ") + field + " does not point to a directory: " + path);
    }

    if (util::contains_invalid_path_characters(path)) {
        throw ConfigurationError(field, path, Reason::ILLEGAL_CHARACTERS,
            std::string("Supplied ") + field + " contains illegal path characters: " + path);
    }
}

void CompilerTaskConfig::validate_source(const std::string& entry) const {
    if (util::contains_invalid_path_characters(entry)) {
        throw ConfigurationError("sources", entry, Reason::ILLEGAL_CHARACTERS,
            "Supplied source contains illegal path characters: " + entry);
    }

    fs::path candidate(entry);

    if (util::has_directory_component(entry)) {
        if (candidate.is_relative() && !working_directory_.empty()) {
            fs::path in_working_dir = fs::path(working_directory_) / candidate;
            if (regular_file_at(in_working_dir)) return;
        }
        if (!regular_file_at(candidate)) {
            throw ConfigurationError("sources", entry, Reason::MISSING,
                "Supplied source file could not be found: " + entry);
        }
        return;
    }

    // Bare file name: only the working directory can resolve it
    if (working_directory_.empty()) {
        throw ConfigurationError("sources", entry, Reason::RELATIVE_WITHOUT_BASE,
            "Supplied source file could not be found: " + entry +
            ". The path is not absolute and no working directory is set.");
    }

    if (!regular_file_at(fs::path(working_directory_) / candidate)) {
        throw ConfigurationError("sources", entry, Reason::MISSING,
            "Supplied source file could not be found: " + entry);
    }
}

void CompilerTaskConfig::validate_library(const std::string& entry) const {
    if (util::has_directory_component(entry)) {
        if (!regular_file_at(resolved(entry))) {
            throw ConfigurationError("additional_libraries", entry, Reason::MISSING,
                "Supplied library could not be found: " + entry);
        }
        return;
    }

    if (library_paths_.empty()) {
        throw ConfigurationError("additional_libraries", entry, Reason::RELATIVE_WITHOUT_BASE,
            "Supplied library could not be found: " + entry +
            ". No library directories are configured; set library paths "
            "before libraries when using strict paths.");
    }

    for (const auto& dir : library_paths_) {
        if (regular_file_at(resolved(dir) / entry)) {
            return;
        }
    }

    throw ConfigurationError("additional_libraries", entry, Reason::NOT_FOUND_IN_SEARCH_PATHS,
        "Supplied library could not be found in any library path: " + entry);
}

// =============================================================================
// Setters
// =============================================================================

void CompilerTaskConfig::set_working_directory(const std::string& dir) {
    std::string sane = util::to_host_path(dir);
    if (strict_paths_) {
        validate_directory("working_directory", sane, sane);
    }
    working_directory_ = std::move(sane);
}

void CompilerTaskConfig::set_sources(std::vector<std::string> sources) {
    sources = normalized(std::move(sources));
    if (strict_paths_) {
        for (const auto& entry : sources) {
            validate_source(entry);
        }
    }
    sources_ = std::move(sources);
}

void CompilerTaskConfig::set_include_paths(std::vector<std::string> paths) {
    paths = normalized(std::move(paths));
    if (strict_paths_) {
        for (const auto& entry : paths) {
            validate_directory("include_paths", entry, resolved(entry));
        }
    }
    include_paths_ = std::move(paths);
}

void CompilerTaskConfig::set_library_paths(std::vector<std::string> paths) {
    paths = normalized(std::move(paths));
    if (strict_paths_) {
        for (const auto& entry : paths) {
            validate_directory("library_paths", entry, resolved(entry));
        }
    }
    library_paths_ = std::move(paths);
}

void CompilerTaskConfig::set_additional_libraries(std::vector<std::string> libraries) {
    libraries = normalized(std::move(libraries));
    if (strict_paths_) {
        for (const auto& entry : libraries) {
            validate_library(entry);
        }
    }
    additional_libraries_ = std::move(libraries);
}

void CompilerTaskConfig::set_intermediary_directory(const std::string& dir) {
    std::string sane = util::to_host_path(dir);

    // Independent of strict_paths
    if (sane.empty() || !fs::path(sane).is_absolute()) {
        throw ConfigurationError("intermediary_directory", dir, Reason::NOT_ABSOLUTE,
            "Intermediary directory must be an absolute path: " + dir);
    }

    // clean() removes this directory recursively
    if (!fs::path(sane).lexically_normal().has_relative_path()) {
        throw ConfigurationError("intermediary_directory", dir, Reason::ROOT_PATH,
            "Intermediary directory must not be a filesystem root: " + dir);
    }

    if (strict_paths_) {
        if (util::contains_invalid_path_characters(sane)) {
            throw ConfigurationError("intermediary_directory", dir, Reason::ILLEGAL_CHARACTERS,
                "Intermediary directory contains illegal path characters: " + dir);
        }
        std::error_code ec;
        fs::path parent = fs::path(sane).parent_path();
        if (!fs::is_directory(parent, ec)) {
            throw ConfigurationError("intermediary_directory", dir, Reason::MISSING_PARENT,
                "Parent of intermediary directory does not exist: " + parent.string());
        }
    }

    intermediary_directory_ = std::move(sane);
}

void CompilerTaskConfig::set_output_directory(const std::string& dir) {
    std::string sane = util::to_host_path(dir);
    if (strict_paths_) {
        validate_directory("output_directory", sane, resolved(sane));
    }
    output_directory_ = std::move(sane);
}

void CompilerTaskConfig::set_output_file_name(const std::string& name) {
    if (strict_paths_) {
        if (name.empty()) {
            throw ConfigurationError("output_file_name", name, Reason::EMPTY,
                "Output file name must not be empty");
        }
        if (util::contains_invalid_file_name_characters(name)) {
            throw ConfigurationError("output_file_name", name, Reason::ILLEGAL_CHARACTERS,
                "Output file name contains illegal characters: " + name);
        }
    }
    output_file_name_ = name;
}

// =============================================================================
// Preconditions
// =============================================================================

std::vector<std::string> CompilerTaskConfig::missing_requirements() const {
    std::vector<std::string> problems;

    if (output_directory_.empty()) {
        problems.push_back("No output directory specified.");
    }
    if (output_file_name_.empty()) {
        problems.push_back("No output file name specified.");
    }
    if (sources_.empty()) {
        problems.push_back("No sources defined.");
    }
    if (output_assembly_type_ == AssemblyType::UNSPECIFIED) {
        problems.push_back("No output assembly type specified.");
    }

    return problems;
}

} // namespace cellbuild
