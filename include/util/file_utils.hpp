/**
 * file_utils.hpp
 * Path string helpers and filtered directory copy
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_FILE_UTILS_HPP
#define CELLBUILD_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <unordered_set>

namespace cellbuild::util {

namespace fs = std::filesystem;

// Backslashes become '/', runs of separators collapse to one, trailing
// separators are dropped (a lone "/" is kept).
std::string to_host_path(const std::string& path);

// NUL, ASCII control characters, and " < > |
bool contains_invalid_path_characters(const std::string& path);

// Invalid path characters plus / \ : * ?
bool contains_invalid_file_name_characters(const std::string& name);

// True if `path` names anything besides a bare file name
bool has_directory_component(const std::string& path);

// Case-insensitive set of extensions (".h") or file names ("config.h")
struct CopyFilter {
    std::unordered_set<std::string> included;  // Empty = everything
    std::unordered_set<std::string> excluded;

    bool accepts(const fs::path& file) const;
};

/**
 * Copy files from `source` to `destination`, creating the destination.
 * Subdirectories are copied when `recursive` is set, with the same filter.
 * A destination nested inside `source` is skipped rather than copied into
 * itself; a source inside the destination copies nothing.
 *
 * @return Number of files copied
 * @throws fs::filesystem_error if the source is missing or a copy fails
 */
size_t copy_directory(const fs::path& source, const fs::path& destination,
                      bool recursive, bool overwrite = true,
                      const CopyFilter& filter = {});

} // namespace cellbuild::util

#endif // CELLBUILD_FILE_UTILS_HPP
