/**
 * file_utils.cpp
 * Path string helpers and filtered directory copy
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "util/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace cellbuild::util {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_lowercase(const std::unordered_set<std::string>& set,
                        const std::string& key) {
    for (const auto& entry : set) {
        if (lowercase(entry) == key) return true;
    }
    return false;
}

} // namespace

std::string to_host_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());

    for (char c : path) {
        char normalized = (c == '\\') ? '/' : c;
        if (normalized == '/' && !result.empty() && result.back() == '/') {
            continue;
        }
        result.push_back(normalized);
    }

    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

bool contains_invalid_path_characters(const std::string& path) {
    for (char c : path) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || c == '"' || c == '<' || c == '>' || c == '|') {
            return true;
        }
    }
    return false;
}

bool contains_invalid_file_name_characters(const std::string& name) {
    if (contains_invalid_path_characters(name)) return true;
    return name.find_first_of("/\\:*?") != std::string::npos;
}

bool has_directory_component(const std::string& path) {
    fs::path p(to_host_path(path));
    return p.filename().string() != p.string();
}

bool CopyFilter::accepts(const fs::path& file) const {
    std::string ext = lowercase(file.extension().string());
    std::string name = lowercase(file.filename().string());

    if (contains_lowercase(excluded, ext) || contains_lowercase(excluded, name)) {
        return false;
    }
    if (!included.empty() &&
        !contains_lowercase(included, ext) && !contains_lowercase(included, name)) {
        return false;
    }
    return true;
}

namespace {

// True when `path` is `ancestor` or lies below it; both canonical
bool is_within(const fs::path& path, const fs::path& ancestor) {
    auto a = ancestor.begin();
    auto p = path.begin();
    for (; a != ancestor.end(); ++a, ++p) {
        if (p == path.end() || *a != *p) return false;
    }
    return true;
}

size_t copy_tree(const fs::path& source, const fs::path& destination,
                 const fs::path& skip, bool recursive,
                 fs::copy_options options, const CopyFilter& filter) {
    fs::create_directories(destination);

    size_t copied = 0;
    for (const auto& entry : fs::directory_iterator(source)) {
        if (entry.is_regular_file()) {
            if (!filter.accepts(entry.path())) continue;
            if (fs::copy_file(entry.path(), destination / entry.path().filename(), options)) {
                ++copied;
            }
        } else if (recursive && entry.is_directory()) {
            // The destination itself may sit inside the tree being copied
            if (fs::weakly_canonical(entry.path()) == skip) continue;
            copied += copy_tree(entry.path(), destination / entry.path().filename(),
                                skip, recursive, options, filter);
        }
    }
    return copied;
}

} // namespace

size_t copy_directory(const fs::path& source, const fs::path& destination,
                      bool recursive, bool overwrite, const CopyFilter& filter) {
    if (!fs::is_directory(source)) {
        throw fs::filesystem_error(
            "Source does not exist", source,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }

    const fs::path skip = fs::weakly_canonical(destination);
    if (is_within(fs::weakly_canonical(source), skip)) {
        return 0;
    }

    const auto options = overwrite ? fs::copy_options::overwrite_existing
                                   : fs::copy_options::skip_existing;

    return copy_tree(source, destination, skip, recursive, options, filter);
}

} // namespace cellbuild::util
