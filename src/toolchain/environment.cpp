/**
 * environment.cpp
 * EnvironmentSnapshot implementation
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "toolchain/environment.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

extern char** environ;

namespace cellbuild {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

EnvironmentSnapshot::EnvironmentSnapshot(const Assignments& variables) {
    for (const auto& [name, value] : variables) {
        assign(name, value);
    }
}

EnvironmentSnapshot EnvironmentSnapshot::from_process_environment() {
    EnvironmentSnapshot snapshot;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        snapshot.assign(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return snapshot;
}

EnvironmentSnapshot::Assignments EnvironmentSnapshot::parse_assignments(const std::string& text) {
    Assignments result;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find_first_of("\r\n", start);
        if (end == std::string::npos) end = text.size();

        std::string line = text.substr(start, end - start);
        start = end + 1;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string name = line.substr(0, eq);
        if (name.empty() || is_blank(name)) continue;

        result.emplace_back(std::move(name), line.substr(eq + 1));
    }

    return result;
}

EnvironmentSnapshot EnvironmentSnapshot::merged_with(const Assignments& captured) const {
    EnvironmentSnapshot merged = *this;
    for (const auto& [name, value] : captured) {
        merged.assign(name, value);
    }
    return merged;
}

void EnvironmentSnapshot::assign(const std::string& name, const std::string& value) {
    auto it = variables_.find(name);
    if (it != variables_.end()) {
        it->second = value;
    } else {
        variables_.emplace(name, value);
    }
}

std::optional<std::string> EnvironmentSnapshot::get(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) return std::nullopt;
    return it->second;
}

bool EnvironmentSnapshot::contains(const std::string& name) const {
    return variables_.find(name) != variables_.end();
}

EnvironmentSnapshot::Assignments EnvironmentSnapshot::entries() const {
    return Assignments(variables_.begin(), variables_.end());
}

std::vector<std::string> EnvironmentSnapshot::path_entries() const {
    std::vector<std::string> dirs;
    auto path = get("PATH");
    if (!path) return dirs;

    std::istringstream stream(*path);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (!dir.empty()) dirs.push_back(dir);
    }
    return dirs;
}

bool EnvironmentSnapshot::operator==(const EnvironmentSnapshot& other) const {
    // Names compare case-insensitively through the map ordering, values exactly
    if (variables_.size() != other.variables_.size()) return false;
    for (const auto& [name, value] : variables_) {
        auto it = other.variables_.find(name);
        if (it == other.variables_.end() || it->second != value) return false;
    }
    return true;
}

} // namespace cellbuild
