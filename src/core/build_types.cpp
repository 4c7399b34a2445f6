/**
 * build_types.cpp
 * Name conversions for cellbuild vocabulary types
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "core/build_types.hpp"

#include <algorithm>
#include <cctype>

namespace cellbuild {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_int(const std::string& text, int& out) {
    if (text.empty() || text.size() > 6) return false;
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

// =============================================================================
// Architecture
// =============================================================================

size_t flag_count(Architecture set) {
    size_t count = 0;
    for (Architecture a : ALL_ARCHITECTURES) {
        if (has_flag(set, a)) ++count;
    }
    return count;
}

std::string to_string(Architecture arch) {
    std::string result;
    for (Architecture a : ALL_ARCHITECTURES) {
        if (!has_flag(arch, a)) continue;
        if (!result.empty()) result += "|";
        result += (a == Architecture::X86) ? "x86" : "x64";
    }
    return result.empty() ? "none" : result;
}

std::optional<Architecture> parse_architecture(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "x86") return Architecture::X86;
    if (n == "x64" || n == "amd64") return Architecture::X64;
    return std::nullopt;
}

// =============================================================================
// BuildConfiguration
// =============================================================================

size_t flag_count(BuildConfiguration set) {
    size_t count = 0;
    for (BuildConfiguration c : ALL_CONFIGURATIONS) {
        if (has_flag(set, c)) ++count;
    }
    return count;
}

std::string to_string(BuildConfiguration config) {
    std::string result;
    for (BuildConfiguration c : ALL_CONFIGURATIONS) {
        if (!has_flag(config, c)) continue;
        if (!result.empty()) result += "|";
        result += (c == BuildConfiguration::DEBUG) ? "Debug" : "Release";
    }
    return result.empty() ? "none" : result;
}

std::optional<BuildConfiguration> parse_configuration(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "debug") return BuildConfiguration::DEBUG;
    if (n == "release") return BuildConfiguration::RELEASE;
    return std::nullopt;
}

// =============================================================================
// AssemblyType
// =============================================================================

const char* to_string(AssemblyType type) {
    switch (type) {
        case AssemblyType::UNSPECIFIED:    return "unspecified";
        case AssemblyType::SHARED_LIBRARY: return "shared";
        case AssemblyType::STATIC_LIBRARY: return "static";
        case AssemblyType::EXECUTABLE:     return "executable";
    }
    return "unknown";
}

std::optional<AssemblyType> parse_assembly_type(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "shared" || n == "shared_library") return AssemblyType::SHARED_LIBRARY;
    if (n == "static" || n == "static_library") return AssemblyType::STATIC_LIBRARY;
    if (n == "executable" || n == "exe") return AssemblyType::EXECUTABLE;
    return std::nullopt;
}

// =============================================================================
// ToolchainVersion
// =============================================================================

std::string ToolchainVersion::to_string() const {
    if (minor_version == 0) return std::to_string(major_version);
    return std::to_string(major_version) + "." + std::to_string(minor_version);
}

std::optional<ToolchainVersion> parse_toolchain_version(const std::string& text) {
    std::string t = lowercase(text);
    if (!t.empty() && t[0] == 'v') t.erase(0, 1);

    auto dot = t.find('.');
    int major = 0;
    int minor = 0;
    if (!parse_int(t.substr(0, dot), major)) return std::nullopt;
    if (dot != std::string::npos && !parse_int(t.substr(dot + 1), minor)) {
        return std::nullopt;
    }
    return ToolchainVersion(major, minor);
}

} // namespace cellbuild
