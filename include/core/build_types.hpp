/**
 * build_types.hpp
 * Shared vocabulary types for cellbuild
 *
 * - Architecture / BuildConfiguration: bit-flag sets, a request may name
 *   several at once; a single build cell always holds exactly one of each
 * - AssemblyType: kind of artifact a compiler task produces
 * - ToolchainVersion: ordered toolchain release identifier
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_BUILD_TYPES_HPP
#define CELLBUILD_BUILD_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <optional>

namespace cellbuild {

// =============================================================================
// Architecture flags
// =============================================================================
enum class Architecture : uint32_t {
    NONE = 0,
    X86  = 1 << 0,
    X64  = 1 << 1
};

// Declared order, used when expanding a request into cells
inline constexpr std::array<Architecture, 2> ALL_ARCHITECTURES = {
    Architecture::X86,
    Architecture::X64
};

constexpr Architecture operator|(Architecture a, Architecture b) {
    return static_cast<Architecture>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr Architecture operator&(Architecture a, Architecture b) {
    return static_cast<Architecture>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool has_flag(Architecture set, Architecture flag) {
    return flag != Architecture::NONE && (set & flag) == flag;
}

// Number of known architecture flags set in `set`
size_t flag_count(Architecture set);

// "x86", "x64", or "x86|x64" for sets
std::string to_string(Architecture arch);

// Accepts "x86", "x64" (case-insensitive) and the alias "amd64"
std::optional<Architecture> parse_architecture(const std::string& name);

// =============================================================================
// Build configuration flags
// =============================================================================
enum class BuildConfiguration : uint32_t {
    NONE    = 0,
    DEBUG   = 1 << 0,
    RELEASE = 1 << 1
};

inline constexpr std::array<BuildConfiguration, 2> ALL_CONFIGURATIONS = {
    BuildConfiguration::DEBUG,
    BuildConfiguration::RELEASE
};

constexpr BuildConfiguration operator|(BuildConfiguration a, BuildConfiguration b) {
    return static_cast<BuildConfiguration>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr BuildConfiguration operator&(BuildConfiguration a, BuildConfiguration b) {
    return static_cast<BuildConfiguration>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool has_flag(BuildConfiguration set, BuildConfiguration flag) {
    return flag != BuildConfiguration::NONE && (set & flag) == flag;
}

size_t flag_count(BuildConfiguration set);

// "Debug", "Release", or "Debug|Release"
std::string to_string(BuildConfiguration config);

std::optional<BuildConfiguration> parse_configuration(const std::string& name);

// =============================================================================
// Output artifact kind
// =============================================================================
enum class AssemblyType {
    UNSPECIFIED,
    SHARED_LIBRARY,
    STATIC_LIBRARY,
    EXECUTABLE
};

const char* to_string(AssemblyType type);

// Accepts "shared", "static", "executable" (and "exe")
std::optional<AssemblyType> parse_assembly_type(const std::string& name);

// =============================================================================
// Toolchain version
// =============================================================================
struct ToolchainVersion {
    int major_version = 0;
    int minor_version = 0;

    ToolchainVersion() = default;
    constexpr ToolchainVersion(int maj, int min = 0) : major_version(maj), minor_version(min) {}

    bool operator==(const ToolchainVersion& other) const {
        return major_version == other.major_version && minor_version == other.minor_version;
    }
    bool operator!=(const ToolchainVersion& other) const { return !(*this == other); }
    bool operator<(const ToolchainVersion& other) const {
        return major_version < other.major_version ||
               (major_version == other.major_version && minor_version < other.minor_version);
    }

    // "14" or "14.1"
    std::string to_string() const;
};

// Accepts "14", "v14", "14.1", "v14.1"
std::optional<ToolchainVersion> parse_toolchain_version(const std::string& text);

} // namespace cellbuild

#endif // CELLBUILD_BUILD_TYPES_HPP
