/**
 * toolchain_locator.hpp
 * Discovers which toolchain releases are installed
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_TOOLCHAIN_LOCATOR_HPP
#define CELLBUILD_TOOLCHAIN_LOCATOR_HPP

#include "toolchain/toolchain_backend.hpp"

#include <map>
#include <string>
#include <vector>

namespace cellbuild {

// Installed release -> install path. Built fresh by every discover() call.
using ToolchainRegistry = std::map<ToolchainVersion, std::string>;

class ToolchainLocator {
public:
    explicit ToolchainLocator(const ToolchainBackend& backend) : backend_(backend) {}

    /**
     * Probe every candidate release against `environment`.
     *
     * Only installed releases appear in the result. Absence is never an
     * error: an empty registry means nothing was found.
     */
    ToolchainRegistry discover(const std::vector<ToolchainVersion>& candidates,
                               const EnvironmentSnapshot& environment) const;

    // Probe every release the backend supports
    ToolchainRegistry discover(const EnvironmentSnapshot& environment) const;

private:
    const ToolchainBackend& backend_;
};

} // namespace cellbuild

#endif // CELLBUILD_TOOLCHAIN_LOCATOR_HPP
