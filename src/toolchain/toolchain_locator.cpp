/**
 * toolchain_locator.cpp
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "toolchain/toolchain_locator.hpp"

namespace cellbuild {

ToolchainRegistry ToolchainLocator::discover(const std::vector<ToolchainVersion>& candidates,
                                             const EnvironmentSnapshot& environment) const {
    ToolchainRegistry registry;
    for (const auto& version : candidates) {
        if (auto path = backend_.probe(version, environment)) {
            registry.emplace(version, *path);
        }
    }
    return registry;
}

ToolchainRegistry ToolchainLocator::discover(const EnvironmentSnapshot& environment) const {
    return discover(backend_.supported_versions(), environment);
}

} // namespace cellbuild
