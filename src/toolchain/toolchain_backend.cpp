/**
 * toolchain_backend.cpp
 * Backend factory
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "toolchain/toolchain_backend.hpp"
#include "toolchain/gcc_backend.hpp"
#include "toolchain/msvc_backend.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cellbuild {

std::unique_ptr<ToolchainBackend> make_backend(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "msvc") return std::make_unique<MsvcBackend>();
    if (key == "gcc") return std::make_unique<GccBackend>();

    throw std::invalid_argument("Unknown toolchain backend: " + name);
}

} // namespace cellbuild
