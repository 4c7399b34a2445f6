/**
 * environment_resolver.cpp
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "toolchain/environment_resolver.hpp"
#include "core/errors.hpp"

namespace cellbuild {

EnvironmentSnapshot EnvironmentResolver::resolve(const std::string& install_path,
                                                 Architecture arch,
                                                 const EnvironmentSnapshot& base) const {
    if (flag_count(arch) != 1) {
        throw InvalidArchitectureSelection(arch);
    }

    ShellCommand setup = backend_.environment_setup_command(install_path, arch);

    ProcessRunner::ProcessRequest request;
    request.executable = setup.executable;
    request.args = setup.args;
    request.environment = base.entries();
    request.timeout = timeout_;
    request.cancel_flag = cancel_flag_;

    std::string captured;
    std::string diagnostics;
    request.on_stdout = [&captured](const std::string& line) {
        captured += line;
        captured += '\n';
    };
    request.on_stderr = [&diagnostics](const std::string& line) {
        if (!diagnostics.empty()) diagnostics += '\n';
        diagnostics += line;
    };

    int exit_code = 0;
    try {
        exit_code = runner_.run(request);
    } catch (const ProcessInvocationError& e) {
        throw EnvironmentCaptureError(arch, install_path, e.what());
    } catch (const ProcessTimeoutError& e) {
        throw EnvironmentCaptureError(arch, install_path, e.what());
    }

    if (exit_code != 0) {
        std::string detail = "setup script exited with code " + std::to_string(exit_code);
        if (!diagnostics.empty()) detail += ": " + diagnostics;
        throw EnvironmentCaptureError(arch, install_path, detail);
    }

    return base.merged_with(EnvironmentSnapshot::parse_assignments(captured));
}

std::shared_ptr<const EnvironmentSnapshot> EnvironmentResolver::resolve_cached(
    const ToolchainVersion& version, const std::string& install_path,
    Architecture arch, const EnvironmentSnapshot& base) {

    auto key = std::make_pair(version, arch);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;
    }

    // Script runs outside the lock so other architectures resolve in parallel
    auto snapshot = std::make_shared<const EnvironmentSnapshot>(
        resolve(install_path, arch, base));

    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.emplace(key, snapshot).first->second;
}

void EnvironmentResolver::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

} // namespace cellbuild
