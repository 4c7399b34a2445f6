/**
 * environment_resolver.hpp
 * Architecture-specific environment capture
 *
 * Runs the toolchain's own setup script for one architecture, parses the
 * NAME=VALUE dump it prints, and merges it over a base environment. The
 * resulting snapshot is what every tool of a build cell runs under.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_ENVIRONMENT_RESOLVER_HPP
#define CELLBUILD_ENVIRONMENT_RESOLVER_HPP

#include "core/build_types.hpp"
#include "process/process_runner.hpp"
#include "toolchain/environment.hpp"
#include "toolchain/toolchain_backend.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace cellbuild {

class EnvironmentResolver {
public:
    EnvironmentResolver(ProcessRunner& runner, const ToolchainBackend& backend)
        : runner_(runner), backend_(backend) {}

    // Applied to every setup-script invocation; zero = no limit
    void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

    // Observed while a setup script runs
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_flag_ = flag; }

    /**
     * Capture the environment for exactly one architecture.
     *
     * @throws InvalidArchitectureSelection if `arch` has zero or several
     *         flags set (nothing is spawned)
     * @throws EnvironmentCaptureError if the setup script could not be
     *         started, timed out, or exited non-zero
     * @throws ProcessCancelledError if the cancel flag was raised
     */
    EnvironmentSnapshot resolve(const std::string& install_path, Architecture arch,
                                const EnvironmentSnapshot& base) const;

    /**
     * resolve() memoized per (version, architecture). Concurrent callers for
     * the same key may both run the script; the first stored result wins.
     */
    std::shared_ptr<const EnvironmentSnapshot> resolve_cached(const ToolchainVersion& version,
                                                              const std::string& install_path,
                                                              Architecture arch,
                                                              const EnvironmentSnapshot& base);

    void clear_cache();

private:
    ProcessRunner& runner_;
    const ToolchainBackend& backend_;
    std::chrono::milliseconds timeout_{0};
    const std::atomic<bool>* cancel_flag_ = nullptr;

    std::mutex cache_mutex_;
    std::map<std::pair<ToolchainVersion, Architecture>,
             std::shared_ptr<const EnvironmentSnapshot>> cache_;
};

} // namespace cellbuild

#endif // CELLBUILD_ENVIRONMENT_RESOLVER_HPP
