/**
 * build_matrix_executor.hpp
 * Build matrix execution for one compiler task
 *
 * Integrates:
 * - CompilerTaskConfig for the validated request
 * - ToolchainLocator to find the required toolchain release
 * - EnvironmentResolver for per-architecture environments (cached)
 * - ToolchainBackend for flag spelling and command layout
 * - ProcessRunner for compiler and archiver invocations
 * - ThreadPool for parallel cells
 *
 * Run Flow:
 * 1. Validate preconditions (nothing is spawned on failure)
 * 2. Discover installed toolchains; the minimum version must be present
 * 3. Expand configurations x architectures into build cells
 * 4. For each cell: resolve environment, compose flags, compile (and link),
 *    archive static libraries
 * 5. Verdict: attempted > 0 and every attempted cell succeeded
 * 6. On success, copy library headers to <output>/include if requested
 *
 * Failures are recorded in the ErrorLog; run() and clean() do not throw.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_BUILD_MATRIX_EXECUTOR_HPP
#define CELLBUILD_BUILD_MATRIX_EXECUTOR_HPP

#include "config/compiler_task_config.hpp"
#include "core/build_types.hpp"
#include "core/errors.hpp"
#include "process/process_runner.hpp"
#include "toolchain/environment.hpp"
#include "toolchain/environment_resolver.hpp"
#include "toolchain/toolchain_backend.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cellbuild {

namespace fs = std::filesystem;

// =============================================================================
// Matrix Configuration
// =============================================================================
struct MatrixConfig {
    // Toolchain release that must be installed
    ToolchainVersion minimum_version;

    // Parallel execution
    size_t num_threads = 0;  // 0 = auto (hardware_concurrency), 1 = sequential

    // Per-process limit for setup scripts, compilers and archivers
    std::chrono::milliseconds process_timeout{0};  // 0 = none

    bool verbose = false;  // Print each command as [CMD] ...
    bool quiet = false;    // Do not echo tool output (still captured)

    // Environment discovery and setup scripts start from; unset = this process
    std::optional<EnvironmentSnapshot> base_environment;
};

// =============================================================================
// Build Cell
// =============================================================================
enum class CellStatus {
    PENDING,
    COMPILING,
    LINKING,
    SUCCEEDED,
    FAILED
};

const char* to_string(CellStatus status);

/**
 * One (configuration, architecture) pair. Every cell owns its own flag
 * lists and directories; nothing is shared between cells.
 */
struct BuildCell {
    BuildConfiguration configuration = BuildConfiguration::NONE;
    Architecture architecture = Architecture::NONE;

    std::vector<std::string> compiler_flags;
    std::vector<std::string> linker_flags;

    fs::path intermediary_directory;  // <intermediary root>/<Cfg> <Arch>
    fs::path output_path;             // <output>/<Cfg> <Arch>/<name><ext>

    CellStatus status = CellStatus::PENDING;

    // "Debug x64"
    std::string name() const;
};

struct CellOutcome {
    BuildCell cell;
    std::optional<int> exit_code;     // Last tool run; -1 on timeout
    std::string tool_output;          // Captured stdout and stderr
    std::chrono::milliseconds duration{0};
    std::vector<BuildError> errors;   // This cell's entries in the run's ErrorLog
};

// =============================================================================
// Matrix Result
// =============================================================================
struct MatrixResult {
    bool success = false;

    size_t attempted = 0;
    size_t succeeded = 0;
    size_t failed = 0;

    // Declared order: configurations outer, architectures inner
    std::vector<CellOutcome> cells;

    // Headers copied to <output>/include
    size_t copied_headers = 0;

    std::chrono::milliseconds total_time{0};
};

// =============================================================================
// Progress Callback
// =============================================================================
enum class BuildPhase {
    VALIDATING,             // Checking task preconditions
    DISCOVERING_TOOLCHAIN,  // Probing installed releases
    RESOLVING_ENVIRONMENT,  // Running the toolchain setup script
    COMPILING,              // Compiler (and merged link)
    ARCHIVING,              // Static library archiver
    COPYING_INCLUDES,       // Header propagation
    CLEANING,               // Deleting intermediates
    COMPLETE
};

struct BuildProgress {
    BuildPhase phase = BuildPhase::VALIDATING;
    size_t current = 0;
    size_t total = 0;
    std::string current_cell;
    std::string message;
};

using ProgressCallback = std::function<void(const BuildProgress&)>;

// =============================================================================
// Build Matrix Executor
// =============================================================================
class BuildMatrixExecutor {
public:
    /**
     * Create an executor for one toolchain backend.
     * A null runner means a default ProcessRunner.
     */
    BuildMatrixExecutor(MatrixConfig config,
                        std::shared_ptr<const ToolchainBackend> backend,
                        std::shared_ptr<ProcessRunner> runner = nullptr);

    ~BuildMatrixExecutor();

    // No copying
    BuildMatrixExecutor(const BuildMatrixExecutor&) = delete;
    BuildMatrixExecutor& operator=(const BuildMatrixExecutor&) = delete;

    // =========================================================================
    // Build Operations
    // =========================================================================

    /**
     * Build every (configuration, architecture) cell of the request.
     * Returns the verdict; details are in result() and errors().
     */
    bool run(const CompilerTaskConfig& task,
             BuildConfiguration configurations,
             Architecture architectures);

    /**
     * Delete and recreate the task's intermediary directory.
     */
    bool clean(const CompilerTaskConfig& task);

    /**
     * clean() then run(). Does not run if clean fails.
     */
    bool rebuild(const CompilerTaskConfig& task,
                 BuildConfiguration configurations,
                 Architecture architectures);

    /**
     * Cancel the current run. Running tools are killed; cells not yet
     * started are recorded as cancelled.
     */
    void cancel();

    bool cancelled() const { return cancelled_; }

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * Cells the request expands to, with fully composed flag lists and
     * paths. Nothing is created on disk.
     */
    std::vector<BuildCell> plan(const CompilerTaskConfig& task,
                                BuildConfiguration configurations,
                                Architecture architectures) const;

    const ErrorLog& errors() const { return errors_; }
    const MatrixResult& result() const { return result_; }
    const MatrixConfig& config() const { return config_; }
    const ToolchainBackend& backend() const { return *backend_; }

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

private:
    // =========================================================================
    // Run Stages
    // =========================================================================

    bool validate(const CompilerTaskConfig& task,
                  BuildConfiguration configurations,
                  Architecture architectures);

    bool locate_toolchain(const EnvironmentSnapshot& base);

    void execute_cells(const CompilerTaskConfig& task, std::vector<BuildCell> cells,
                       const EnvironmentSnapshot& base);

    // Runs one cell to completion and stores its outcome; never throws
    void execute_cell(const CompilerTaskConfig& task, BuildCell cell, size_t index,
                      const EnvironmentSnapshot& base);

    bool copy_includes(const CompilerTaskConfig& task);

    // =========================================================================
    // Helper Functions
    // =========================================================================

    // Runs one tool for a cell. Records the failure and returns false on
    // non-zero exit, timeout, start failure or cancellation.
    bool run_tool(const ToolLocation& tool, std::vector<std::string> args,
                  const EnvironmentSnapshot& environment, CellOutcome& outcome,
                  ErrorKind failure_kind);

    // Kept on the outcome; merged into the log in cell order after the run
    void record_cell_error(CellOutcome& outcome, ErrorKind kind,
                           const std::string& message,
                           std::optional<int> exit_code = std::nullopt);

    void report_progress(BuildPhase phase, size_t current, size_t total,
                         const std::string& cell = "",
                         const std::string& message = "");

    void add_error(ErrorKind kind, const std::string& message);

    // =========================================================================
    // Member Data
    // =========================================================================

    MatrixConfig config_;
    std::shared_ptr<const ToolchainBackend> backend_;
    std::shared_ptr<ProcessRunner> runner_;
    EnvironmentResolver resolver_;
    ProgressCallback progress_cb_;

    // Selected toolchain for the current run
    ToolchainVersion toolchain_version_;
    std::string toolchain_path_;

    ErrorLog errors_;
    MatrixResult result_;

    // Guards result_ counters/cells, progress and console echo across workers
    std::mutex result_mutex_;
    std::mutex progress_mutex_;
    std::mutex console_mutex_;

    std::atomic<bool> cancelled_{false};
};

// =============================================================================
// Convenience Functions
// =============================================================================

/**
 * Build a task with the named backend ("msvc" or "gcc").
 * Errors are appended to `errors` when given.
 */
bool build_task(const CompilerTaskConfig& task,
                const std::string& backend_name,
                BuildConfiguration configurations,
                Architecture architectures,
                const MatrixConfig& config = {},
                ErrorLog* errors = nullptr);

} // namespace cellbuild

#endif // CELLBUILD_BUILD_MATRIX_EXECUTOR_HPP
