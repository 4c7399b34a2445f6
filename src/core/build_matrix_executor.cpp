/**
 * build_matrix_executor.cpp
 * Build matrix execution for one compiler task
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "core/build_matrix_executor.hpp"
#include "core/thread_pool.hpp"
#include "toolchain/toolchain_locator.hpp"
#include "util/file_utils.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace cellbuild {

namespace {

const ToolchainBackend& require_backend(const std::shared_ptr<const ToolchainBackend>& backend) {
    if (!backend) {
        throw std::invalid_argument("BuildMatrixExecutor requires a toolchain backend");
    }
    return *backend;
}

// Working directory of the task, or the process's when unset
fs::path base_directory(const CompilerTaskConfig& task) {
    if (!task.working_directory().empty()) return fs::path(task.working_directory());
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path() : cwd;
}

// `path` unchanged if absolute, otherwise resolved against `base`
fs::path absolute_against(const fs::path& base, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute()) return p.lexically_normal();
    return (base / p).lexically_normal();
}

void append(std::vector<std::string>& to, const std::vector<std::string>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

bool is_library(AssemblyType type) {
    return type == AssemblyType::SHARED_LIBRARY || type == AssemblyType::STATIC_LIBRARY;
}

} // namespace

const char* to_string(CellStatus status) {
    switch (status) {
        case CellStatus::PENDING:   return "pending";
        case CellStatus::COMPILING: return "compiling";
        case CellStatus::LINKING:   return "linking";
        case CellStatus::SUCCEEDED: return "succeeded";
        case CellStatus::FAILED:    return "failed";
    }
    return "unknown";
}

std::string BuildCell::name() const {
    return to_string(configuration) + " " + to_string(architecture);
}

// =============================================================================
// Build Matrix Executor Implementation
// =============================================================================

BuildMatrixExecutor::BuildMatrixExecutor(MatrixConfig config,
                                         std::shared_ptr<const ToolchainBackend> backend,
                                         std::shared_ptr<ProcessRunner> runner)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , runner_(runner ? std::move(runner) : std::make_shared<ProcessRunner>())
    , resolver_(*runner_, require_backend(backend_))
{
    // Set default thread count
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0) config_.num_threads = 4;
    }

    resolver_.set_timeout(config_.process_timeout);
    resolver_.set_cancel_flag(&cancelled_);
}

BuildMatrixExecutor::~BuildMatrixExecutor() = default;

bool BuildMatrixExecutor::run(const CompilerTaskConfig& task,
                              BuildConfiguration configurations,
                              Architecture architectures) {
    auto start_time = std::chrono::steady_clock::now();
    result_ = MatrixResult{};
    errors_.clear();
    cancelled_ = false;
    resolver_.clear_cache();

    auto finish = [&](bool success) {
        result_.success = success;
        result_.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        report_progress(BuildPhase::COMPLETE, result_.succeeded, result_.attempted, "",
                        success ? "Build succeeded" : "Build failed");
        return success;
    };

    // Stage 1: Preconditions
    report_progress(BuildPhase::VALIDATING, 0, 1, "", "Validating task...");
    if (!validate(task, configurations, architectures)) {
        return finish(false);
    }

    EnvironmentSnapshot base = config_.base_environment
        ? *config_.base_environment
        : EnvironmentSnapshot::from_process_environment();

    // Stage 2: Toolchain
    report_progress(BuildPhase::DISCOVERING_TOOLCHAIN, 0, 1, "",
                    "Looking for " + backend_->name() + " " +
                    config_.minimum_version.to_string() + "...");
    if (!locate_toolchain(base)) {
        return finish(false);
    }

    // Stage 3-4: Cells
    execute_cells(task, plan(task, configurations, architectures), base);

    // Stage 5: Verdict
    bool success = result_.attempted > 0 && result_.succeeded == result_.attempted;

    // Stage 6: Header propagation
    if (success && is_library(task.output_assembly_type()) && task.auto_copy_includes()) {
        success = copy_includes(task);
    }

    return finish(success);
}

bool BuildMatrixExecutor::clean(const CompilerTaskConfig& task) {
    errors_.clear();

    const std::string& dir = task.intermediary_directory();
    report_progress(BuildPhase::CLEANING, 0, 1, "", "Cleaning " + dir + "...");

    if (dir.empty()) {
        add_error(ErrorKind::CLEAN_FAILURE, "Intermediary directory is not set");
        return false;
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        add_error(ErrorKind::CLEAN_FAILURE,
                  "Failed to remove intermediary directory " + dir + ": " + ec.message());
        return false;
    }

    fs::create_directories(dir, ec);
    if (ec) {
        add_error(ErrorKind::CLEAN_FAILURE,
                  "Failed to recreate intermediary directory " + dir + ": " + ec.message());
        return false;
    }

    report_progress(BuildPhase::COMPLETE, 1, 1, "", "Clean complete");
    return true;
}

bool BuildMatrixExecutor::rebuild(const CompilerTaskConfig& task,
                                  BuildConfiguration configurations,
                                  Architecture architectures) {
    if (!clean(task)) {
        return false;
    }
    return run(task, configurations, architectures);
}

void BuildMatrixExecutor::cancel() {
    cancelled_ = true;
}

// =============================================================================
// Planning
// =============================================================================

std::vector<BuildCell> BuildMatrixExecutor::plan(const CompilerTaskConfig& task,
                                                 BuildConfiguration configurations,
                                                 Architecture architectures) const {
    const fs::path base = base_directory(task);

    const fs::path intermediary_root = task.intermediary_directory().empty()
        ? base
        : fs::path(task.intermediary_directory());
    const fs::path output_root = absolute_against(base, task.output_directory());

    const AssemblyType type = task.output_assembly_type();

    std::vector<BuildCell> cells;
    for (BuildConfiguration cfg : ALL_CONFIGURATIONS) {
        if (!has_flag(configurations, cfg)) continue;

        for (Architecture arch : ALL_ARCHITECTURES) {
            if (!has_flag(architectures, arch)) continue;

            BuildCell cell;
            cell.configuration = cfg;
            cell.architecture = arch;

            const std::string dir_name = cell.name();
            cell.intermediary_directory = intermediary_root / dir_name;
            cell.output_path = output_root / dir_name /
                               (task.output_file_name() + backend_->extension(type));

            // Compiler: task -> configuration -> object dir -> includes -> architecture
            cell.compiler_flags = task.compiler_flags();
            append(cell.compiler_flags, backend_->configuration_flags(cfg));
            append(cell.compiler_flags,
                   backend_->intermediate_output_flags(cell.intermediary_directory.string()));
            for (const auto& inc : task.include_paths()) {
                append(cell.compiler_flags,
                       backend_->include_flags(absolute_against(base, inc).string()));
            }
            append(cell.compiler_flags, backend_->architecture_compiler_flags(arch));

            // Linker: task -> architecture -> search paths -> libraries
            cell.linker_flags = task.linker_flags();
            append(cell.linker_flags, backend_->architecture_linker_flags(arch));
            for (const auto& dir : task.library_paths()) {
                append(cell.linker_flags,
                       backend_->library_path_flags(absolute_against(base, dir).string()));
            }
            for (const auto& lib : task.additional_libraries()) {
                std::string entry = util::has_directory_component(lib)
                    ? absolute_against(base, lib).string()
                    : lib;
                append(cell.linker_flags, backend_->library_flags(entry));
            }

            if (type == AssemblyType::SHARED_LIBRARY) {
                append(cell.compiler_flags, backend_->shared_library_compiler_flags());
                append(cell.linker_flags, backend_->shared_library_linker_flags());
            } else if (type == AssemblyType::STATIC_LIBRARY) {
                const std::string compile_only = backend_->compile_only_flag();
                if (std::find(cell.compiler_flags.begin(), cell.compiler_flags.end(),
                              compile_only) == cell.compiler_flags.end()) {
                    cell.compiler_flags.push_back(compile_only);
                }
            }

            cells.push_back(std::move(cell));
        }
    }

    return cells;
}

// =============================================================================
// Run Stages
// =============================================================================

bool BuildMatrixExecutor::validate(const CompilerTaskConfig& task,
                                   BuildConfiguration configurations,
                                   Architecture architectures) {
    bool ok = true;

    for (const auto& problem : task.missing_requirements()) {
        add_error(ErrorKind::CONFIGURATION_ERROR, problem);
        ok = false;
    }

    if (flag_count(configurations) == 0) {
        add_error(ErrorKind::CONFIGURATION_ERROR, "No build configuration requested.");
        ok = false;
    }

    if (flag_count(architectures) == 0) {
        add_error(ErrorKind::CONFIGURATION_ERROR, "No target architecture requested.");
        ok = false;
    }

    return ok;
}

bool BuildMatrixExecutor::locate_toolchain(const EnvironmentSnapshot& base) {
    ToolchainLocator locator(*backend_);
    ToolchainRegistry registry = locator.discover(base);

    auto it = registry.find(config_.minimum_version);
    if (it == registry.end()) {
        std::ostringstream msg;
        msg << backend_->name() << " " << config_.minimum_version.to_string()
            << " is not installed";
        if (registry.empty()) {
            msg << " (no supported release found)";
        } else {
            msg << " (found:";
            for (const auto& [version, path] : registry) {
                msg << " " << version.to_string();
            }
            msg << ")";
        }
        add_error(ErrorKind::TOOLCHAIN_NOT_FOUND, msg.str());
        return false;
    }

    toolchain_version_ = it->first;
    toolchain_path_ = it->second;

    if (config_.verbose) {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::cout << "[TOOLCHAIN] " << backend_->name() << " "
                  << toolchain_version_.to_string() << " at " << toolchain_path_ << "\n";
    }
    return true;
}

void BuildMatrixExecutor::execute_cells(const CompilerTaskConfig& task,
                                        std::vector<BuildCell> cells,
                                        const EnvironmentSnapshot& base) {
    result_.cells.resize(cells.size());

    const size_t threads = std::min(config_.num_threads, cells.size());

    if (threads <= 1) {
        for (size_t i = 0; i < cells.size(); ++i) {
            execute_cell(task, std::move(cells[i]), i, base);
        }
    } else {
        ThreadPool pool(threads);
        for (size_t i = 0; i < cells.size(); ++i) {
            pool.enqueue([this, &task, &base, &cells, i] {
                execute_cell(task, std::move(cells[i]), i, base);
            });
        }
        pool.wait_all();
    }

    // Declared cell order, whatever order the cells finished in
    for (const auto& outcome : result_.cells) {
        for (const auto& error : outcome.errors) {
            errors_.add(error);
        }
    }
}

void BuildMatrixExecutor::execute_cell(const CompilerTaskConfig& task, BuildCell cell,
                                       size_t index, const EnvironmentSnapshot& base) {
    auto cell_start = std::chrono::steady_clock::now();

    CellOutcome outcome;
    outcome.cell = std::move(cell);
    BuildCell& current = outcome.cell;

    auto attempt = [&]() -> bool {
        if (cancelled_) {
            record_cell_error(outcome, ErrorKind::CANCELLED, "Build cancelled before start");
            return false;
        }

        // a. Environment
        report_progress(BuildPhase::RESOLVING_ENVIRONMENT, index, result_.cells.size(),
                        current.name(), "Resolving environment...");
        std::shared_ptr<const EnvironmentSnapshot> environment;
        try {
            environment = resolver_.resolve_cached(toolchain_version_, toolchain_path_,
                                                   current.architecture, base);
        } catch (const EnvironmentCaptureError& e) {
            record_cell_error(outcome, ErrorKind::ENVIRONMENT_CAPTURE_ERROR, e.what());
            return false;
        } catch (const ProcessCancelledError& e) {
            record_cell_error(outcome, ErrorKind::CANCELLED, e.what());
            return false;
        } catch (const std::runtime_error& e) {
            record_cell_error(outcome, ErrorKind::ENVIRONMENT_CAPTURE_ERROR, e.what());
            return false;
        }

        // Directories the tools write into
        std::error_code ec;
        fs::create_directories(current.intermediary_directory, ec);
        if (!ec) fs::create_directories(current.output_path.parent_path(), ec);
        if (ec) {
            record_cell_error(outcome, ErrorKind::CONFIGURATION_ERROR,
                              "Cannot create cell directories: " + ec.message());
            return false;
        }

        const AssemblyType type = task.output_assembly_type();
        const fs::path base_dir = base_directory(task);

        // b-d. Compile, with the link merged in unless archiving follows
        CompileStep step;
        step.compiler_flags = current.compiler_flags;
        for (const auto& src : task.sources()) {
            step.sources.push_back(absolute_against(base_dir, src).string());
        }
        step.linker_flags = current.linker_flags;
        step.output = current.output_path.string();
        step.merged_link = type != AssemblyType::STATIC_LIBRARY;

        current.status = step.merged_link ? CellStatus::LINKING : CellStatus::COMPILING;
        report_progress(BuildPhase::COMPILING, index, result_.cells.size(), current.name(),
                        "Compiling " + current.name() + "...");

        ToolLocation compiler = backend_->compiler(toolchain_version_, toolchain_path_);
        if (!run_tool(compiler, backend_->compile_arguments(step), *environment, outcome,
                      ErrorKind::COMPILATION_FAILURE)) {
            return false;
        }

        // e. Archive static libraries
        if (type == AssemblyType::STATIC_LIBRARY) {
            report_progress(BuildPhase::ARCHIVING, index, result_.cells.size(), current.name(),
                            "Archiving " + current.output_path.filename().string() + "...");

            ArchiveStep archive;
            archive.output = current.output_path.string();
            archive.architecture = current.architecture;
            for (const auto& dir : task.library_paths()) {
                archive.library_paths.push_back(absolute_against(base_dir, dir).string());
            }

            const std::string object_ext = backend_->object_extension();
            fs::directory_iterator it(current.intermediary_directory, ec);
            for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
                std::error_code type_ec;
                if (it->is_regular_file(type_ec) && it->path().extension() == object_ext) {
                    archive.objects.push_back(it->path().string());
                }
            }
            if (ec) {
                record_cell_error(outcome, ErrorKind::LIBRARIAN_FAILURE,
                                  "Cannot list object files: " + ec.message());
                return false;
            }
            std::sort(archive.objects.begin(), archive.objects.end());

            ToolLocation archiver = backend_->archiver(toolchain_version_, toolchain_path_);
            if (!run_tool(archiver, backend_->archive_arguments(archive), *environment,
                          outcome, ErrorKind::LIBRARIAN_FAILURE)) {
                return false;
            }
        }

        return true;
    };

    bool ok = attempt();
    outcome.cell.status = ok ? CellStatus::SUCCEEDED : CellStatus::FAILED;
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - cell_start);

    // f. Record
    std::lock_guard<std::mutex> lock(result_mutex_);
    result_.attempted++;
    if (ok) {
        result_.succeeded++;
    } else {
        result_.failed++;
    }
    result_.cells[index] = std::move(outcome);
}

bool BuildMatrixExecutor::copy_includes(const CompilerTaskConfig& task) {
    const fs::path base = base_directory(task);
    const fs::path destination = absolute_against(base, task.output_directory()) / "include";

    util::CopyFilter filter;
    filter.excluded = {".c", ".cpp", ".cxx"};

    const auto includes = task.include_paths();
    size_t current = 0;
    for (const auto& inc : includes) {
        fs::path source = absolute_against(base, inc);
        report_progress(BuildPhase::COPYING_INCLUDES, current++, includes.size(), "",
                        "Copying headers from " + source.string() + "...");
        try {
            result_.copied_headers += util::copy_directory(source, destination, true, true, filter);
        } catch (const fs::filesystem_error& e) {
            add_error(ErrorKind::ARTIFACT_COPY_FAILURE,
                      "Failed to copy headers from " + source.string() + ": " + e.what());
            return false;
        }
    }
    return true;
}

// =============================================================================
// Helper Functions
// =============================================================================

bool BuildMatrixExecutor::run_tool(const ToolLocation& tool, std::vector<std::string> args,
                                   const EnvironmentSnapshot& environment,
                                   CellOutcome& outcome, ErrorKind failure_kind) {
    ProcessRunner::ProcessRequest request;
    request.working_directory = outcome.cell.intermediary_directory.string();
    request.executable = tool.executable;
    request.executable_path = tool.directory;
    request.args = std::move(args);
    request.environment = environment.entries();
    request.timeout = config_.process_timeout;
    request.cancel_flag = &cancelled_;

    std::string& captured = outcome.tool_output;
    const bool echo = !config_.quiet;
    request.on_stdout = [this, &captured, echo](const std::string& line) {
        captured += line;
        captured += '\n';
        if (echo) {
            std::lock_guard<std::mutex> lock(console_mutex_);
            std::cout << line << "\n";
        }
    };
    request.on_stderr = [this, &captured, echo](const std::string& line) {
        captured += line;
        captured += '\n';
        if (echo) {
            std::lock_guard<std::mutex> lock(console_mutex_);
            std::cerr << line << "\n";
        }
    };

    if (config_.verbose) {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::cout << "[CMD] " << ProcessRunner::describe(request) << "\n";
    }

    try {
        int exit_code = runner_->run(request);
        outcome.exit_code = exit_code;
        if (exit_code != 0) {
            std::string message = tool.executable + " failed";
            if (!captured.empty()) message += ": " + captured;
            record_cell_error(outcome, failure_kind, message, exit_code);
            return false;
        }
        return true;
    } catch (const ProcessTimeoutError& e) {
        outcome.exit_code = -1;
        record_cell_error(outcome, failure_kind, e.what(), -1);
    } catch (const ProcessCancelledError& e) {
        record_cell_error(outcome, ErrorKind::CANCELLED, e.what());
    } catch (const ProcessInvocationError& e) {
        record_cell_error(outcome, ErrorKind::PROCESS_INVOCATION_ERROR, e.what());
    } catch (const std::runtime_error& e) {
        // pipe/fork/poll failures in the runner itself
        record_cell_error(outcome, ErrorKind::PROCESS_INVOCATION_ERROR, e.what());
    }
    return false;
}

void BuildMatrixExecutor::record_cell_error(CellOutcome& outcome, ErrorKind kind,
                                            const std::string& message,
                                            std::optional<int> exit_code) {
    BuildError error;
    error.kind = kind;
    error.message = message;
    error.configuration = outcome.cell.configuration;
    error.architecture = outcome.cell.architecture;
    error.exit_code = exit_code;
    outcome.errors.push_back(std::move(error));
}

void BuildMatrixExecutor::report_progress(BuildPhase phase, size_t current, size_t total,
                                          const std::string& cell,
                                          const std::string& message) {
    if (progress_cb_) {
        BuildProgress progress;
        progress.phase = phase;
        progress.current = current;
        progress.total = total;
        progress.current_cell = cell;
        progress.message = message;

        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_cb_(progress);
    }
}

void BuildMatrixExecutor::add_error(ErrorKind kind, const std::string& message) {
    BuildError error;
    error.kind = kind;
    error.message = message;
    errors_.add(std::move(error));
}

// =============================================================================
// Convenience Functions
// =============================================================================

bool build_task(const CompilerTaskConfig& task,
                const std::string& backend_name,
                BuildConfiguration configurations,
                Architecture architectures,
                const MatrixConfig& config,
                ErrorLog* errors) {
    std::shared_ptr<const ToolchainBackend> backend = make_backend(backend_name);
    BuildMatrixExecutor executor(config, backend);

    bool success = executor.run(task, configurations, architectures);
    if (errors) {
        *errors = executor.errors();
    }
    return success;
}

} // namespace cellbuild
