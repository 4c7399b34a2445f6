/**
 * errors.hpp
 * Error taxonomy for cellbuild
 *
 * Two channels:
 * - Exceptions for contract violations and assignment-time validation
 *   (thrown immediately, never caught by the engine on the caller's behalf)
 * - BuildError records in an ErrorLog for expected environmental failures
 *   (missing toolchain, non-zero tool exit); BuildMatrixExecutor::run and
 *   clean never throw these across their boundary
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_ERRORS_HPP
#define CELLBUILD_ERRORS_HPP

#include "core/build_types.hpp"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cellbuild {

// =============================================================================
// Thrown errors
// =============================================================================

/**
 * A configuration field rejected a value. The field keeps its previous value.
 */
class ConfigurationError : public std::runtime_error {
public:
    enum class Reason {
        MISSING,                  // path does not exist
        NOT_A_DIRECTORY,          // exists but is not a directory
        NOT_A_FILE,               // exists but is not a regular file
        ILLEGAL_CHARACTERS,       // contains characters illegal in a path/file name
        NOT_ABSOLUTE,             // relative path where an absolute one is required
        RELATIVE_WITHOUT_BASE,    // bare name but nothing to resolve it against
        NOT_FOUND_IN_SEARCH_PATHS,// bare library name not in any library path
        MISSING_PARENT,           // parent directory does not exist
        EMPTY,                    // required value is empty
        ROOT_PATH                 // filesystem root where a removable directory is required
    };

    ConfigurationError(std::string field, std::string value, Reason reason,
                       const std::string& message);

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }
    Reason reason() const { return reason_; }

private:
    std::string field_;
    std::string value_;
    Reason reason_;
};

const char* reason_to_string(ConfigurationError::Reason reason);

/**
 * EnvironmentResolver was called with zero or several architecture flags.
 */
class InvalidArchitectureSelection : public std::invalid_argument {
public:
    explicit InvalidArchitectureSelection(Architecture requested);

    Architecture requested() const { return requested_; }

private:
    Architecture requested_;
};

/**
 * The toolchain environment-setup script could not be run or failed.
 */
class EnvironmentCaptureError : public std::runtime_error {
public:
    EnvironmentCaptureError(Architecture arch, std::string install_path,
                            const std::string& detail);

    Architecture architecture() const { return arch_; }
    const std::string& install_path() const { return install_path_; }

private:
    Architecture arch_;
    std::string install_path_;
};

/**
 * An executable could not be located or started (chdir/exec failure).
 */
class ProcessInvocationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A process exceeded its timeout and was killed.
 */
class ProcessTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A process was killed because the owning task was cancelled.
 */
class ProcessCancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Recorded errors
// =============================================================================

enum class ErrorKind {
    CONFIGURATION_ERROR,
    TOOLCHAIN_NOT_FOUND,
    INVALID_ARCHITECTURE_SELECTION,
    ENVIRONMENT_CAPTURE_ERROR,
    COMPILATION_FAILURE,
    LINK_FAILURE,
    LIBRARIAN_FAILURE,
    PROCESS_INVOCATION_ERROR,
    CLEAN_FAILURE,
    ARTIFACT_COPY_FAILURE,
    CANCELLED
};

const char* error_kind_to_string(ErrorKind kind);

struct BuildError {
    ErrorKind kind = ErrorKind::CONFIGURATION_ERROR;
    std::string message;

    // Set for failures scoped to one build cell
    std::optional<BuildConfiguration> configuration;
    std::optional<Architecture> architecture;
    std::optional<int> exit_code;

    // "[compilation_failure] Debug x64 (exit 2): message"
    std::string to_string() const;
};

/**
 * Ordered, append-only failure log owned by one task execution.
 * Appends are serialized so cells running on worker threads can record
 * failures concurrently.
 */
class ErrorLog {
public:
    ErrorLog() = default;

    ErrorLog(const ErrorLog& other);
    ErrorLog& operator=(const ErrorLog& other);

    void add(BuildError error);
    void clear();

    std::vector<BuildError> entries() const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    // Number of entries of a given kind
    size_t count(ErrorKind kind) const;

private:
    mutable std::mutex mutex_;
    std::vector<BuildError> entries_;
};

} // namespace cellbuild

#endif // CELLBUILD_ERRORS_HPP
