/**
 * errors.cpp
 * Error taxonomy implementation
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "core/errors.hpp"

#include <algorithm>
#include <sstream>

namespace cellbuild {

// =============================================================================
// ConfigurationError
// =============================================================================

ConfigurationError::ConfigurationError(std::string field, std::string value,
                                       Reason reason, const std::string& message)
    : std::runtime_error(message)
    , field_(std::move(field))
    , value_(std::move(value))
    , reason_(reason)
{
}

const char* reason_to_string(ConfigurationError::Reason reason) {
    using R = ConfigurationError::Reason;
    switch (reason) {
        case R::MISSING:                   return "missing";
        case R::NOT_A_DIRECTORY:           return "not_a_directory";
        case R::NOT_A_FILE:                return "not_a_file";
        case R::ILLEGAL_CHARACTERS:        return "illegal_characters";
        case R::NOT_ABSOLUTE:              return "not_absolute";
        case R::RELATIVE_WITHOUT_BASE:     return "relative_without_base";
        case R::NOT_FOUND_IN_SEARCH_PATHS: return "not_found_in_search_paths";
        case R::MISSING_PARENT:            return "missing_parent";
        case R::EMPTY:                     return "empty";
        case R::ROOT_PATH:                 return "root_path";
    }
    return "unknown";
}

// =============================================================================
// InvalidArchitectureSelection / EnvironmentCaptureError
// =============================================================================

InvalidArchitectureSelection::InvalidArchitectureSelection(Architecture requested)
    : std::invalid_argument(
          "Exactly one architecture flag must be set, got: " + cellbuild::to_string(requested))
    , requested_(requested)
{
}

EnvironmentCaptureError::EnvironmentCaptureError(Architecture arch,
                                                 std::string install_path,
                                                 const std::string& detail)
    : std::runtime_error(
          "Failed to capture toolchain environment for " + cellbuild::to_string(arch) +
          " from " + install_path + ": " + detail)
    , arch_(arch)
    , install_path_(std::move(install_path))
{
}

// =============================================================================
// BuildError
// =============================================================================

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION_ERROR:            return "configuration_error";
        case ErrorKind::TOOLCHAIN_NOT_FOUND:            return "toolchain_not_found";
        case ErrorKind::INVALID_ARCHITECTURE_SELECTION: return "invalid_architecture_selection";
        case ErrorKind::ENVIRONMENT_CAPTURE_ERROR:      return "environment_capture_error";
        case ErrorKind::COMPILATION_FAILURE:            return "compilation_failure";
        case ErrorKind::LINK_FAILURE:                   return "link_failure";
        case ErrorKind::LIBRARIAN_FAILURE:              return "librarian_failure";
        case ErrorKind::PROCESS_INVOCATION_ERROR:       return "process_invocation_error";
        case ErrorKind::CLEAN_FAILURE:                  return "clean_failure";
        case ErrorKind::ARTIFACT_COPY_FAILURE:          return "artifact_copy_failure";
        case ErrorKind::CANCELLED:                      return "cancelled";
    }
    return "unknown";
}

std::string BuildError::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_kind_to_string(kind) << "]";
    if (configuration && architecture) {
        oss << " " << cellbuild::to_string(*configuration)
            << " " << cellbuild::to_string(*architecture);
    }
    if (exit_code) {
        oss << " (exit " << *exit_code << ")";
    }
    oss << ": " << message;
    return oss.str();
}

// =============================================================================
// ErrorLog
// =============================================================================

ErrorLog::ErrorLog(const ErrorLog& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    entries_ = other.entries_;
}

ErrorLog& ErrorLog::operator=(const ErrorLog& other) {
    if (this != &other) {
        std::vector<BuildError> copy = other.entries();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::move(copy);
    }
    return *this;
}

void ErrorLog::add(BuildError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(error));
}

void ErrorLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::vector<BuildError> ErrorLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t ErrorLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ErrorLog::count(ErrorKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [kind](const BuildError& e) { return e.kind == kind; }));
}

} // namespace cellbuild
