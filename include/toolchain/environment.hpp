/**
 * environment.hpp
 * Immutable, case-insensitive environment-variable snapshot
 *
 * A snapshot is built once (from the process environment, from explicit
 * pairs, or by merging captured assignments over another snapshot) and never
 * mutated afterwards, so one instance can be shared across build cells.
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#ifndef CELLBUILD_ENVIRONMENT_HPP
#define CELLBUILD_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cellbuild {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

class EnvironmentSnapshot {
public:
    using Assignment = std::pair<std::string, std::string>;
    using Assignments = std::vector<Assignment>;

    EnvironmentSnapshot() = default;

    // Later duplicates (case-insensitive) replace earlier ones
    explicit EnvironmentSnapshot(const Assignments& variables);

    // Copy of the calling process's environment
    static EnvironmentSnapshot from_process_environment();

    /**
     * Parse a NAME=VALUE dump, one assignment per line.
     *
     * Lines are split on '\n' and '\r'. Each line is split on the first '='.
     * Lines without '=' or whose name is empty/whitespace are skipped.
     * Values may be empty and may contain further '=' characters.
     */
    static Assignments parse_assignments(const std::string& text);

    /**
     * New snapshot with `captured` merged over this one. Names already
     * present (case-insensitive) keep their original spelling and take the
     * captured value; new names are added.
     */
    EnvironmentSnapshot merged_with(const Assignments& captured) const;

    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const;
    size_t size() const { return variables_.size(); }
    bool empty() const { return variables_.empty(); }

    // Entries ordered case-insensitively by name
    Assignments entries() const;

    // Entries of PATH split on ':'
    std::vector<std::string> path_entries() const;

    bool operator==(const EnvironmentSnapshot& other) const;
    bool operator!=(const EnvironmentSnapshot& other) const { return !(*this == other); }

private:
    void assign(const std::string& name, const std::string& value);

    std::map<std::string, std::string, CaseInsensitiveLess> variables_;
};

} // namespace cellbuild

#endif // CELLBUILD_ENVIRONMENT_HPP
