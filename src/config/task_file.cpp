/**
 * task_file.cpp
 * INI-like task description reader
 *
 * Copyright (c) 2025 cellbuild contributors
 */

#include "config/task_file.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <vector>

namespace cellbuild {

TaskFileError::TaskFileError(size_t line, const std::string& message)
    : std::runtime_error(line == 0 ? message
                                   : "line " + std::to_string(line) + ": " + message)
    , line_(line) {}

namespace {

struct Value {
    bool is_array = false;
    std::string scalar;
    std::vector<std::string> items;
    size_t line = 0;
};

using Section = std::map<std::string, Value>;

const std::map<std::string, std::set<std::string>>& known_keys() {
    static const std::map<std::string, std::set<std::string>> keys = {
        {"toolchain", {"backend", "minimum_version"}},
        {"matrix", {"configurations", "architectures"}},
        {"task", {"working_directory", "strict_paths", "sources", "include_paths",
                  "library_paths", "libraries", "compiler_flags", "linker_flags",
                  "intermediary_directory", "output_directory", "output_name",
                  "output_type", "auto_copy_includes"}},
    };
    return keys;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Drops a trailing "# ..." that is not inside a quoted string
std::string strip_comment(const std::string& line) {
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') in_quotes = !in_quotes;
        if (line[i] == '#' && !in_quotes) return line.substr(0, i);
    }
    return line;
}

bool only_separators(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c == ',' || std::isspace(c) != 0;
    });
}

Value parse_value(const std::string& raw, size_t line_num) {
    Value value;
    value.line = line_num;

    if (raw.empty()) {
        throw TaskFileError(line_num, "Missing value");
    }

    if (raw.front() == '[') {
        if (raw.size() < 2 || raw.back() != ']') {
            throw TaskFileError(line_num, "Unterminated array: " + raw);
        }
        value.is_array = true;
        std::string content = raw.substr(1, raw.size() - 2);

        // Comma-separated quoted strings
        static const std::regex item_regex("\"([^\"]*)\"");
        std::sregex_iterator it(content.begin(), content.end(), item_regex);
        std::sregex_iterator end;
        std::string tail = content;

        while (it != end) {
            if (!only_separators(it->prefix().str())) {
                throw TaskFileError(line_num, "Array items must be quoted strings: " + raw);
            }
            value.items.push_back((*it)[1].str());
            tail = it->suffix().str();
            ++it;
        }
        if (!only_separators(tail)) {
            throw TaskFileError(line_num, "Array items must be quoted strings: " + raw);
        }
        return value;
    }

    if (raw.front() == '"') {
        if (raw.size() < 2 || raw.back() != '"') {
            throw TaskFileError(line_num, "Unterminated string: " + raw);
        }
        value.scalar = raw.substr(1, raw.size() - 2);
        return value;
    }

    value.scalar = raw;
    return value;
}

std::string as_string(const Value& v, const std::string& key) {
    if (v.is_array) {
        throw TaskFileError(v.line, "Expected a string for '" + key + "'");
    }
    return v.scalar;
}

std::vector<std::string> as_array(const Value& v, const std::string& key) {
    if (!v.is_array) {
        throw TaskFileError(v.line, "Expected an array for '" + key + "'");
    }
    return v.items;
}

bool as_bool(const Value& v, const std::string& key) {
    std::string s = as_string(v, key);
    if (s == "true") return true;
    if (s == "false") return false;
    throw TaskFileError(v.line, "Expected true or false for '" + key + "': " + s);
}

const Value* find(const std::map<std::string, Section>& sections,
                  const std::string& section, const std::string& key) {
    auto s = sections.find(section);
    if (s == sections.end()) return nullptr;
    auto k = s->second.find(key);
    return k == s->second.end() ? nullptr : &k->second;
}

// Syntax pass: sections of key -> raw value, all names checked
std::map<std::string, Section> read_sections(const std::string& text) {
    std::map<std::string, Section> sections;
    std::string current_section;

    std::istringstream stream(text);
    std::string line;
    size_t line_num = 0;

    while (std::getline(stream, line)) {
        line_num++;

        line = trim(strip_comment(line));
        if (line.empty() || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            if (line.back() != ']') {
                throw TaskFileError(line_num, "Invalid section header: " + line);
            }
            current_section = trim(line.substr(1, line.size() - 2));
            if (known_keys().count(current_section) == 0) {
                throw TaskFileError(line_num, "Unknown section: [" + current_section + "]");
            }
            sections[current_section];
            continue;
        }

        // key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw TaskFileError(line_num, "Expected key = value: " + line);
        }
        if (current_section.empty()) {
            throw TaskFileError(line_num, "Key outside of any section: " + line);
        }

        std::string key = trim(line.substr(0, eq_pos));
        if (key.empty()) {
            throw TaskFileError(line_num, "Missing key: " + line);
        }
        if (known_keys().at(current_section).count(key) == 0) {
            throw TaskFileError(line_num,
                "Unknown key '" + key + "' in [" + current_section + "]");
        }

        Section& section = sections[current_section];
        if (section.count(key) != 0) {
            throw TaskFileError(line_num, "Duplicate key '" + key + "'");
        }
        section.emplace(key, parse_value(trim(line.substr(eq_pos + 1)), line_num));
    }

    return sections;
}

} // namespace

// =============================================================================
// parse_task_file
// =============================================================================

TaskFile parse_task_file(const std::string& text, const fs::path& base_dir) {
    const auto sections = read_sections(text);
    TaskFile result;

    // [toolchain]
    if (const Value* v = find(sections, "toolchain", "backend")) {
        std::string name = as_string(*v, "backend");
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name != "msvc" && name != "gcc") {
            throw TaskFileError(v->line, "Unknown toolchain backend: " + name);
        }
        result.backend = name;
    }
    if (const Value* v = find(sections, "toolchain", "minimum_version")) {
        std::string text_value = as_string(*v, "minimum_version");
        auto version = parse_toolchain_version(text_value);
        if (!version) {
            throw TaskFileError(v->line, "Invalid toolchain version: " + text_value);
        }
        result.minimum_version = *version;
    }

    // [matrix]
    if (const Value* v = find(sections, "matrix", "configurations")) {
        for (const auto& name : as_array(*v, "configurations")) {
            auto cfg = parse_configuration(name);
            if (!cfg) throw TaskFileError(v->line, "Unknown build configuration: " + name);
            result.configurations = result.configurations | *cfg;
        }
    }
    if (const Value* v = find(sections, "matrix", "architectures")) {
        for (const auto& name : as_array(*v, "architectures")) {
            auto arch = parse_architecture(name);
            if (!arch) throw TaskFileError(v->line, "Unknown architecture: " + name);
            result.architectures = result.architectures | *arch;
        }
    }

    // [task], in dependency order
    CompilerTaskConfig& task = result.task;

    if (const Value* v = find(sections, "task", "strict_paths")) {
        task.set_strict_paths(as_bool(*v, "strict_paths"));
    }

    fs::path working = base_dir;
    if (const Value* v = find(sections, "task", "working_directory")) {
        fs::path declared(as_string(*v, "working_directory"));
        working = (declared.is_relative() && !base_dir.empty()) ? base_dir / declared : declared;
    }
    if (!working.empty()) {
        task.set_working_directory(working.lexically_normal().string());
    }

    auto resolve = [&working](const std::string& path) {
        fs::path p(path);
        if (p.is_absolute() || working.empty()) return path;
        return (working / p).lexically_normal().string();
    };
    auto resolve_all = [&resolve](std::vector<std::string> paths) {
        for (auto& p : paths) p = resolve(p);
        return paths;
    };

    if (const Value* v = find(sections, "task", "intermediary_directory")) {
        task.set_intermediary_directory(resolve(as_string(*v, "intermediary_directory")));
    }
    if (const Value* v = find(sections, "task", "output_directory")) {
        task.set_output_directory(resolve(as_string(*v, "output_directory")));
    }
    if (const Value* v = find(sections, "task", "output_name")) {
        task.set_output_file_name(as_string(*v, "output_name"));
    }
    if (const Value* v = find(sections, "task", "output_type")) {
        std::string name = as_string(*v, "output_type");
        auto type = parse_assembly_type(name);
        if (!type) throw TaskFileError(v->line, "Unknown output type: " + name);
        task.set_output_assembly_type(*type);
    }

    // Sources stay relative; the config resolves them against the working directory
    if (const Value* v = find(sections, "task", "sources")) {
        task.set_sources(as_array(*v, "sources"));
    }
    if (const Value* v = find(sections, "task", "include_paths")) {
        task.set_include_paths(resolve_all(as_array(*v, "include_paths")));
    }
    if (const Value* v = find(sections, "task", "library_paths")) {
        task.set_library_paths(resolve_all(as_array(*v, "library_paths")));
    }
    if (const Value* v = find(sections, "task", "libraries")) {
        std::vector<std::string> libraries = as_array(*v, "libraries");
        for (auto& lib : libraries) {
            // Bare names are searched in the library paths
            if (lib.find('/') != std::string::npos) lib = resolve(lib);
        }
        task.set_additional_libraries(std::move(libraries));
    }
    if (const Value* v = find(sections, "task", "compiler_flags")) {
        task.set_compiler_flags(as_array(*v, "compiler_flags"));
    }
    if (const Value* v = find(sections, "task", "linker_flags")) {
        task.set_linker_flags(as_array(*v, "linker_flags"));
    }
    if (const Value* v = find(sections, "task", "auto_copy_includes")) {
        task.set_auto_copy_includes(as_bool(*v, "auto_copy_includes"));
    }

    return result;
}

TaskFile load_task_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw TaskFileError(0, "Cannot open task file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    fs::path base_dir = ec ? path.parent_path() : absolute.parent_path();

    return parse_task_file(buffer.str(), base_dir);
}

} // namespace cellbuild
