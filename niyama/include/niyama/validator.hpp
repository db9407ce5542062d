#pragma once
// Document Validator: required fields, section types, version format
//
// Pure and deterministic. Errors block a write; warnings never do.

#include "types.hpp"
#include <fstream>
#include <ostream>
#include <regex>
#include <string>
#include <vector>

namespace niyama {

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }
};

// Sections that must be JSON objects when present
inline const std::vector<std::string>& object_sections() {
    static const std::vector<std::string> sections = {
        "syntax_rules",
        "preferences",
        "auto_corrections",
        "session_initialization",
        "auto_store_triggers",
        "auto_retrieve_triggers",
        "metadata",
    };
    return sections;
}

inline bool is_semver(const std::string& version) {
    static const std::regex semver{"^\\d+\\.\\d+\\.\\d+"};
    return std::regex_search(version, semver);
}

namespace detail {

inline void validate_session_initialization(const json& session, ValidationReport& report) {
    if (session.contains("enabled") && !session["enabled"].is_boolean()) {
        report.errors.push_back("session_initialization.enabled must be a boolean");
    }
    if (!session.contains("actions")) return;

    const json& actions = session["actions"];
    if (!actions.is_object()) {
        report.errors.push_back("session_initialization.actions must be an object");
        return;
    }
    if (!actions.contains("on_startup")) return;

    const json& on_startup = actions["on_startup"];
    if (!on_startup.is_array()) {
        report.errors.push_back("session_initialization.actions.on_startup must be a list");
        return;
    }
    for (size_t i = 0; i < on_startup.size(); ++i) {
        const json& action = on_startup[i];
        std::string where = "session_initialization.actions.on_startup[" + std::to_string(i) + "]";
        if (!action.is_object()) {
            report.errors.push_back(where + " must be an object");
        } else if (!action.contains("action") || !action["action"].is_string()) {
            report.errors.push_back(where + " must have a string 'action' field");
        }
    }
}

inline void validate_metadata(const json& metadata, ValidationReport& report) {
    if (metadata.contains("version")) {
        const json& version = metadata["version"];
        if (!version.is_string()) {
            report.errors.push_back("metadata.version must be a string");
        } else if (!is_semver(version.get<std::string>())) {
            report.warnings.push_back("metadata.version should follow semantic versioning (x.y.z)");
        }
    }
    if (metadata.contains("optimization_count") && !metadata["optimization_count"].is_number_integer()) {
        report.errors.push_back("metadata.optimization_count must be an integer");
    }
}

} // namespace detail

inline ValidationReport validate(const json& doc) {
    ValidationReport report;

    if (!doc.is_object()) {
        report.errors.push_back("Document must be a JSON object");
        return report;
    }

    for (const char* field : {"tool_category", "description"}) {
        if (!doc.contains(field)) {
            report.errors.push_back(std::string("Missing required field: ") + field);
        } else if (!doc[field].is_string()) {
            report.errors.push_back(std::string("Field '") + field + "' must be a string");
        }
    }

    if (doc.contains("tool_category") && doc["tool_category"].is_string() &&
        !matches_name_pattern(doc["tool_category"].get<std::string>())) {
        report.errors.push_back(
            "tool_category must be 1-50 characters of letters, digits, underscores and hyphens");
    }

    if (doc.contains("auto_convert") && !doc["auto_convert"].is_boolean()) {
        report.errors.push_back("auto_convert must be a boolean");
    }

    for (const auto& section : object_sections()) {
        if (doc.contains(section) && !doc[section].is_object()) {
            report.errors.push_back(section + " must be an object");
        }
    }

    if (doc.contains("session_initialization") && doc["session_initialization"].is_object()) {
        detail::validate_session_initialization(doc["session_initialization"], report);
    }
    if (doc.contains("metadata") && doc["metadata"].is_object()) {
        detail::validate_metadata(doc["metadata"], report);
    }

    return report;
}

// Unreadable or unparseable files are reported as errors
inline ValidationReport validate_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        ValidationReport report;
        report.errors.push_back("cannot open file");
        return report;
    }
    try {
        return validate(json::parse(in));
    } catch (const json::parse_error& e) {
        ValidationReport report;
        report.errors.push_back(std::string("invalid JSON: ") + e.what());
        return report;
    }
}

// Prints one [OK]/[WARN]/[ERROR] line per finding and a summary.
// Returns the exit status: 1 if any file has an error, 0 otherwise.
inline int check_files(const std::vector<std::string>& paths, std::ostream& out) {
    size_t failed = 0;
    for (const auto& path : paths) {
        auto report = validate_file(path);
        for (const auto& w : report.warnings) out << "[WARN] " << path << ": " << w << "\n";
        for (const auto& e : report.errors) out << "[ERROR] " << path << ": " << e << "\n";
        if (report.ok()) {
            out << "[OK] " << path << "\n";
        } else {
            failed++;
        }
    }
    out << "\n" << (paths.size() - failed) << " of " << paths.size() << " file(s) valid\n";
    return failed > 0 ? 1 : 0;
}

} // namespace niyama
