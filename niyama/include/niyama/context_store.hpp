#pragma once
// Context Store: name -> document map backed by a directory of JSON files
//
// Every mutation follows the same shape:
//   check inputs -> back up existing file -> compute new document ->
//   validate -> write (atomic rename) -> swap in memory -> audit.
// The map entry is swapped only after the write reached disk, so readers
// never see content that is not on disk.
//
// Callers serialize mutations. Reads may run concurrently with each other
// and with a mutation; they get a snapshot pointer.

#include "audit.hpp"
#include "backup.hpp"
#include "document.hpp"
#include "validator.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace niyama {

using DocumentPtr = std::shared_ptr<const ContextDocument>;

// Structured outcome of a mutating operation
struct StoreResult {
    bool success = false;
    std::string context_name;
    std::string message;                  // on success
    std::string error;                    // on failure
    json fields = json::object();         // operation-specific extras
    std::vector<std::string> warnings;

    json to_json() const {
        json j = {{"success", success}};
        if (success) j["message"] = message;
        else j["error"] = error;
        j["context_name"] = context_name;
        for (auto it = fields.begin(); it != fields.end(); ++it) j[it.key()] = it.value();
        if (!warnings.empty()) j["warnings"] = warnings;
        return j;
    }
};

// Sections add_pattern() may write into
inline bool is_trigger_section(const std::string& section) {
    return section == "auto_store_triggers" || section == "auto_retrieve_triggers";
}

class ContextStore {
public:
    static constexpr const char* CONTEXT_SUFFIX = "_context.json";
    static constexpr const char* JSON_SUFFIX = ".json";
    static constexpr const char* DEFAULT_VERSION = "1.0.0";
    static constexpr const char* DEFAULT_PRIORITY = "medium";
    static constexpr const char* DEFAULT_CREATED_BY = "context_store";

    // audit may be null (no audit trail)
    ContextStore(std::string config_dir, bool auto_load, AuditHook* audit = nullptr);

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    // Rebuild the map from disk. Returns the number of documents loaded.
    // With auto-load disabled the store stays empty.
    size_t load_all();

    // "<category>:<specific>" or "<category>" -> document, or null
    DocumentPtr get_by_tool(const std::string& tool_id) const;
    DocumentPtr get(const std::string& name) const;

    json get_syntax_rules(const std::string& tool_id) const;
    json get_preferences(const std::string& tool_id) const;
    bool should_auto_convert(const std::string& tool_id) const;

    std::vector<std::string> names() const;
    std::vector<std::pair<std::string, DocumentPtr>> snapshot() const;
    size_t size() const;

    // Path of the file backing `name`, empty if not loaded
    std::string file_path(const std::string& name) const;

    StoreResult create(const std::string& name, const std::string& category, const json& rules);
    StoreResult update(const std::string& name, const json& updates);
    StoreResult add_pattern(const std::string& name, const std::string& section,
                            const std::string& pattern_name, const json& pattern_config);
    StoreResult mark_optimized(const std::string& name, const std::string& summary);

    bool auto_load() const { return auto_load_; }

    static std::string tool_category(const std::string& tool_id);

private:
    struct Entry {
        DocumentPtr doc;
        std::string path;
    };

    std::string config_dir_;
    bool auto_load_;
    AuditHook* audit_;
    BackupManager backups_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;

    std::optional<Entry> find(const std::string& name) const;
    StoreResult not_found(const std::string& name) const;

    // Validate, write and swap in. `result` carries the fields gathered so far.
    StoreResult commit(const std::string& name, const std::string& path, const json& doc,
                       StoreResult result, AuditOp op, json details);
};

} // namespace niyama
