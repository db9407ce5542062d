#include <niyama/context_store.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>

namespace niyama {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Objects merge key by key, everything else replaces
void deep_merge(json& target, const json& patch) {
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (it->is_object() && target.contains(it.key()) && target[it.key()].is_object()) {
            deep_merge(target[it.key()], *it);
        } else {
            target[it.key()] = *it;
        }
    }
}

// Refresh last_updated. A non-object metadata is left for validation to reject.
void touch_metadata(json& doc) {
    if (!doc.contains("metadata")) doc["metadata"] = json::object();
    if (doc["metadata"].is_object()) doc["metadata"]["last_updated"] = iso8601_now();
}

int64_t optimization_count(const json& doc) {
    if (!doc.contains("metadata") || !doc["metadata"].is_object()) return 0;
    const json& meta = doc["metadata"];
    if (!meta.contains("optimization_count") || !meta["optimization_count"].is_number_integer()) return 0;
    return meta["optimization_count"].get<int64_t>();
}

StoreResult failure(const std::string& name, std::string error) {
    StoreResult r;
    r.context_name = name;
    r.error = std::move(error);
    return r;
}

std::optional<json> read_json_file(const fs::path& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open file";
        return std::nullopt;
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        error = e.what();
        return std::nullopt;
    }
}

} // anonymous namespace

ContextStore::ContextStore(std::string config_dir, bool auto_load, AuditHook* audit)
    : config_dir_(std::move(config_dir))
    , auto_load_(auto_load)
    , audit_(audit)
    , backups_((fs::path(config_dir_) / "backups").string())
{}

std::string ContextStore::tool_category(const std::string& tool_id) {
    auto colon = tool_id.find(':');
    return colon == std::string::npos ? tool_id : tool_id.substr(0, colon);
}

// ═══════════════════════════════════════════════════════════════════
// Loading
// ═══════════════════════════════════════════════════════════════════

size_t ContextStore::load_all() {
    std::map<std::string, Entry> loaded;

    if (!auto_load_) {
        std::cerr << "[context_store] Auto-loading of contexts is disabled\n";
    } else {
        std::error_code ec;
        std::vector<fs::path> preferred;
        std::vector<fs::path> fallback;

        fs::directory_iterator it(config_dir_, ec);
        if (ec) {
            std::cerr << "[context_store] Cannot read context directory " << config_dir_
                      << ": " << ec.message() << "\n";
        } else {
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) break;
                if (!it->is_regular_file(ec)) continue;
                std::string file = it->path().filename().string();
                if (ends_with(file, CONTEXT_SUFFIX)) {
                    preferred.push_back(it->path());
                } else if (ends_with(file, JSON_SUFFIX)) {
                    fallback.push_back(it->path());
                }
            }
            if (ec) {
                std::cerr << "[context_store] Directory scan of " << config_dir_
                          << " stopped early: " << ec.message() << "\n";
            }
        }

        std::sort(preferred.begin(), preferred.end());
        std::sort(fallback.begin(), fallback.end());
        std::cerr << "[context_store] Discovered " << (preferred.size() + fallback.size())
                  << " context files\n";

        auto load_file = [&loaded](const fs::path& path, const std::string& suffix) {
            std::string file = path.filename().string();
            std::string name = file.substr(0, file.size() - suffix.size());
            if (name.empty()) return;

            if (loaded.count(name)) {
                std::cerr << "[context_store] Skipping " << file << ": context '" << name
                          << "' already loaded from " << loaded[name].path << "\n";
                return;
            }

            std::string error;
            auto raw = read_json_file(path, error);
            if (!raw) {
                std::cerr << "[context_store] Error loading context file " << file << ": " << error << "\n";
                return;
            }

            auto report = validate(*raw);
            if (!report.ok()) {
                std::cerr << "[context_store] Skipping invalid context file " << file << ":\n";
                for (const auto& e : report.errors) std::cerr << "  - " << e << "\n";
                return;
            }
            for (const auto& w : report.warnings) {
                std::cerr << "[context_store] Warning in " << file << ": " << w << "\n";
            }

            try {
                auto doc = std::make_shared<const ContextDocument>(ContextDocument::from_json(*raw));
                loaded[name] = Entry{doc, path.string()};
                std::cerr << "[context_store] Loaded context: " << name << "\n";
            } catch (const std::exception& e) {
                std::cerr << "[context_store] Error loading context file " << file << ": " << e.what() << "\n";
            }
        };

        for (const auto& p : preferred) load_file(p, CONTEXT_SUFFIX);
        for (const auto& p : fallback) load_file(p, JSON_SUFFIX);
    }

    size_t count = loaded.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_ = std::move(loaded);
    }
    return count;
}

// ═══════════════════════════════════════════════════════════════════
// Reads
// ═══════════════════════════════════════════════════════════════════

std::optional<ContextStore::Entry> ContextStore::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

DocumentPtr ContextStore::get(const std::string& name) const {
    auto entry = find(name);
    return entry ? entry->doc : nullptr;
}

DocumentPtr ContextStore::get_by_tool(const std::string& tool_id) const {
    return get(tool_category(tool_id));
}

json ContextStore::get_syntax_rules(const std::string& tool_id) const {
    auto doc = get_by_tool(tool_id);
    if (!doc || doc->syntax_rules.is_null()) return json::object();
    return doc->syntax_rules;
}

json ContextStore::get_preferences(const std::string& tool_id) const {
    auto doc = get_by_tool(tool_id);
    if (!doc || doc->preferences.is_null()) return json::object();
    return doc->preferences;
}

bool ContextStore::should_auto_convert(const std::string& tool_id) const {
    auto doc = get_by_tool(tool_id);
    return doc && doc->should_auto_convert();
}

std::vector<std::string> ContextStore::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) out.push_back(name);
    return out;
}

std::vector<std::pair<std::string, DocumentPtr>> ContextStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<std::string, DocumentPtr>> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) out.emplace_back(name, entry.doc);
    return out;
}

size_t ContextStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::string ContextStore::file_path(const std::string& name) const {
    auto entry = find(name);
    return entry ? entry->path : std::string();
}

StoreResult ContextStore::not_found(const std::string& name) const {
    auto r = failure(name, "Context '" + name + "' not found");
    r.fields["available_contexts"] = names();
    return r;
}

// ═══════════════════════════════════════════════════════════════════
// Mutations
// ═══════════════════════════════════════════════════════════════════

StoreResult ContextStore::commit(const std::string& name, const std::string& path, const json& doc,
                                 StoreResult result, AuditOp op, json details) {
    auto report = validate(doc);
    result.warnings = report.warnings;
    if (!report.ok()) {
        result.success = false;
        result.error = "Validation failed for context '" + name + "'";
        result.fields["validation_errors"] = report.errors;
        return result;
    }

    DocumentPtr typed;
    try {
        typed = std::make_shared<const ContextDocument>(ContextDocument::from_json(doc));
    } catch (const std::exception& e) {
        result.success = false;
        result.error = std::string("Invalid document: ") + e.what();
        return result;
    }

    bool written = false;
    try {
        written = save_json(path, typed->to_json());
    } catch (const json::exception& e) {
        std::cerr << "[context_store] Cannot serialize '" << name << "': " << e.what() << "\n";
    }
    if (!written) {
        std::cerr << "[context_store] Failed to write " << path << "\n";
        result.success = false;
        result.error = "Failed to write context file " + path;
        return result;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[name] = Entry{typed, path};
    }

    if (audit_) audit_->record(op, name, std::move(details));

    result.success = true;
    result.fields["file_path"] = path;
    return result;
}

StoreResult ContextStore::create(const std::string& name, const std::string& category, const json& rules) {
    if (is_reserved_name(name)) {
        return failure(name, "Invalid context name '" + name + "': reserved name");
    }
    if (!matches_name_pattern(name)) {
        return failure(name, "Invalid context name '" + name +
                             "': use 1-50 letters, digits, underscores or hyphens");
    }
    if (!matches_name_pattern(category)) {
        return failure(name, "Invalid tool category '" + category +
                             "': use 1-50 letters, digits, underscores or hyphens");
    }
    if (!rules.is_null() && !rules.is_object()) {
        return failure(name, "Rules must be a JSON object");
    }

    fs::path dir(config_dir_);
    fs::path path = dir / (name + CONTEXT_SUFFIX);
    std::error_code ec;
    if (get(name) || fs::exists(path, ec) || fs::exists(dir / (name + JSON_SUFFIX), ec)) {
        auto r = failure(name, "Context '" + name + "' already exists");
        r.fields["available_contexts"] = names();
        return r;
    }

    json doc = json::object();
    doc["tool_category"] = category;
    if (rules.is_object()) {
        for (auto it = rules.begin(); it != rules.end(); ++it) {
            if (it.key() != "tool_category") doc[it.key()] = *it;
        }
    }

    json defaults = {
        {"version", DEFAULT_VERSION},
        {"last_updated", iso8601_now()},
        {"created_by", DEFAULT_CREATED_BY},
        {"applies_to_tools", json::array({category})},
        {"priority", DEFAULT_PRIORITY},
        {"optimization_count", 0}
    };
    if (doc.contains("metadata") && doc["metadata"].is_object()) {
        // Caller's metadata wins except for the fields the store owns
        json given = doc["metadata"];
        deep_merge(defaults, given);
        defaults["version"] = DEFAULT_VERSION;
        defaults["last_updated"] = iso8601_now();
    }
    if (!doc.contains("metadata") || doc["metadata"].is_object()) {
        doc["metadata"] = defaults;
    }

    fs::create_directories(dir, ec);
    if (ec) {
        return failure(name, "Cannot create context directory " + config_dir_ + ": " + ec.message());
    }

    StoreResult result;
    result.context_name = name;
    result.message = "Context '" + name + "' created";
    result.fields["tool_category"] = category;

    return commit(name, path.string(), doc, std::move(result), AuditOp::Created,
                  {{"tool_category", category}, {"file_path", path.string()}});
}

StoreResult ContextStore::update(const std::string& name, const json& updates) {
    auto entry = find(name);
    if (!entry) return not_found(name);
    if (!updates.is_object()) {
        return failure(name, "Updates must be a JSON object");
    }

    StoreResult result;
    result.context_name = name;
    auto backup = backups_.backup(entry->path, name);
    if (backup) result.fields["backup_path"] = *backup;

    json doc = entry->doc->to_json();
    int64_t previous_count = optimization_count(doc);
    json updated_fields = json::array();

    for (auto it = updates.begin(); it != updates.end(); ++it) {
        updated_fields.push_back(it.key());
        if (it.key() == "metadata" && it->is_object() && doc.contains("metadata") && doc["metadata"].is_object()) {
            deep_merge(doc["metadata"], *it);
        } else {
            doc[it.key()] = *it;
        }
    }

    touch_metadata(doc);
    if (doc["metadata"].is_object() && optimization_count(doc) < previous_count) {
        doc["metadata"]["optimization_count"] = previous_count;
    }

    result.message = "Context '" + name + "' updated";
    result.fields["updated_fields"] = updated_fields;

    return commit(name, entry->path, doc, std::move(result), AuditOp::Updated,
                  {{"updated_fields", updated_fields}});
}

StoreResult ContextStore::add_pattern(const std::string& name, const std::string& section,
                                      const std::string& pattern_name, const json& pattern_config) {
    if (!is_trigger_section(section)) {
        return failure(name, "Invalid section '" + section +
                             "': must be auto_store_triggers or auto_retrieve_triggers");
    }
    if (pattern_name.empty()) {
        return failure(name, "Pattern name must not be empty");
    }
    if (!pattern_config.is_object()) {
        return failure(name, "Pattern config must be a JSON object");
    }

    auto entry = find(name);
    if (!entry) return not_found(name);

    StoreResult result;
    result.context_name = name;
    auto backup = backups_.backup(entry->path, name);
    if (backup) result.fields["backup_path"] = *backup;

    json doc = entry->doc->to_json();
    if (!doc.contains(section) || doc[section].is_null()) {
        doc[section] = json::object();
    }
    doc[section][pattern_name] = pattern_config;
    touch_metadata(doc);

    result.message = "Pattern '" + pattern_name + "' added to " + section + " in context '" + name + "'";
    result.fields["section"] = section;
    result.fields["pattern_name"] = pattern_name;

    return commit(name, entry->path, doc, std::move(result), AuditOp::PatternAdded,
                  {{"section", section}, {"pattern_name", pattern_name}, {"pattern_config", pattern_config}});
}

StoreResult ContextStore::mark_optimized(const std::string& name, const std::string& summary) {
    auto entry = find(name);
    if (!entry) return not_found(name);

    StoreResult result;
    result.context_name = name;
    auto backup = backups_.backup(entry->path, name);
    if (backup) result.fields["backup_path"] = *backup;

    json doc = entry->doc->to_json();
    int64_t count = optimization_count(doc) + 1;
    touch_metadata(doc);
    doc["metadata"]["optimization_count"] = count;

    result.message = "Context '" + name + "' marked optimized";
    result.fields["optimization_count"] = count;

    json details = {{"optimization_count", count}};
    if (!summary.empty()) details["summary"] = summary;

    return commit(name, entry->path, doc, std::move(result), AuditOp::Optimized, std::move(details));
}

} // namespace niyama
