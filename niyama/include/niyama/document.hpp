#pragma once
// Context document: the unit of persistence
//
// Fields the store inspects are typed. Free-form sections (syntax rules,
// preferences, corrections, triggers) stay as ordered JSON so nothing a
// rule author wrote is lost or reordered. Unknown keys ride along in
// `extra` bags at every level.

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace niyama {

// One entry of session_initialization.actions.on_startup
struct StartupAction {
    std::string action;
    json parameters;                         // null when absent
    std::optional<std::string> description;
    json extra = json::object();

    // Parameter lookup with a default, tolerant of a missing/odd parameters object
    template<typename T>
    T param(const char* key, T default_val) const {
        if (!parameters.is_object() || !parameters.contains(key)) return default_val;
        try {
            return parameters[key].get<T>();
        } catch (const json::exception&) {
            return default_val;
        }
    }
};

struct SessionInitialization {
    std::optional<bool> enabled;
    bool has_actions = false;
    std::optional<std::vector<StartupAction>> on_startup;
    json actions_extra = json::object();     // siblings of on_startup
    json extra = json::object();
    std::vector<std::string> key_order;

    bool is_enabled() const { return enabled.value_or(false); }
};

struct DocumentMetadata {
    std::optional<std::string> version;
    std::optional<std::string> last_updated;
    std::optional<std::string> created_by;
    std::optional<std::vector<std::string>> applies_to_tools;
    std::optional<std::string> priority;
    std::optional<int64_t> optimization_count;
    json extra = json::object();
    std::vector<std::string> key_order;
};

// A single auto-correction rule as the engine sees it
struct CorrectionRule {
    std::string name;
    std::string pattern;
    std::string replacement;
};

class ContextDocument {
public:
    std::string tool_category;
    std::string description;
    std::optional<bool> auto_convert;
    json syntax_rules;                       // null when absent
    json preferences;
    json auto_corrections;                   // ordered name -> {pattern, replacement}
    std::optional<SessionInitialization> session_initialization;
    json auto_store_triggers;
    json auto_retrieve_triggers;
    std::optional<DocumentMetadata> metadata;
    json extra = json::object();             // unrecognized top-level keys
    std::vector<std::string> key_order;      // as read; to_json follows it

    // Build from a document that already passed validate(). Throws
    // std::invalid_argument (or json::exception) on shapes it cannot hold.
    static ContextDocument from_json(const json& j);

    json to_json() const;

    bool should_auto_convert() const { return auto_convert.value_or(false); }

    // Well-formed correction rules in stored order. Entries lacking a
    // string pattern or replacement are left out.
    std::vector<CorrectionRule> corrections() const;

    const std::vector<StartupAction>& startup_actions() const;
};

} // namespace niyama
