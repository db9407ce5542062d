#include <niyama/document.hpp>
#include <algorithm>
#include <stdexcept>

namespace niyama {

namespace {

std::string require_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

// Optional section: null when absent, object otherwise
json object_section(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return json();
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an object");
    }
    return *it;
}

StartupAction action_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("startup action must be an object");
    if (!j.contains("action") || !j["action"].is_string()) {
        throw std::invalid_argument("startup action must have an 'action' field");
    }

    StartupAction a;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "action") {
            a.action = it->get<std::string>();
        } else if (key == "parameters") {
            a.parameters = *it;
        } else if (key == "description" && it->is_string()) {
            a.description = it->get<std::string>();
        } else {
            a.extra[key] = *it;
        }
    }
    return a;
}

json action_to_json(const StartupAction& a) {
    json j = json::object();
    j["action"] = a.action;
    if (!a.parameters.is_null()) j["parameters"] = a.parameters;
    if (a.description) j["description"] = *a.description;
    for (auto it = a.extra.begin(); it != a.extra.end(); ++it) j[it.key()] = it.value();
    return j;
}

std::vector<std::string> keys_of(const json& j) {
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    return keys;
}

// Keys listed in order come first, in that order; the rest keep their place after
json in_order(const json& j, const std::vector<std::string>& order) {
    if (order.empty()) return j;
    json out = json::object();
    for (const auto& key : order) {
        if (j.contains(key)) out[key] = j[key];
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!out.contains(it.key())) out[it.key()] = it.value();
    }
    return out;
}

SessionInitialization session_from_json(const json& j) {
    SessionInitialization s;
    s.key_order = keys_of(j);
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "enabled") {
            if (!it->is_boolean()) throw std::invalid_argument("session_initialization.enabled must be a boolean");
            s.enabled = it->get<bool>();
        } else if (key == "actions") {
            if (!it->is_object()) throw std::invalid_argument("session_initialization.actions must be an object");
            s.has_actions = true;
            for (auto a = it->begin(); a != it->end(); ++a) {
                if (a.key() == "on_startup") {
                    if (!a->is_array()) {
                        throw std::invalid_argument("session_initialization.actions.on_startup must be a list");
                    }
                    std::vector<StartupAction> actions;
                    for (const auto& entry : *a) actions.push_back(action_from_json(entry));
                    s.on_startup = std::move(actions);
                } else {
                    s.actions_extra[a.key()] = a.value();
                }
            }
        } else {
            s.extra[key] = *it;
        }
    }
    return s;
}

json session_to_json(const SessionInitialization& s) {
    json j = json::object();
    if (s.enabled) j["enabled"] = *s.enabled;
    if (s.has_actions || s.on_startup) {
        json actions = json::object();
        if (s.on_startup) {
            json list = json::array();
            for (const auto& a : *s.on_startup) list.push_back(action_to_json(a));
            actions["on_startup"] = std::move(list);
        }
        for (auto it = s.actions_extra.begin(); it != s.actions_extra.end(); ++it) {
            actions[it.key()] = it.value();
        }
        j["actions"] = std::move(actions);
    }
    for (auto it = s.extra.begin(); it != s.extra.end(); ++it) j[it.key()] = it.value();
    return in_order(j, s.key_order);
}

DocumentMetadata metadata_from_json(const json& j) {
    DocumentMetadata m;
    m.key_order = keys_of(j);
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "version" && it->is_string()) {
            m.version = it->get<std::string>();
        } else if (key == "last_updated" && it->is_string()) {
            m.last_updated = it->get<std::string>();
        } else if (key == "created_by" && it->is_string()) {
            m.created_by = it->get<std::string>();
        } else if (key == "priority" && it->is_string()) {
            m.priority = it->get<std::string>();
        } else if (key == "optimization_count" && it->is_number_integer()) {
            m.optimization_count = it->get<int64_t>();
        } else if (key == "applies_to_tools" && it->is_array() &&
                   std::all_of(it->begin(), it->end(), [](const json& t) { return t.is_string(); })) {
            m.applies_to_tools = it->get<std::vector<std::string>>();
        } else {
            m.extra[key] = *it;
        }
    }
    return m;
}

json metadata_to_json(const DocumentMetadata& m) {
    json j = json::object();
    if (m.version) j["version"] = *m.version;
    if (m.last_updated) j["last_updated"] = *m.last_updated;
    if (m.created_by) j["created_by"] = *m.created_by;
    if (m.applies_to_tools) j["applies_to_tools"] = *m.applies_to_tools;
    if (m.priority) j["priority"] = *m.priority;
    if (m.optimization_count) j["optimization_count"] = *m.optimization_count;
    for (auto it = m.extra.begin(); it != m.extra.end(); ++it) j[it.key()] = it.value();
    return in_order(j, m.key_order);
}

} // anonymous namespace

ContextDocument ContextDocument::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("document must be a JSON object");

    ContextDocument doc;
    doc.key_order = keys_of(j);
    doc.tool_category = require_string(j, "tool_category");
    doc.description = require_string(j, "description");

    doc.syntax_rules = object_section(j, "syntax_rules");
    doc.preferences = object_section(j, "preferences");
    doc.auto_corrections = object_section(j, "auto_corrections");
    doc.auto_store_triggers = object_section(j, "auto_store_triggers");
    doc.auto_retrieve_triggers = object_section(j, "auto_retrieve_triggers");

    json session = object_section(j, "session_initialization");
    if (!session.is_null()) doc.session_initialization = session_from_json(session);

    json meta = object_section(j, "metadata");
    if (!meta.is_null()) doc.metadata = metadata_from_json(meta);

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "auto_convert") {
            if (!it->is_boolean()) throw std::invalid_argument("'auto_convert' must be a boolean");
            doc.auto_convert = it->get<bool>();
        } else if (key != "tool_category" && key != "description" &&
                   key != "syntax_rules" && key != "preferences" &&
                   key != "auto_corrections" && key != "session_initialization" &&
                   key != "auto_store_triggers" && key != "auto_retrieve_triggers" &&
                   key != "metadata") {
            doc.extra[key] = *it;
        }
    }
    return doc;
}

json ContextDocument::to_json() const {
    json j = json::object();
    j["tool_category"] = tool_category;
    j["description"] = description;
    if (auto_convert) j["auto_convert"] = *auto_convert;
    if (!syntax_rules.is_null()) j["syntax_rules"] = syntax_rules;
    if (!preferences.is_null()) j["preferences"] = preferences;
    if (!auto_corrections.is_null()) j["auto_corrections"] = auto_corrections;
    if (session_initialization) j["session_initialization"] = session_to_json(*session_initialization);
    if (!auto_store_triggers.is_null()) j["auto_store_triggers"] = auto_store_triggers;
    if (!auto_retrieve_triggers.is_null()) j["auto_retrieve_triggers"] = auto_retrieve_triggers;
    if (metadata) j["metadata"] = metadata_to_json(*metadata);
    for (auto it = extra.begin(); it != extra.end(); ++it) j[it.key()] = it.value();
    return in_order(j, key_order);
}

std::vector<CorrectionRule> ContextDocument::corrections() const {
    std::vector<CorrectionRule> rules;
    if (!auto_corrections.is_object()) return rules;

    for (auto it = auto_corrections.begin(); it != auto_corrections.end(); ++it) {
        const json& rule = it.value();
        if (!rule.is_object()) continue;
        auto pattern = rule.find("pattern");
        auto replacement = rule.find("replacement");
        if (pattern == rule.end() || replacement == rule.end()) continue;
        if (!pattern->is_string() || !replacement->is_string()) continue;
        rules.push_back({it.key(), pattern->get<std::string>(), replacement->get<std::string>()});
    }
    return rules;
}

const std::vector<StartupAction>& ContextDocument::startup_actions() const {
    static const std::vector<StartupAction> none;
    if (!session_initialization || !session_initialization->on_startup) return none;
    return *session_initialization->on_startup;
}

} // namespace niyama
