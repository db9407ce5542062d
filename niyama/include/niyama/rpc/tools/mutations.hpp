#pragma once
// RPC Mutation Tools: create, update, add pattern, mark optimized, reload
//
// Each tool maps a StoreResult onto a ToolResult; a failed mutation is a
// tool error carrying the same structured body.

#include "../types.hpp"
#include "../../context_store.hpp"

namespace niyama::rpc::tools::mutations {

inline ToolResult from_store_result(const StoreResult& r) {
    json body = r.to_json();
    if (r.success) return ToolResult::ok(body.dump(2), body);
    return ToolResult::error(body.dump(2), body);
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "create_context_file",
        "Create a new context document. Fails if a context of that name exists.",
        {
            {"type", "object"},
            {"properties", {
                {"context_name", {{"type", "string"}, {"pattern", "^[A-Za-z0-9_-]{1,50}$"},
                                  {"description", "Name of the new context"}}},
                {"tool_category", {{"type", "string"}, {"pattern", "^[A-Za-z0-9_-]{1,50}$"},
                                   {"description", "Tool category the context applies to"}}},
                {"rules", {{"type", "object"},
                           {"description", "Document body: description, syntax_rules, preferences, ..."}}}
            }},
            {"required", {"context_name", "tool_category", "rules"}}
        }
    });

    tools.push_back({
        "update_context_rules",
        "Merge updates into an existing context. Top-level keys are replaced; "
        "metadata is merged. The previous file is backed up first.",
        {
            {"type", "object"},
            {"properties", {
                {"context_name", {{"type", "string"}, {"description", "Context to update"}}},
                {"updates", {{"type", "object"}, {"description", "Top-level keys to replace"}}}
            }},
            {"required", {"context_name", "updates"}}
        }
    });

    tools.push_back({
        "add_context_pattern",
        "Add or replace a named trigger pattern in a context.",
        {
            {"type", "object"},
            {"properties", {
                {"context_name", {{"type", "string"}, {"description", "Context to modify"}}},
                {"pattern_section", {{"type", "string"},
                                     {"enum", {"auto_store_triggers", "auto_retrieve_triggers"}}}},
                {"pattern_name", {{"type", "string"}, {"description", "Name of the pattern"}}},
                {"pattern_config", {{"type", "object"}, {"description", "Pattern definition"}}}
            }},
            {"required", {"context_name", "pattern_section", "pattern_name", "pattern_config"}}
        }
    });

    tools.push_back({
        "mark_context_optimized",
        "Increment a context's optimization count.",
        {
            {"type", "object"},
            {"properties", {
                {"context_name", {{"type", "string"}, {"description", "Context that was optimized"}}},
                {"summary", {{"type", "string"}, {"description", "What changed (optional)"}}}
            }},
            {"required", {"context_name"}}
        }
    });

    tools.push_back({
        "reload_contexts",
        "Reload every context document from the configuration directory.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        }
    });
}

inline ToolResult create_context_file(ContextStore& store, const json& params) {
    std::string err = validate_required(params, {"context_name", "tool_category", "rules"});
    if (!err.empty()) return ToolResult::error(err);
    if (!params["context_name"].is_string() || !params["tool_category"].is_string()) {
        return ToolResult::error("context_name and tool_category must be strings");
    }

    return from_store_result(store.create(params["context_name"].get<std::string>(),
                                          params["tool_category"].get<std::string>(),
                                          params["rules"]));
}

inline ToolResult update_context_rules(ContextStore& store, const json& params) {
    std::string err = validate_required(params, {"context_name", "updates"});
    if (!err.empty()) return ToolResult::error(err);
    auto name = string_arg(params, "context_name");
    if (!name) return ToolResult::error("context_name must be a non-empty string");

    return from_store_result(store.update(*name, params["updates"]));
}

inline ToolResult add_context_pattern(ContextStore& store, const json& params) {
    std::string err = validate_required(params,
        {"context_name", "pattern_section", "pattern_name", "pattern_config"});
    if (!err.empty()) return ToolResult::error(err);
    auto name = string_arg(params, "context_name");
    if (!name) return ToolResult::error("context_name must be a non-empty string");
    if (!params["pattern_section"].is_string() || !params["pattern_name"].is_string()) {
        return ToolResult::error("pattern_section and pattern_name must be strings");
    }

    return from_store_result(store.add_pattern(*name,
                                               params["pattern_section"].get<std::string>(),
                                               params["pattern_name"].get<std::string>(),
                                               params["pattern_config"]));
}

inline ToolResult mark_context_optimized(ContextStore& store, const json& params) {
    auto name = string_arg(params, "context_name");
    if (!name) return ToolResult::error("Missing required parameter: context_name");

    std::string summary = string_arg(params, "summary").value_or("");
    return from_store_result(store.mark_optimized(*name, summary));
}

inline ToolResult reload_contexts(ContextStore& store, const json&) {
    size_t loaded = store.load_all();
    json body = {
        {"success", true},
        {"loaded", loaded},
        {"contexts", store.names()}
    };
    if (!store.auto_load()) body["message"] = "Auto-load disabled; no contexts loaded";
    return ToolResult::ok(body.dump(2), body);
}

inline void register_handlers(ContextStore& store, HandlerMap& handlers) {
    handlers["create_context_file"] = [&store](const json& p) { return create_context_file(store, p); };
    handlers["update_context_rules"] = [&store](const json& p) { return update_context_rules(store, p); };
    handlers["add_context_pattern"] = [&store](const json& p) { return add_context_pattern(store, p); };
    handlers["mark_context_optimized"] = [&store](const json& p) { return mark_context_optimized(store, p); };
    handlers["reload_contexts"] = [&store](const json& p) { return reload_contexts(store, p); };
}

} // namespace niyama::rpc::tools::mutations
