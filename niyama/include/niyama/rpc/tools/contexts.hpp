#pragma once
// RPC Context Tools: lookup and correction
//
// Read-only. A tool with no matching context gets an empty result,
// not an error.

#include "../types.hpp"
#include "../../context_store.hpp"
#include "../../corrections.hpp"

namespace niyama::rpc::tools::contexts {

inline json tool_name_schema(const char* description) {
    return {
        {"type", "object"},
        {"properties", {
            {"tool_name", {{"type", "string"}, {"description", description}}}
        }},
        {"required", {"tool_name"}}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "get_tool_context",
        "Get the full context document for a tool. The tool name may carry a "
        "specific suffix (\"git:commit\"); the part before ':' picks the context.",
        tool_name_schema("Name of the tool to get context for")
    });

    tools.push_back({
        "get_syntax_rules",
        "Get syntax rules for a tool.",
        tool_name_schema("Name of the tool to get syntax rules for")
    });

    tools.push_back({
        "get_preferences",
        "Get preferences for a tool.",
        tool_name_schema("Name of the tool to get preferences for")
    });

    tools.push_back({
        "should_auto_convert",
        "Whether text for this tool should be auto-corrected.",
        tool_name_schema("Name of the tool to check")
    });

    tools.push_back({
        "list_available_contexts",
        "List all loaded context names.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        }
    });

    tools.push_back({
        "apply_auto_corrections",
        "Apply the tool's auto-correction patterns to text, in order.",
        {
            {"type", "object"},
            {"properties", {
                {"tool_name", {{"type", "string"}, {"description", "Name of the tool to apply corrections for"}}},
                {"text", {{"type", "string"}, {"description", "Text to apply corrections to"}}}
            }},
            {"required", {"tool_name", "text"}}
        }
    });
}

inline ToolResult get_tool_context(const ContextStore& store, const json& params) {
    auto tool = string_arg(params, "tool_name");
    if (!tool) return ToolResult::error("tool_name is required");

    auto doc = store.get_by_tool(*tool);
    json result = doc ? doc->to_json() : json::object();
    return ToolResult::ok(result.dump(2), result);
}

inline ToolResult get_syntax_rules(const ContextStore& store, const json& params) {
    auto tool = string_arg(params, "tool_name");
    if (!tool) return ToolResult::error("tool_name is required");

    json rules = store.get_syntax_rules(*tool);
    return ToolResult::ok(rules.dump(2), rules);
}

inline ToolResult get_preferences(const ContextStore& store, const json& params) {
    auto tool = string_arg(params, "tool_name");
    if (!tool) return ToolResult::error("tool_name is required");

    json prefs = store.get_preferences(*tool);
    return ToolResult::ok(prefs.dump(2), prefs);
}

inline ToolResult should_auto_convert(const ContextStore& store, const json& params) {
    auto tool = string_arg(params, "tool_name");
    if (!tool) return ToolResult::error("tool_name is required");

    bool convert = store.should_auto_convert(*tool);
    return ToolResult::ok(convert ? "true" : "false",
                          {{"tool_name", *tool}, {"auto_convert", convert}});
}

inline ToolResult list_available_contexts(const ContextStore& store, const json&) {
    json names = store.names();
    return ToolResult::ok(names.dump(2), {{"contexts", names}});
}

inline ToolResult apply_auto_corrections(const ContextStore& store, const json& params) {
    auto tool = string_arg(params, "tool_name");
    if (!tool || !params.contains("text") || !params["text"].is_string()) {
        return ToolResult::error("tool_name and text are required");
    }

    auto corrected = apply_corrections(store, *tool, params["text"].get<std::string>());
    if (!corrected.success) return ToolResult::error(corrected.error);
    return ToolResult::ok(corrected.text);
}

inline void register_handlers(const ContextStore& store, HandlerMap& handlers) {
    handlers["get_tool_context"] = [&store](const json& p) { return get_tool_context(store, p); };
    handlers["get_syntax_rules"] = [&store](const json& p) { return get_syntax_rules(store, p); };
    handlers["get_preferences"] = [&store](const json& p) { return get_preferences(store, p); };
    handlers["should_auto_convert"] = [&store](const json& p) { return should_auto_convert(store, p); };
    handlers["list_available_contexts"] = [&store](const json& p) { return list_available_contexts(store, p); };
    handlers["apply_auto_corrections"] = [&store](const json& p) { return apply_auto_corrections(store, p); };
}

} // namespace niyama::rpc::tools::contexts
