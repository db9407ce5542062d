#pragma once
// RPC Types: tool schema, tool result and handler signature

#include "../types.hpp"
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace niyama::rpc {

// Entry in tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // text block
    json structured;          // optional structured payload

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message, const json& data = json()) {
        return {true, message, data};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;
using HandlerMap = std::unordered_map<std::string, ToolHandler>;

// Non-empty string argument, or nullopt
inline std::optional<std::string> string_arg(const json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_string()) return std::nullopt;
    std::string value = params[key].get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key) || params[key].is_null()) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

} // namespace niyama::rpc
