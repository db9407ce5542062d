#pragma once
// RPC Handler: routes JSON-RPC requests to the context tools
//
// Owns nothing but the tool table. The store, session initializer and
// memory service are constructed by main() and outlive the handler.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/contexts.hpp"
#include "tools/mutations.hpp"
#include "tools/session.hpp"
#include "../version.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace niyama::rpc {

class Handler {
public:
    Handler(ContextStore& store, SessionInitializer& session, MemoryService& memory)
        : store_(store) {
        tools::contexts::register_schemas(tools_);
        tools::contexts::register_handlers(store, handlers_);

        tools::mutations::register_schemas(tools_);
        tools::mutations::register_handlers(store, handlers_);

        tools::session::register_schemas(tools_);
        tools::session::register_handlers(session, memory, handlers_);
    }

    // Process one request line. Returns the response line, or an empty
    // string for a notification.
    std::string handle(const std::string& request_str) {
        try {
            auto request = json::parse(request_str);
            auto response = handle_request(request);
            if (response.is_null()) return "";
            try {
                return response.dump();
            } catch (const json::type_error&) {
                return response.dump(-1, ' ', false, json::error_handler_t::replace);
            }
        } catch (const json::parse_error& e) {
            return make_error(json(), error::PARSE_ERROR,
                              std::string("JSON parse error: ") + e.what()).dump();
        } catch (const std::exception& e) {
            return make_error(json(), error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what()).dump();
        }
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }

    // Set once a shutdown request was answered
    bool shutdown_requested() const { return shutdown_; }

private:
    ContextStore& store_;
    std::vector<ToolSchema> tools_;
    HandlerMap handlers_;
    bool shutdown_ = false;

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        json response;
        if (info.method == "initialize") {
            response = handle_initialize(info.id);
        } else if (info.method == "tools/list") {
            response = handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            response = handle_tools_call(info.params, info.id);
        } else if (info.method == "shutdown") {
            response = handle_shutdown(info.id);
        } else if (info.method.rfind("notifications/", 0) == 0) {
            return json();
        } else {
            response = make_error(info.id, error::METHOD_NOT_FOUND,
                                  "Unknown method: " + info.method);
        }

        if (info.notification) return json();
        return response;
    }

    json handle_initialize(const json& id) {
        return make_result(id, {
            {"protocolVersion", NIYAMA_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", NIYAMA_SERVER_NAME},
                {"version", NIYAMA_VERSION}
            }},
            {"capabilities", {
                {"tools", {{"listChanged", false}}}
            }}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
        } catch (const std::exception& e) {
            std::cerr << "[niyama] Tool " << name << " failed: " << e.what() << "\n";
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }

    json handle_shutdown(const json& id) {
        shutdown_ = true;
        return make_result(id, {{"status", "ok"}, {"contexts", store_.size()}});
    }
};

} // namespace niyama::rpc
