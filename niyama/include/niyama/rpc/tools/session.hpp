#pragma once
// RPC Session Tools: startup actions and memory service status

#include "../types.hpp"
#include "../../memory_service.hpp"
#include "../../session.hpp"

namespace niyama::rpc::tools::session {

inline void register_schemas(std::vector<ToolSchema>& tools) {
    json no_args = {
        {"type", "object"},
        {"properties", json::object()},
        {"required", json::array()}
    };

    tools.push_back({
        "execute_session_initialization",
        "Run the on_startup actions of every context with session initialization enabled.",
        no_args
    });

    tools.push_back({
        "get_session_status",
        "Status of the last session initialization run.",
        no_args
    });

    tools.push_back({
        "get_memory_stats",
        "Statistics from the memory service.",
        no_args
    });
}

inline ToolResult execute_session_initialization(SessionInitializer& init, const json&) {
    json body = init.run().to_json();
    return ToolResult::ok(body.dump(2), body);
}

inline ToolResult get_session_status(const SessionInitializer& init, const json&) {
    json body = init.status().to_json();
    return ToolResult::ok(body.dump(2), body);
}

inline ToolResult get_memory_stats(MemoryService& memory, const json&) {
    json body = memory.stats().stats_json();
    return ToolResult::ok(body.dump(2), body);
}

inline void register_handlers(SessionInitializer& init, MemoryService& memory, HandlerMap& handlers) {
    handlers["execute_session_initialization"] = [&init](const json& p) {
        return execute_session_initialization(init, p);
    };
    handlers["get_session_status"] = [&init](const json& p) { return get_session_status(init, p); };
    handlers["get_memory_stats"] = [&memory](const json& p) { return get_memory_stats(memory, p); };
}

} // namespace niyama::rpc::tools::session
