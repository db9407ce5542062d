#pragma once
// Session Initializer: runs each context's on_startup actions
//
// Contexts are visited in name order, actions in declared order. A failing
// action is recorded and the run moves on; nothing here throws to the caller.
// Each run produces a fresh SessionStatus that replaces the previous one.

#include "context_store.hpp"
#include "memory_service.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace niyama {

struct ExecutedAction {
    std::string context;
    std::string action;
    bool success = false;
    std::string summary;
    std::string description;

    json to_json() const {
        json j = {
            {"context", context},
            {"action", action},
            {"success", success},
            {"summary", summary}
        };
        if (!description.empty()) j["description"] = description;
        return j;
    }
};

struct SessionStatus {
    bool initialized = false;
    std::string initialization_time;
    std::vector<ExecutedAction> executed_actions;
    std::vector<std::string> errors;
    json memory_retrieval_results = json::object();
    double execution_time_seconds = 0.0;
    std::vector<std::string> initialized_contexts;

    json to_json() const;
};

class SessionInitializer {
public:
    static constexpr int DEFAULT_RECALL_LIMIT = 5;
    static constexpr int DEFAULT_SEARCH_LIMIT = 10;

    SessionInitializer(const ContextStore& store, MemoryService& memory)
        : store_(store), memory_(memory) {}

    SessionStatus run();

    // Last completed run, or a never-initialized status
    SessionStatus status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

private:
    const ContextStore& store_;
    MemoryService& memory_;
    mutable std::mutex mutex_;
    SessionStatus status_;

    void execute(const std::string& context, const StartupAction& action, SessionStatus& status);
};

} // namespace niyama
