#include <niyama/session.hpp>
#include <chrono>
#include <iostream>

namespace niyama {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

// Accepts ["a", "b"] or a single "a"
std::vector<std::string> tags_param(const StartupAction& action) {
    if (!action.parameters.is_object() || !action.parameters.contains("tags")) return {};
    const json& tags = action.parameters["tags"];
    std::vector<std::string> out;
    if (tags.is_string()) {
        out.push_back(tags.get<std::string>());
    } else if (tags.is_array()) {
        for (const auto& t : tags) {
            if (t.is_string()) out.push_back(t.get<std::string>());
        }
    }
    return out;
}

} // anonymous namespace

json SessionStatus::to_json() const {
    json actions = json::array();
    for (const auto& a : executed_actions) actions.push_back(a.to_json());
    return {
        {"initialized", initialized},
        {"initialization_time", initialization_time.empty() ? json() : json(initialization_time)},
        {"executed_actions", actions},
        {"errors", errors},
        {"memory_retrieval_results", memory_retrieval_results},
        {"execution_time_seconds", execution_time_seconds},
        {"initialized_contexts", initialized_contexts}
    };
}

void SessionInitializer::execute(const std::string& context, const StartupAction& action,
                                 SessionStatus& status) {
    ExecutedAction record;
    record.context = context;
    record.action = action.action;
    record.description = action.description.value_or("");

    MemoryResult result;
    bool known = true;

    try {
        if (action.action == "recall_memory") {
            std::string query = action.param<std::string>("query", "");
            int limit = action.param<int>("limit", action.param<int>("n_results", DEFAULT_RECALL_LIMIT));
            if (query.empty()) {
                result = MemoryResult::failure("recall_memory requires a 'query' parameter");
            } else {
                result = memory_.recall(query, limit);
                if (result.success) {
                    record.summary = "Recalled " + std::to_string(result.results.size()) +
                                     " memories for '" + query + "'";
                }
            }
        } else if (action.action == "search_by_tag") {
            auto tags = tags_param(action);
            int limit = action.param<int>("limit", DEFAULT_SEARCH_LIMIT);
            if (tags.empty()) {
                result = MemoryResult::failure("search_by_tag requires a 'tags' parameter");
            } else {
                result = memory_.search_by_tag(tags, limit);
                if (result.success) {
                    record.summary = "Found " + std::to_string(result.results.size()) +
                                     " memories tagged " + join(tags, ", ");
                }
            }
        } else if (action.action == "store_memory") {
            std::string content = action.param<std::string>("content", "");
            json metadata = action.param<json>("metadata", json::object());
            if (content.empty()) {
                result = MemoryResult::failure("store_memory requires a 'content' parameter");
            } else {
                result = memory_.store(content, tags_param(action), metadata);
                if (result.success) {
                    record.summary = "Stored memory" +
                                     (result.memory_id.empty() ? std::string() : " " + result.memory_id);
                }
            }
        } else {
            known = false;
        }
    } catch (const std::exception& e) {
        result = MemoryResult::failure(e.what());
    }

    if (!known) {
        record.success = false;
        record.summary = "Unknown action: " + action.action;
        std::cerr << "[session] " << context << ": unknown action '" << action.action << "'\n";
        status.executed_actions.push_back(std::move(record));
        return;
    }

    record.success = result.success;
    if (!result.success) {
        record.summary = "Failed: " + result.error;
        status.errors.push_back(context + "/" + action.action + ": " + result.error);
        std::cerr << "[session] " << context << "/" << action.action << " failed: " << result.error << "\n";
    } else if (action.action == "recall_memory" || action.action == "search_by_tag") {
        status.memory_retrieval_results[context + "_" + action.action] = result.results_json();
    }
    status.executed_actions.push_back(std::move(record));
}

SessionStatus SessionInitializer::run() {
    auto started = std::chrono::steady_clock::now();

    SessionStatus status;
    status.initialization_time = iso8601_now();

    for (const auto& [name, doc] : store_.snapshot()) {
        if (!doc->session_initialization || !doc->session_initialization->is_enabled()) continue;

        status.initialized_contexts.push_back(name);
        for (const auto& action : doc->startup_actions()) {
            execute(name, action, status);
        }
    }

    status.initialized = true;
    status.execution_time_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    std::cerr << "[session] Initialized " << status.initialized_contexts.size() << " context(s), "
              << status.executed_actions.size() << " action(s), "
              << status.errors.size() << " error(s)\n";

    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    return status;
}

} // namespace niyama
