#pragma once
// Memory service: the external store/recall/search contract
//
// The store never depends on it for correctness. Session initialization
// reads through it and the audit hook writes through it; both treat every
// failure (including timeouts) as a recorded, recoverable outcome.

#include "types.hpp"
#include <string>
#include <vector>

namespace niyama {

struct MemoryRecord {
    std::string content;
    double relevance = 0.0;
    std::vector<std::string> tags;
    std::string timestamp;

    static MemoryRecord from_json(const json& j) {
        MemoryRecord r;
        r.content = j.value("content", "");
        if (j.contains("relevance") && j["relevance"].is_number()) {
            r.relevance = j["relevance"].get<double>();
        }
        if (j.contains("tags") && j["tags"].is_array()) {
            for (const auto& t : j["tags"]) {
                if (t.is_string()) r.tags.push_back(t.get<std::string>());
            }
        }
        r.timestamp = j.value("timestamp", "");
        return r;
    }

    json to_json() const {
        return {
            {"content", content},
            {"relevance", relevance},
            {"tags", tags},
            {"timestamp", timestamp}
        };
    }
};

struct MemoryStats {
    int64_t total_memories = 0;
    json tags_available = json::array();
    std::string storage_backend;
    std::string service_status;
};

// Outcome of any memory-service call
struct MemoryResult {
    bool success = false;
    std::string error;
    std::string memory_id;              // store
    std::vector<MemoryRecord> results;  // recall, search_by_tag
    MemoryStats stats;                  // stats

    static MemoryResult failure(std::string message) {
        MemoryResult r;
        r.error = std::move(message);
        return r;
    }

    json results_json() const {
        json arr = json::array();
        for (const auto& r : results) arr.push_back(r.to_json());
        return arr;
    }

    json stats_json() const {
        json j = {{"success", success}};
        if (!success) {
            j["error"] = error;
            j["service_status"] = stats.service_status.empty() ? "unavailable" : stats.service_status;
            return j;
        }
        j["total_memories"] = stats.total_memories;
        j["tags_available"] = stats.tags_available;
        j["storage_backend"] = stats.storage_backend;
        j["service_status"] = stats.service_status;
        return j;
    }
};

class MemoryService {
public:
    virtual ~MemoryService() = default;

    virtual MemoryResult store(const std::string& content,
                               const std::vector<std::string>& tags,
                               const json& metadata) = 0;
    virtual MemoryResult recall(const std::string& query, int limit) = 0;
    virtual MemoryResult search_by_tag(const std::vector<std::string>& tags, int limit) = 0;
    virtual MemoryResult stats() = 0;
};

// Stand-in when no memory service is configured: every call fails cleanly.
class UnconfiguredMemoryService : public MemoryService {
public:
    MemoryResult store(const std::string&, const std::vector<std::string>&, const json&) override {
        return MemoryResult::failure("Memory service not configured");
    }
    MemoryResult recall(const std::string&, int) override {
        return MemoryResult::failure("Memory service not configured");
    }
    MemoryResult search_by_tag(const std::vector<std::string>&, int) override {
        return MemoryResult::failure("Memory service not configured");
    }
    MemoryResult stats() override {
        auto r = MemoryResult::failure("Memory service not configured");
        r.stats.service_status = "not_configured";
        return r;
    }
};

} // namespace niyama
