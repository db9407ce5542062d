#pragma once
// Memory Client: MemoryService over a Unix domain socket
//
// Newline-delimited JSON-RPC 2.0, one request in flight at a time.
// Every call is bounded by timeout_ms; a timeout drops the connection
// (the late reply would otherwise be read as the next answer) and is
// reported like any other failure.

#include "memory_service.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace niyama {

class SocketMemoryService : public MemoryService {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 5000;
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

    explicit SocketMemoryService(std::string socket_path, int timeout_ms = DEFAULT_TIMEOUT_MS);
    ~SocketMemoryService() override;

    // Non-copyable, non-movable (owns file descriptor)
    SocketMemoryService(const SocketMemoryService&) = delete;
    SocketMemoryService& operator=(const SocketMemoryService&) = delete;
    SocketMemoryService(SocketMemoryService&&) = delete;
    SocketMemoryService& operator=(SocketMemoryService&&) = delete;

    MemoryResult store(const std::string& content,
                       const std::vector<std::string>& tags,
                       const json& metadata) override;
    MemoryResult recall(const std::string& query, int limit) override;
    MemoryResult search_by_tag(const std::vector<std::string>& tags, int limit) override;
    MemoryResult stats() override;

private:
    std::string socket_path_;
    int timeout_ms_;
    int fd_ = -1;
    int64_t next_id_ = 1;
    std::string last_error_;
    bool timed_out_ = false;
    std::mutex mutex_;

    bool connect();
    void disconnect();

    // Send one request and return the JSON-RPC result object, or an
    // error string in last_error_. Caller holds mutex_.
    std::optional<json> call(const std::string& method, const json& params);
    std::optional<std::string> request(const std::string& line);
};

} // namespace niyama
