#include <niyama/memory_client.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

namespace niyama {

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

MemoryResult records_from(const json& result) {
    MemoryResult r;
    r.success = result.value("success", true);
    if (!r.success) {
        r.error = result.value("error", "Memory service reported failure");
        return r;
    }
    if (result.contains("results") && result["results"].is_array()) {
        for (const auto& item : result["results"]) {
            if (item.is_object()) r.results.push_back(MemoryRecord::from_json(item));
        }
    }
    return r;
}

} // anonymous namespace

SocketMemoryService::SocketMemoryService(std::string socket_path, int timeout_ms)
    : socket_path_(std::move(socket_path))
    , timeout_ms_(timeout_ms > 0 ? timeout_ms : DEFAULT_TIMEOUT_MS) {}

SocketMemoryService::~SocketMemoryService() {
    disconnect();
}

bool SocketMemoryService::connect() {
    if (fd_ >= 0) return true;  // Already connected

    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("connect() failed: ") + strerror(errno);
        close(fd_);
        fd_ = -1;
        return false;
    }

    return true;
}

void SocketMemoryService::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

std::optional<std::string> SocketMemoryService::request(const std::string& line) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

    std::string msg = line + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                pollfd pfd = {fd_, POLLOUT, 0};
                if (poll(&pfd, 1, remaining_ms(deadline)) == 0) {
                    timed_out_ = true;
                    last_error_ = "Timed out after " + std::to_string(timeout_ms_) + "ms sending request";
                    return std::nullopt;
                }
                continue;
            }
            last_error_ = std::string("send() failed: ") + strerror(errno);
            return std::nullopt;
        }
        sent += static_cast<size_t>(n);
    }

    std::string response;
    pollfd pfd = {fd_, POLLIN, 0};

    while (true) {
        int ret = poll(&pfd, 1, remaining_ms(deadline));

        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            return std::nullopt;
        }

        if (ret == 0) {
            timed_out_ = true;
            last_error_ = "Timed out after " + std::to_string(timeout_ms_) + "ms waiting for response";
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = read(fd_, buf, sizeof(buf));

        if (n <= 0) {
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            return std::nullopt;
        }

        response.append(buf, static_cast<size_t>(n));
        if (response.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response exceeds " + std::to_string(MAX_RESPONSE_SIZE) + " bytes";
            return std::nullopt;
        }

        size_t pos = response.find('\n');
        if (pos != std::string::npos) {
            return response.substr(0, pos);
        }
    }
}

std::optional<json> SocketMemoryService::call(const std::string& method, const json& params) {
    json req = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };

    std::optional<std::string> raw;
    timed_out_ = false;
    // One reconnect attempt: the service may have restarted since last call.
    // A timeout is final; retrying would double the caller's wait.
    for (int attempt = 0; attempt < 2 && !raw && !timed_out_; ++attempt) {
        if (!connect()) continue;
        raw = request(req.dump());
        if (!raw) disconnect();
    }
    if (!raw) {
        std::cerr << "[memory_client] " << method << " failed: " << last_error_ << "\n";
        return std::nullopt;
    }

    try {
        auto resp = json::parse(*raw);
        if (resp.contains("error")) {
            const json& err = resp["error"];
            last_error_ = err.is_object() ? err.value("message", "Unknown error") : err.dump();
            return std::nullopt;
        }
        if (!resp.contains("result") || !resp["result"].is_object()) {
            last_error_ = "Malformed response: missing result object";
            return std::nullopt;
        }
        return resp["result"];
    } catch (const json::exception& e) {
        last_error_ = std::string("Malformed response: ") + e.what();
        disconnect();
        return std::nullopt;
    }
}

MemoryResult SocketMemoryService::store(const std::string& content,
                                        const std::vector<std::string>& tags,
                                        const json& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = call("store", {{"content", content}, {"tags", tags}, {"metadata", metadata}});
    if (!result) return MemoryResult::failure(last_error_);

    MemoryResult r;
    try {
        r.success = result->value("success", true);
        if (r.success) {
            r.memory_id = result->value("memory_id", "");
        } else {
            r.error = result->value("error", "Memory service reported failure");
        }
    } catch (const json::exception& e) {
        return MemoryResult::failure(std::string("Malformed store result: ") + e.what());
    }
    return r;
}

MemoryResult SocketMemoryService::recall(const std::string& query, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = call("recall", {{"query", query}, {"limit", limit}});
    if (!result) return MemoryResult::failure(last_error_);
    try {
        return records_from(*result);
    } catch (const json::exception& e) {
        return MemoryResult::failure(std::string("Malformed recall result: ") + e.what());
    }
}

MemoryResult SocketMemoryService::search_by_tag(const std::vector<std::string>& tags, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = call("search_by_tag", {{"tags", tags}, {"limit", limit}});
    if (!result) return MemoryResult::failure(last_error_);
    try {
        return records_from(*result);
    } catch (const json::exception& e) {
        return MemoryResult::failure(std::string("Malformed search result: ") + e.what());
    }
}

MemoryResult SocketMemoryService::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = call("stats", json::object());
    if (!result) return MemoryResult::failure(last_error_);

    MemoryResult r;
    try {
        r.success = result->value("success", true);
        if (!r.success) {
            r.error = result->value("error", "Memory service reported failure");
            r.stats.service_status = result->value("service_status", "error");
            return r;
        }
        r.stats.total_memories = result->value("total_memories", int64_t(0));
        if (result->contains("tags_available")) r.stats.tags_available = (*result)["tags_available"];
        r.stats.storage_backend = result->value("storage_backend", "unknown");
        r.stats.service_status = result->value("service_status", "healthy");
    } catch (const json::exception& e) {
        return MemoryResult::failure(std::string("Malformed stats result: ") + e.what());
    }
    return r;
}

} // namespace niyama
