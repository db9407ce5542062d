#pragma once
// Audit Hook: records store mutations in the memory service
//
// Fire-and-forget. record() only enqueues; one worker thread delivers.
// The queue is bounded: when full, the oldest pending event is dropped.
// Audit loss is acceptable, blocking a mutation on it is not.

#include "memory_service.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace niyama {

enum class AuditOp {
    Created,
    Updated,
    PatternAdded,
    Optimized
};

inline const char* audit_op_name(AuditOp op) {
    switch (op) {
        case AuditOp::Created: return "created";
        case AuditOp::Updated: return "updated";
        case AuditOp::PatternAdded: return "pattern_added";
        case AuditOp::Optimized: return "optimized";
    }
    return "unknown";
}

struct AuditEvent {
    AuditOp op = AuditOp::Updated;
    std::string context_name;
    json details = json::object();
    Timestamp at = 0;
};

// Human-readable line stored as the memory content
inline std::string audit_summary(const AuditEvent& e) {
    const std::string& name = e.context_name;
    switch (e.op) {
        case AuditOp::Created:
            return "Context '" + name + "' created for tool category '" +
                   e.details.value("tool_category", name) + "'";
        case AuditOp::Updated: {
            std::string fields;
            if (e.details.contains("updated_fields")) {
                for (const auto& f : e.details["updated_fields"]) {
                    if (!fields.empty()) fields += ", ";
                    fields += f.is_string() ? f.get<std::string>() : f.dump();
                }
            }
            return "Context '" + name + "' updated" + (fields.empty() ? "" : ": " + fields);
        }
        case AuditOp::PatternAdded:
            return "Pattern '" + e.details.value("pattern_name", "") + "' added to " +
                   e.details.value("section", "") + " in context '" + name + "'";
        case AuditOp::Optimized:
            return "Context '" + name + "' optimized (" +
                   std::to_string(e.details.value("optimization_count", int64_t(0))) +
                   " optimizations)" +
                   (e.details.contains("summary") ? ": " + e.details.value("summary", "") : "");
    }
    return "Context '" + name + "' changed";
}

class AuditHook {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    struct Stats {
        size_t enqueued = 0;
        size_t delivered = 0;
        size_t failed = 0;
        size_t dropped = 0;
    };

    explicit AuditHook(MemoryService& memory, size_t capacity = DEFAULT_CAPACITY)
        : memory_(memory)
        , capacity_(capacity > 0 ? capacity : DEFAULT_CAPACITY)
    {}

    ~AuditHook() {
        stop();
    }

    AuditHook(const AuditHook&) = delete;
    AuditHook& operator=(const AuditHook&) = delete;

    void start() {
        if (running_.exchange(true)) return;  // Already running
        worker_ = std::thread([this]() { run_loop(); });
    }

    // Pending events are abandoned; the one being delivered finishes.
    void stop() {
        if (!running_.exchange(false)) return;  // Not running
        { std::lock_guard<std::mutex> lock(mutex_); }  // worker is waiting or will see the flag
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();

        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            std::cerr << "[audit] Dropping " << queue_.size() << " pending event(s) on shutdown\n";
            stats_.dropped += queue_.size();
            queue_.clear();
        }
    }

    bool is_running() const { return running_; }

    // Never blocks on the memory service
    void record(AuditOp op, const std::string& context_name, json details = json::object()) {
        AuditEvent event{op, context_name, std::move(details), now()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= capacity_) {
                std::cerr << "[audit] Queue full, dropping oldest event for '"
                          << queue_.front().context_name << "'\n";
                queue_.pop_front();
                stats_.dropped++;
            }
            queue_.push_back(std::move(event));
            stats_.enqueued++;
        }
        cv_.notify_all();
    }

    // Wait until nothing is pending or in flight. False on timeout.
    bool drain(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
            return queue_.empty() && !in_flight_;
        });
    }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    MemoryService& memory_;
    size_t capacity_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<AuditEvent> queue_;
    bool in_flight_ = false;
    Stats stats_;

    void run_loop() {
        while (true) {
            AuditEvent event;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
                if (!running_) break;
                event = std::move(queue_.front());
                queue_.pop_front();
                in_flight_ = true;
            }

            bool ok = deliver(event);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_ = false;
                if (ok) stats_.delivered++;
                else stats_.failed++;
            }
            idle_cv_.notify_all();
        }
        idle_cv_.notify_all();
    }

    bool deliver(const AuditEvent& event) {
        const char* op = audit_op_name(event.op);
        std::vector<std::string> tags = {"context_change", op, event.context_name, "automated"};
        json metadata = {
            {"operation", op},
            {"context_name", event.context_name},
            {"timestamp", iso8601(event.at)},
            {"details", event.details}
        };

        try {
            auto result = memory_.store(audit_summary(event), tags, metadata);
            if (!result.success) {
                std::cerr << "[audit] Failed to record " << op << " for '"
                          << event.context_name << "': " << result.error << "\n";
                return false;
            }
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[audit] Failed to record " << op << " for '"
                      << event.context_name << "': " << e.what() << "\n";
            return false;
        }
    }
};

} // namespace niyama
