#pragma once
// Process configuration, read once at startup
//
// Environment first, then command-line flags on top (see server.cpp).

#include <cctype>
#include <cstdlib>
#include <string>

namespace niyama {

struct Config {
    std::string config_dir = "./contexts";   // CONTEXT_CONFIG_DIR
    bool auto_load = true;                   // AUTO_LOAD_CONTEXTS
    std::string memory_socket;               // NIYAMA_MEMORY_SOCKET (empty: not configured)
    int memory_timeout_ms = 5000;            // NIYAMA_MEMORY_TIMEOUT_MS
    size_t audit_queue_capacity = 64;

    static Config from_env() {
        Config config;
        if (const char* dir = std::getenv("CONTEXT_CONFIG_DIR")) {
            if (*dir) config.config_dir = dir;
        }
        if (const char* flag = std::getenv("AUTO_LOAD_CONTEXTS")) {
            config.auto_load = parse_bool(flag, true);
        }
        if (const char* sock = std::getenv("NIYAMA_MEMORY_SOCKET")) {
            config.memory_socket = sock;
        }
        if (const char* ms = std::getenv("NIYAMA_MEMORY_TIMEOUT_MS")) {
            int value = std::atoi(ms);
            if (value > 0) config.memory_timeout_ms = value;
        }
        return config;
    }

    // "true"/"1"/"yes"/"on" (any case) are true, "false"/"0"/"no"/"off" false
    static bool parse_bool(const std::string& s, bool fallback) {
        std::string v;
        for (char c : s) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        return fallback;
    }
};

} // namespace niyama
