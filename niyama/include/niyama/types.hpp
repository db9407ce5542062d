#pragma once
// Core types: names, timestamps, atomic persistence
//
// Everything the store writes goes through safe_save(). Everything it
// names goes through valid_name().

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace niyama {

// Documents keep their key order on disk and in memory; auto_corrections
// depend on it.
using json = nlohmann::ordered_json;

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// ISO-8601 UTC with millisecond precision: 2024-05-01T09:30:12.345Z
inline std::string iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

inline std::string iso8601_now() { return iso8601(now()); }

// Local wall-clock stamp used in backup file names: 20240501_093012
inline std::string compact_stamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// Context names
// ═══════════════════════════════════════════════════════════════════════════

constexpr size_t MAX_NAME_LENGTH = 50;

inline const std::array<const char*, 4>& reserved_names() {
    static const std::array<const char*, 4> names = {"system", "admin", "config", "server"};
    return names;
}

// ^[A-Za-z0-9_-]{1,50}$
inline bool matches_name_pattern(const std::string& s) {
    if (s.empty() || s.size() > MAX_NAME_LENGTH) return false;
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

inline bool is_reserved_name(const std::string& s) {
    for (const char* r : reserved_names()) {
        if (s == r) return true;
    }
    return false;
}

inline bool valid_name(const std::string& s) {
    return matches_name_pattern(s) && !is_reserved_name(s);
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    ok = ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Serialized form of every document file: two-space indent, trailing newline
inline bool save_json(const std::string& path, const json& value) {
    std::string text = value.dump(2) + "\n";
    return safe_save(path, [&text](FILE* f) {
        return ::fwrite(text.data(), 1, text.size(), f) == text.size();
    });
}

} // namespace niyama
