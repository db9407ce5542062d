#pragma once
// Backup Manager: timestamped copy of a document file before overwrite
//
// <backup_dir>/<name>_<YYYYMMDD_HHMMSS>.json, created lazily.
// Append-only: never deletes or rotates, never overwrites an earlier backup.
// Best effort: any failure is logged and reported as "no backup".

#include "types.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace niyama {

namespace fs = std::filesystem;

class BackupManager {
public:
    explicit BackupManager(std::string backup_dir)
        : backup_dir_(std::move(backup_dir)) {}

    // Returns the backup path, or nullopt if there was nothing to back up
    // or the copy failed.
    std::optional<std::string> backup(const std::string& source_path,
                                      const std::string& name) const {
        std::error_code ec;
        if (source_path.empty() || !fs::exists(source_path, ec)) {
            return std::nullopt;
        }

        fs::create_directories(backup_dir_, ec);
        if (ec) {
            std::cerr << "[backup] Cannot create " << backup_dir_ << ": " << ec.message() << "\n";
            return std::nullopt;
        }

        fs::path target = unique_target(name);

        fs::copy_file(source_path, target, fs::copy_options::none, ec);
        if (ec) {
            std::cerr << "[backup] Failed to back up " << source_path << ": " << ec.message() << "\n";
            return std::nullopt;
        }

        // Carry over permissions and mtime; content is already identical
        auto status = fs::status(source_path, ec);
        if (!ec) fs::permissions(target, status.permissions(), ec);
        auto mtime = fs::last_write_time(source_path, ec);
        if (!ec) fs::last_write_time(target, mtime, ec);
        if (ec) {
            std::cerr << "[backup] Copied " << target.string()
                      << " without source attributes: " << ec.message() << "\n";
        }

        return target.string();
    }

private:
    std::string backup_dir_;

    fs::path unique_target(const std::string& name) const {
        std::string base = name + "_" + compact_stamp(now());
        fs::path target = fs::path(backup_dir_) / (base + ".json");

        std::error_code ec;
        for (int n = 1; fs::exists(target, ec); ++n) {
            target = fs::path(backup_dir_) / (base + "_" + std::to_string(n) + ".json");
        }
        return target;
    }
};

} // namespace niyama
