/**
 * @file file_cache.cpp
 * @brief Snapshot persistence for FileCache
 *
 * @date 2025
 */

#include "cerberus/storage/file_cache.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace cerberus {
namespace storage {

FileCache::FileCache(std::filesystem::path path, NowFunction now)
    : MemoryCache(std::move(now)), path_(std::move(path)) {
    Load();
}

void FileCache::Load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("State file {} not found, starting empty", path_.string());
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        spdlog::error("Cannot open state file {}", path_.string());
        return;
    }

    try {
        json snapshot;
        file >> snapshot;
        Restore(snapshot);
        spdlog::info("Restored cache state from {}", path_.string());
    } catch (const std::exception& e) {
        spdlog::error("Ignoring corrupt state file {}: {}", path_.string(), e.what());
    }
}

void FileCache::Save() {
    // Snapshot under the file lock so concurrent saves land in order
    std::lock_guard<std::mutex> lock(file_mutex_);
    json snapshot = Snapshot();

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Cannot write state file {}", tmp.string());
            return;
        }
        out << snapshot.dump();
        if (!out.good()) {
            spdlog::error("Short write to state file {}", tmp.string());
            return;
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        spdlog::error("Failed to replace state file {}: {}", path_.string(), ec.message());
    }
}

void FileCache::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    MemoryCache::Set(key, value, ttl);
    Save();
}

bool FileCache::Delete(const std::string& key) {
    bool removed = MemoryCache::Delete(key);
    if (removed) {
        Save();
    }
    return removed;
}

std::size_t FileCache::LPush(const std::string& key, const std::string& value) {
    auto size = MemoryCache::LPush(key, value);
    Save();
    return size;
}

bool FileCache::SAdd(const std::string& key, const std::string& member) {
    bool added = MemoryCache::SAdd(key, member);
    if (added) {
        Save();
    }
    return added;
}

bool FileCache::SRem(const std::string& key, const std::string& member) {
    bool removed = MemoryCache::SRem(key, member);
    if (removed) {
        Save();
    }
    return removed;
}

} // namespace storage
} // namespace cerberus
