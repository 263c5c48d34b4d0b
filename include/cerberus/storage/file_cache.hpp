/**
 * @file file_cache.hpp
 * @brief MemoryCache persisted to a JSON snapshot file
 *
 * Every mutation rewrites the snapshot (write to `<path>.tmp`, then rename),
 * so instance records and the retry queue survive an orchestrator restart.
 * Intended for single-host deployments; the write volume is one record per
 * lifecycle transition.
 *
 * @date 2025
 */

#pragma once

#include "cerberus/storage/memory_cache.hpp"

#include <filesystem>

namespace cerberus {
namespace storage {

class FileCache : public MemoryCache {
public:
    /**
     * @brief Open (or create) a snapshot file
     *
     * An unreadable or corrupt snapshot is logged and treated as empty.
     */
    explicit FileCache(std::filesystem::path path,
                       NowFunction now = [] { return Clock::now(); });

    void Set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl = std::chrono::seconds(0)) override;
    bool Delete(const std::string& key) override;
    std::size_t LPush(const std::string& key, const std::string& value) override;
    bool SAdd(const std::string& key, const std::string& member) override;
    bool SRem(const std::string& key, const std::string& member) override;

    const std::filesystem::path& Path() const { return path_; }

private:
    void Load();
    void Save();

    std::filesystem::path path_;
    std::mutex file_mutex_;
};

} // namespace storage
} // namespace cerberus
