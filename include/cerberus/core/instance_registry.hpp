/**
 * @file instance_registry.hpp
 * @brief Authoritative in-memory instance map mirrored into the cache
 *
 * Active records live in memory and under `instance:<id>` in the cache with a
 * TTL equal to the time left until expiry. Their ids are kept in the
 * `instances:index` set so that a restarted orchestrator can find them again.
 * Destroyed records are written once more as tombstones and dropped from the
 * index.
 *
 * The registry also hands out the per-instance and per-user mutexes used by
 * the ChallengeManager to serialise operations.
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/models.hpp"
#include "cerberus/storage/kv_cache.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cerberus {
namespace core {

/**
 * @class InstanceRegistry
 * @brief Thread-safe store of active instance records
 *
 * The in-memory map is authoritative; the cache copy exists for recovery and
 * for status queries on retired instances.
 */
class InstanceRegistry {
public:
    /// Cache set holding the ids of every non-retired record
    static constexpr const char* kIndexKey = "instances:index";

    /**
     * @param cache Mirror target; may be null for a purely in-memory registry
     * @param default_ttl Cache TTL of records without expires_at
     * @param tombstone_ttl Cache TTL of retired records
     */

    InstanceRegistry(std::shared_ptr<storage::KeyValueCache> cache,
                     std::chrono::seconds default_ttl,
                     std::chrono::seconds tombstone_ttl);

    /// `instance:<id>`
    static std::string CacheKey(const std::string& instance_id);

    /**
     * @brief Insert or replace a record and mirror it into the cache
     *
     * Cache failures are logged; the in-memory copy stays authoritative.
     */
    void Put(const ChallengeInstance& instance);

    /// Copy of an in-memory record; retired records are not returned
    std::optional<ChallengeInstance> Get(const std::string& instance_id) const;

    bool Contains(const std::string& instance_id) const;

    /**
     * @brief Drop a destroyed record from memory, keeping a cache tombstone
     */
    void Retire(const ChallengeInstance& instance);

    /**
     * @brief Drop a record from memory and cache without a tombstone
     */
    void Erase(const std::string& instance_id);

    /// Copies of every in-memory record, for iteration without holding the lock
    std::vector<ChallengeInstance> Snapshot() const;

    std::vector<ChallengeInstance> ListByUser(const std::string& user_id) const;

    /// Records in an active state for a user (the quota count)
    int CountActiveForUser(const std::string& user_id) const;

    std::size_t Size() const;

    /**
     * @brief Read every indexed record back from the cache
     *
     * Unparseable entries and stale index members are skipped and removed.
     */
    std::vector<ChallengeInstance> LoadPersisted();

    /// Mutex serialising operations on one instance
    std::shared_ptr<std::mutex> InstanceLock(const std::string& instance_id);

    /// Forget the mutex of a retired instance
    void ReleaseInstanceLock(const std::string& instance_id);

    /// Instance mutexes currently handed out
    std::size_t InstanceLockCount() const;

    /// Mutex serialising quota check and reservation for one user
    std::shared_ptr<std::mutex> UserLock(const std::string& user_id);

private:
    void Mirror(const ChallengeInstance& instance, std::chrono::seconds ttl, bool indexed);

    std::shared_ptr<storage::KeyValueCache> cache_;     ///< Null: no persistence
    std::chrono::seconds default_ttl_;
    std::chrono::seconds tombstone_ttl_;

    mutable std::mutex mutex_;                          ///< Guards instances_
    std::map<std::string, ChallengeInstance> instances_;

    mutable std::mutex locks_mutex_;                    ///< Guards both lock maps
    std::map<std::string, std::shared_ptr<std::mutex>> instance_locks_;  ///< Released when a record retires
    std::map<std::string, std::shared_ptr<std::mutex>> user_locks_;      ///< Kept for the process lifetime
};

} // namespace core
} // namespace cerberus
