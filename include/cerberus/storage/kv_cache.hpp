/**
 * @file kv_cache.hpp
 * @brief Durable key-value cache interface (Redis-like subset)
 *
 * The orchestrator needs only a small set of primitives from its cache:
 * string values with TTL for instance records, a list for the retry queue,
 * a set for the record index and fire-and-forget pub/sub for lifecycle
 * events.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cerberus {
namespace storage {

/**
 * @class KeyValueCache
 * @brief Abstract cache backend
 *
 * Implementations must be safe to call from multiple threads.
 */
class KeyValueCache {
public:
    using MessageCallback = std::function<void(const std::string& channel, const std::string& payload)>;

    virtual ~KeyValueCache() = default;

    virtual std::optional<std::string> Get(const std::string& key) = 0;

    /**
     * @brief Store a value
     * @param ttl Expiry; zero means the value never expires
     */
    virtual void Set(const std::string& key, const std::string& value,
                     std::chrono::seconds ttl = std::chrono::seconds(0)) = 0;

    /// @return true if the key existed
    virtual bool Delete(const std::string& key) = 0;

    /// Prepend to a list, returning its new length
    virtual std::size_t LPush(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Read a list slice (inclusive bounds, negative indices count from the end)
     */
    virtual std::vector<std::string> LRange(const std::string& key, long start, long stop) = 0;

    /// @return true if the member was added
    virtual bool SAdd(const std::string& key, const std::string& member) = 0;

    /// @return true if the member was removed
    virtual bool SRem(const std::string& key, const std::string& member) = 0;

    virtual std::vector<std::string> SMembers(const std::string& key) = 0;

    /// @return number of subscribers that received the message
    virtual std::size_t Publish(const std::string& channel, const std::string& payload) = 0;

    /// @return subscription handle for Unsubscribe()
    virtual int Subscribe(const std::string& channel, MessageCallback callback) = 0;

    virtual void Unsubscribe(int subscription_id) = 0;
};

} // namespace storage
} // namespace cerberus
