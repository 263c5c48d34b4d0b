/**
 * @file memory_cache.hpp
 * @brief Thread-safe in-process KeyValueCache
 *
 * Values expire lazily: an expired key is dropped the next time it is read.
 *
 * @date 2025
 */

#pragma once

#include "cerberus/storage/kv_cache.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <set>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace storage {

/**
 * @class MemoryCache
 * @brief Map-backed cache with TTLs, lists, sets and synchronous pub/sub
 *
 * Subscribers are invoked on the publishing thread, outside the cache lock,
 * so a callback may itself use the cache.
 */
class MemoryCache : public KeyValueCache {
public:
    using Clock = std::chrono::system_clock;
    using NowFunction = std::function<Clock::time_point()>;

    /**
     * @param now Time source used for TTL expiry (injectable for tests)
     */
    explicit MemoryCache(NowFunction now = [] { return Clock::now(); });
    ~MemoryCache() override = default;

    std::optional<std::string> Get(const std::string& key) override;
    void Set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl = std::chrono::seconds(0)) override;
    bool Delete(const std::string& key) override;

    std::size_t LPush(const std::string& key, const std::string& value) override;
    std::vector<std::string> LRange(const std::string& key, long start, long stop) override;

    bool SAdd(const std::string& key, const std::string& member) override;
    bool SRem(const std::string& key, const std::string& member) override;
    std::vector<std::string> SMembers(const std::string& key) override;

    std::size_t Publish(const std::string& channel, const std::string& payload) override;
    int Subscribe(const std::string& channel, MessageCallback callback) override;
    void Unsubscribe(int subscription_id) override;

protected:
    /// Serialise all stored data (not subscriptions)
    nlohmann::json Snapshot();

    /// Replace all stored data; entries already expired are skipped
    void Restore(const nlohmann::json& snapshot);

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expires_at;
    };

    struct Subscription {
        std::string channel;
        MessageCallback callback;
    };

    bool IsExpired(const Entry& entry) const;

    NowFunction now_;
    std::mutex mutex_;
    std::map<std::string, Entry> strings_;
    std::map<std::string, std::deque<std::string>> lists_;
    std::map<std::string, std::set<std::string>> sets_;
    std::map<int, Subscription> subscriptions_;
    int next_subscription_id_{1};
};

} // namespace storage
} // namespace cerberus
