/**
 * @file memory_cache.cpp
 * @brief Implementation of the in-process KeyValueCache
 *
 * @date 2025
 */

#include "cerberus/storage/memory_cache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

namespace cerberus {
namespace storage {

MemoryCache::MemoryCache(NowFunction now)
    : now_(std::move(now)) {
}

bool MemoryCache::IsExpired(const Entry& entry) const {
    return entry.expires_at.has_value() && now_() >= *entry.expires_at;
}

// ============================================================================
// Strings
// ============================================================================

std::optional<std::string> MemoryCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strings_.find(key);
    if (it == strings_.end()) {
        return std::nullopt;
    }
    if (IsExpired(it->second)) {
        strings_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryCache::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.value = value;
    if (ttl.count() > 0) {
        entry.expires_at = now_() + ttl;
    }
    strings_[key] = std::move(entry);
}

bool MemoryCache::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = strings_.erase(key) > 0;
    removed = (lists_.erase(key) > 0) || removed;
    removed = (sets_.erase(key) > 0) || removed;
    return removed;
}

// ============================================================================
// Lists
// ============================================================================

std::size_t MemoryCache::LPush(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = lists_[key];
    list.push_front(value);
    return list.size();
}

std::vector<std::string> MemoryCache::LRange(const std::string& key, long start, long stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lists_.find(key);
    if (it == lists_.end() || it->second.empty()) {
        return {};
    }

    const auto& list = it->second;
    const long size = static_cast<long>(list.size());
    if (start < 0) {
        start = std::max(0L, size + start);
    }
    if (stop < 0) {
        stop = size + stop;
    }
    stop = std::min(stop, size - 1);
    if (start > stop) {
        return {};
    }

    return std::vector<std::string>(list.begin() + start, list.begin() + stop + 1);
}

// ============================================================================
// Sets
// ============================================================================

bool MemoryCache::SAdd(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sets_[key].insert(member).second;
}

bool MemoryCache::SRem(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sets_.find(key);
    if (it == sets_.end()) {
        return false;
    }
    bool removed = it->second.erase(member) > 0;
    if (it->second.empty()) {
        sets_.erase(it);
    }
    return removed;
}

std::vector<std::string> MemoryCache::SMembers(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sets_.find(key);
    if (it == sets_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

// ============================================================================
// Pub/Sub
// ============================================================================

std::size_t MemoryCache::Publish(const std::string& channel, const std::string& payload) {
    std::vector<MessageCallback> receivers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.channel == channel) {
                receivers.push_back(sub.callback);
            }
        }
    }

    for (const auto& callback : receivers) {
        try {
            callback(channel, payload);
        } catch (const std::exception& e) {
            spdlog::warn("Subscriber on '{}' threw: {}", channel, e.what());
        }
    }
    return receivers.size();
}

int MemoryCache::Subscribe(const std::string& channel, MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_subscription_id_++;
    subscriptions_[id] = Subscription{channel, std::move(callback)};
    return id;
}

void MemoryCache::Unsubscribe(int subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(subscription_id);
}

// ============================================================================
// Snapshot support
// ============================================================================

json MemoryCache::Snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);

    json strings = json::object();
    for (const auto& [key, entry] : strings_) {
        if (IsExpired(entry)) {
            continue;
        }
        json e = {{"value", entry.value}};
        if (entry.expires_at) {
            e["expires_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.expires_at->time_since_epoch()).count();
        }
        strings[key] = e;
    }

    json lists = json::object();
    for (const auto& [key, list] : lists_) {
        lists[key] = std::vector<std::string>(list.begin(), list.end());
    }

    json sets = json::object();
    for (const auto& [key, set] : sets_) {
        sets[key] = std::vector<std::string>(set.begin(), set.end());
    }

    return {{"strings", strings}, {"lists", lists}, {"sets", sets}};
}

void MemoryCache::Restore(const json& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    strings_.clear();
    lists_.clear();
    sets_.clear();

    if (snapshot.contains("strings")) {
        for (auto it = snapshot["strings"].begin(); it != snapshot["strings"].end(); ++it) {
            Entry entry;
            entry.value = it.value().at("value").get<std::string>();
            if (it.value().contains("expires_at_ms")) {
                entry.expires_at = Clock::time_point(
                    std::chrono::milliseconds(it.value()["expires_at_ms"].get<long long>()));
            }
            if (!IsExpired(entry)) {
                strings_[it.key()] = std::move(entry);
            }
        }
    }

    if (snapshot.contains("lists")) {
        for (auto it = snapshot["lists"].begin(); it != snapshot["lists"].end(); ++it) {
            auto values = it.value().get<std::vector<std::string>>();
            lists_[it.key()] = std::deque<std::string>(values.begin(), values.end());
        }
    }

    if (snapshot.contains("sets")) {
        for (auto it = snapshot["sets"].begin(); it != snapshot["sets"].end(); ++it) {
            auto values = it.value().get<std::vector<std::string>>();
            sets_[it.key()] = std::set<std::string>(values.begin(), values.end());
        }
    }
}

} // namespace storage
} // namespace cerberus
