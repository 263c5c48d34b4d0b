/**
 * @file instance_registry.cpp
 * @brief Instance map, cache mirroring and lock registry
 *
 * @date 2025
 */

#include "cerberus/core/instance_registry.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace cerberus {
namespace core {

InstanceRegistry::InstanceRegistry(std::shared_ptr<storage::KeyValueCache> cache,
                                   std::chrono::seconds default_ttl,
                                   std::chrono::seconds tombstone_ttl)
    : cache_(std::move(cache)), default_ttl_(default_ttl), tombstone_ttl_(tombstone_ttl) {
}

std::string InstanceRegistry::CacheKey(const std::string& instance_id) {
    return "instance:" + instance_id;
}

// ============================================================================
// RECORDS
// ============================================================================

void InstanceRegistry::Put(const ChallengeInstance& instance) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_[instance.id] = instance;
    }
    const long ttl = instance.RemainingSeconds(default_ttl_.count());
    Mirror(instance, std::chrono::seconds(ttl), true);
}

void InstanceRegistry::Retire(const ChallengeInstance& instance) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.erase(instance.id);
    }
    Mirror(instance, tombstone_ttl_, false);
}

void InstanceRegistry::Erase(const std::string& instance_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.erase(instance_id);
    }
    if (!cache_) {
        return;
    }
    try {
        cache_->Delete(CacheKey(instance_id));
        cache_->SRem(kIndexKey, instance_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to erase cached record {}: {}", instance_id, e.what());
    }
}

void InstanceRegistry::Mirror(const ChallengeInstance& instance, std::chrono::seconds ttl, bool indexed) {
    if (!cache_) {
        return;
    }
    try {
        cache_->Set(CacheKey(instance.id), json(instance).dump(), ttl);
        if (indexed) {
            cache_->SAdd(kIndexKey, instance.id);
        } else {
            cache_->SRem(kIndexKey, instance.id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist instance {}: {}", instance.id, e.what());
    }
}

std::optional<ChallengeInstance> InstanceRegistry::Get(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance_id);
    if (it == instances_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InstanceRegistry::Contains(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.count(instance_id) > 0;
}

std::vector<ChallengeInstance> InstanceRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChallengeInstance> result;
    result.reserve(instances_.size());
    for (const auto& [id, instance] : instances_) {
        result.push_back(instance);
    }
    return result;
}

std::vector<ChallengeInstance> InstanceRegistry::ListByUser(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChallengeInstance> result;
    for (const auto& [id, instance] : instances_) {
        if (instance.user_id == user_id) {
            result.push_back(instance);
        }
    }
    return result;
}

int InstanceRegistry::CountActiveForUser(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& [id, instance] : instances_) {
        if (instance.user_id == user_id && instance.IsActive()) {
            ++count;
        }
    }
    return count;
}

std::size_t InstanceRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

std::vector<ChallengeInstance> InstanceRegistry::LoadPersisted() {
    std::vector<ChallengeInstance> result;
    if (!cache_) {
        return result;
    }

    for (const auto& id : cache_->SMembers(kIndexKey)) {
        auto raw = cache_->Get(CacheKey(id));
        if (!raw) {
            // Record expired out of the cache
            cache_->SRem(kIndexKey, id);
            continue;
        }
        try {
            result.push_back(json::parse(*raw).get<ChallengeInstance>());
        } catch (const std::exception& e) {
            spdlog::warn("Dropping unreadable cached record {}: {}", id, e.what());
            cache_->SRem(kIndexKey, id);
        }
    }
    return result;
}

// ============================================================================
// LOCKS
// ============================================================================

std::shared_ptr<std::mutex> InstanceRegistry::InstanceLock(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& entry = instance_locks_[instance_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void InstanceRegistry::ReleaseInstanceLock(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    instance_locks_.erase(instance_id);
}

std::size_t InstanceRegistry::InstanceLockCount() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return instance_locks_.size();
}

std::shared_ptr<std::mutex> InstanceRegistry::UserLock(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& entry = user_locks_[user_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

} // namespace core
} // namespace cerberus
