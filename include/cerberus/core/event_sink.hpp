/**
 * @file event_sink.hpp
 * @brief Lifecycle event publication
 *
 * Event types emitted by the ChallengeManager:
 * - `instance.spawned`
 * - `instance.destroyed`
 * - `instance.extended`
 * - `instance.health_degraded`
 * - `instance.health_recovered`
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace storage {
class KeyValueCache;
}

namespace core {

/**
 * @class EventSink
 * @brief Fire-and-forget event consumer
 *
 * Emit() must not throw; delivery failures are the sink's concern.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void Emit(const std::string& event_type, const nlohmann::json& data) = 0;
};

/**
 * @class CacheEventPublisher
 * @brief Publishes `{"type", "data", "timestamp"}` envelopes on a cache channel
 */
class CacheEventPublisher : public EventSink {
public:
    static constexpr const char* kDefaultChannel = "orchestrator:events";

    explicit CacheEventPublisher(std::shared_ptr<storage::KeyValueCache> cache,
                                 std::string channel = kDefaultChannel);

    void Emit(const std::string& event_type, const nlohmann::json& data) override;

    const std::string& Channel() const { return channel_; }

private:
    std::shared_ptr<storage::KeyValueCache> cache_;
    std::string channel_;
};

} // namespace core
} // namespace cerberus
