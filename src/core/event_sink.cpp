/**
 * @file event_sink.cpp
 * @brief Cache-backed event publisher
 *
 * @date 2025
 */

#include "cerberus/core/event_sink.hpp"
#include "cerberus/core/models.hpp"
#include "cerberus/storage/kv_cache.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace cerberus {
namespace core {

CacheEventPublisher::CacheEventPublisher(std::shared_ptr<storage::KeyValueCache> cache,
                                         std::string channel)
    : cache_(std::move(cache)), channel_(std::move(channel)) {
}

void CacheEventPublisher::Emit(const std::string& event_type, const json& data) {
    json envelope = {
        {"type", event_type},
        {"data", data},
        {"timestamp", FormatTimestamp(Clock::now())},
    };

    try {
        auto receivers = cache_->Publish(channel_, envelope.dump());
        spdlog::debug("Event {} published to {} subscriber(s)", event_type, receivers);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to publish event {}: {}", event_type, e.what());
    }
}

} // namespace core
} // namespace cerberus
