/**
 * @file test_storage.cpp
 * @brief MemoryCache, FileCache and CacheEventPublisher
 */

#include <gtest/gtest.h>

#include "cerberus/core/event_sink.hpp"
#include "cerberus/storage/file_cache.hpp"
#include "cerberus/storage/memory_cache.hpp"
#include "test_helpers.hpp"

#include <fstream>

using namespace cerberus;
using json = nlohmann::json;

namespace {

/// Manually advanced clock for TTL tests
struct FakeClock {
    storage::MemoryCache::Clock::time_point now{storage::MemoryCache::Clock::now()};
};

} // anonymous namespace

TEST(MemoryCacheTest, SetGetDelete) {
    storage::MemoryCache cache;
    EXPECT_FALSE(cache.Get("k").has_value());

    cache.Set("k", "v");
    EXPECT_EQ(cache.Get("k"), "v");

    EXPECT_TRUE(cache.Delete("k"));
    EXPECT_FALSE(cache.Delete("k"));
    EXPECT_FALSE(cache.Get("k").has_value());
}

TEST(MemoryCacheTest, TtlExpiry) {
    auto clock = std::make_shared<FakeClock>();
    storage::MemoryCache cache([clock] { return clock->now; });

    cache.Set("session", "x", std::chrono::seconds(10));
    cache.Set("forever", "y");

    clock->now += std::chrono::seconds(9);
    EXPECT_EQ(cache.Get("session"), "x");

    clock->now += std::chrono::seconds(1);
    EXPECT_FALSE(cache.Get("session").has_value());
    EXPECT_EQ(cache.Get("forever"), "y");
}

TEST(MemoryCacheTest, ListsPushToFront) {
    storage::MemoryCache cache;
    EXPECT_EQ(cache.LPush("q", "a"), 1u);
    EXPECT_EQ(cache.LPush("q", "b"), 2u);
    EXPECT_EQ(cache.LPush("q", "c"), 3u);

    EXPECT_EQ(cache.LRange("q", 0, -1), (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_EQ(cache.LRange("q", 1, 1), (std::vector<std::string>{"b"}));
    EXPECT_EQ(cache.LRange("q", -2, -1), (std::vector<std::string>{"b", "a"}));
    EXPECT_TRUE(cache.LRange("q", 5, 9).empty());
    EXPECT_TRUE(cache.LRange("other", 0, -1).empty());
}

TEST(MemoryCacheTest, Sets) {
    storage::MemoryCache cache;
    EXPECT_TRUE(cache.SAdd("s", "x"));
    EXPECT_FALSE(cache.SAdd("s", "x"));
    EXPECT_TRUE(cache.SAdd("s", "y"));
    EXPECT_EQ(cache.SMembers("s").size(), 2u);

    EXPECT_TRUE(cache.SRem("s", "x"));
    EXPECT_FALSE(cache.SRem("s", "x"));
    EXPECT_EQ(cache.SMembers("s"), (std::vector<std::string>{"y"}));
}

TEST(MemoryCacheTest, PublishReachesOnlyChannelSubscribers) {
    storage::MemoryCache cache;
    std::vector<std::string> received;

    int id = cache.Subscribe("events", [&](const std::string&, const std::string& payload) {
        received.push_back(payload);
    });
    cache.Subscribe("other", [&](const std::string&, const std::string&) {
        received.push_back("wrong channel");
    });

    EXPECT_EQ(cache.Publish("events", "one"), 1u);
    cache.Unsubscribe(id);
    EXPECT_EQ(cache.Publish("events", "two"), 0u);

    EXPECT_EQ(received, (std::vector<std::string>{"one"}));
}

TEST(FileCacheTest, SurvivesReopen) {
    test::TempDir dir;
    auto path = dir.Path() / "state.json";

    {
        storage::FileCache cache(path);
        cache.Set("instance:1", "{}", std::chrono::seconds(3600));
        cache.SAdd("instances:index", "1");
        cache.LPush("spawn_queue", "req");
    }

    storage::FileCache reopened(path);
    EXPECT_EQ(reopened.Get("instance:1"), "{}");
    EXPECT_EQ(reopened.SMembers("instances:index"), (std::vector<std::string>{"1"}));
    EXPECT_EQ(reopened.LRange("spawn_queue", 0, -1), (std::vector<std::string>{"req"}));
}

TEST(FileCacheTest, CorruptSnapshotStartsEmpty) {
    test::TempDir dir;
    auto path = dir.Path() / "state.json";
    {
        std::ofstream out(path);
        out << "garbage{";
    }

    storage::FileCache cache(path);
    EXPECT_FALSE(cache.Get("anything").has_value());

    cache.Set("k", "v");
    storage::FileCache reopened(path);
    EXPECT_EQ(reopened.Get("k"), "v");
}

TEST(CacheEventPublisherTest, PublishesEnvelope) {
    auto cache = std::make_shared<storage::MemoryCache>();
    json envelope;
    cache->Subscribe(core::CacheEventPublisher::kDefaultChannel,
                     [&](const std::string&, const std::string& payload) {
                         envelope = json::parse(payload);
                     });

    core::CacheEventPublisher publisher(cache);
    publisher.Emit("instance.spawned", {{"instance_id", "abc"}});

    EXPECT_EQ(envelope["type"], "instance.spawned");
    EXPECT_EQ(envelope["data"]["instance_id"], "abc");
    EXPECT_TRUE(envelope.contains("timestamp"));
}
