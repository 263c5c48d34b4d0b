/**
 * @file test_command_handler.cpp
 * @brief JSON-lines control protocol
 */

#include <gtest/gtest.h>

#include "cerberus/cli/command_handler.hpp"
#include "cerberus/storage/memory_cache.hpp"
#include "test_helpers.hpp"

using namespace cerberus;
using json = nlohmann::json;

namespace {

class CommandHandlerTest : public ::testing::Test {
protected:
    CommandHandlerTest()
        : provider_(std::make_shared<test::FakeProvider>()),
          manager_(core::OrchestratorConfig{},
                   providers::ProviderTable{{core::SandboxType::CONTAINER, provider_}},
                   std::make_shared<storage::MemoryCache>()),
          handler_(manager_) {
        manager_.SetSleeper([](std::chrono::milliseconds) {});
    }

    json Run(const json& command) {
        return json::parse(handler_.HandleLine(command.dump()));
    }

    std::string SpawnOne(const std::string& user = "alice") {
        auto response = Run({{"command", "spawn"}, {"challenge_id", "web-101"}, {"user_id", user}});
        EXPECT_TRUE(response["success"].get<bool>()) << response.dump();
        return response["instance"]["id"].get<std::string>();
    }

    std::shared_ptr<test::FakeProvider> provider_;
    core::ChallengeManager manager_;
    cli::CommandHandler handler_;
};

} // anonymous namespace

TEST_F(CommandHandlerTest, SpawnAndStatus) {
    auto spawned = Run({{"command", "spawn"}, {"id", 7},
                        {"request", {{"challenge_id", "pwn-200"}, {"user_id", "bob"}, {"team_id", "blue"}}}});
    ASSERT_TRUE(spawned["success"].get<bool>()) << spawned.dump();
    EXPECT_EQ(spawned["id"], 7);
    EXPECT_EQ(spawned["instance"]["status"], "running");
    EXPECT_EQ(spawned["instance"]["team_id"], "blue");

    const auto id = spawned["instance"]["id"].get<std::string>();
    auto status = Run({{"command", "status"}, {"instance_id", id}});
    EXPECT_TRUE(status["success"].get<bool>());
    EXPECT_EQ(status["instance"]["challenge_id"], "pwn-200");
    EXPECT_EQ(status["usable"], true);
}

TEST_F(CommandHandlerTest, SpawnFailureCarriesKind) {
    auto response = Run({{"command", "spawn"}, {"challenge_id", "web-101"}, {"user_id", "alice"},
                         {"sandbox_type", "quantum"}});
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(response["error_kind"], "validation");
    EXPECT_EQ(response["retryable"], false);
    EXPECT_TRUE(response["instance"].is_null());
}

TEST_F(CommandHandlerTest, DestroyTwiceSucceeds) {
    const auto id = SpawnOne();

    EXPECT_TRUE(Run({{"command", "destroy"}, {"instance_id", id}})["success"].get<bool>());
    EXPECT_TRUE(Run({{"command", "destroy"}, {"instance_id", id}})["success"].get<bool>());

    auto status = Run({{"command", "status"}, {"instance_id", id}});
    EXPECT_EQ(status["instance"]["status"], "destroyed");
    EXPECT_EQ(status["usable"], false);

    auto unknown = Run({{"command", "destroy"}, {"instance_id", "nope"}});
    EXPECT_FALSE(unknown["success"].get<bool>());
    EXPECT_EQ(unknown["error_message"], "Instance not found");
}

TEST_F(CommandHandlerTest, ExtendReturnsNewExpiry) {
    const auto id = SpawnOne();

    auto extended = Run({{"command", "extend"}, {"instance_id", id}, {"seconds", 900}});
    EXPECT_TRUE(extended["success"].get<bool>());
    EXPECT_TRUE(extended["expires_at"].is_string());

    auto rejected = Run({{"command", "extend"}, {"instance_id", id}});
    EXPECT_FALSE(rejected["success"].get<bool>());
}

TEST_F(CommandHandlerTest, ListLogsStatsAndQueue) {
    const auto id = SpawnOne("alice");
    SpawnOne("bob");

    EXPECT_EQ(Run({{"command", "list"}})["instances"].size(), 2u);
    auto mine = Run({{"command", "list"}, {"user_id", "alice"}});
    ASSERT_EQ(mine["instances"].size(), 1u);
    EXPECT_EQ(mine["instances"][0]["id"], id);

    EXPECT_EQ(Run({{"command", "logs"}, {"instance_id", id}, {"tail", 10}})["logs"], "logs of " + id);
    EXPECT_EQ(Run({{"command", "stats"}, {"instance_id", id}})["stats"]["cpu_usage_percent"], 1.5);
    EXPECT_FALSE(Run({{"command", "stats"}, {"instance_id", "nope"}})["success"].get<bool>());

    auto queue = Run({{"command", "queue"}});
    EXPECT_TRUE(queue["success"].get<bool>());
    EXPECT_TRUE(queue["requests"].empty());
}

TEST_F(CommandHandlerTest, MalformedInput) {
    auto garbage = json::parse(handler_.HandleLine("{not json"));
    EXPECT_FALSE(garbage["success"].get<bool>());
    EXPECT_EQ(garbage["error_message"].get<std::string>().rfind("Invalid JSON", 0), 0u);

    EXPECT_EQ(Run(json::array())["success"], false);
    EXPECT_EQ(Run({{"id", "x"}})["error_message"], "Missing 'command' field");
    EXPECT_EQ(Run({{"command", "reboot"}})["error_message"], "Unknown command: reboot");
    EXPECT_EQ(Run({{"command", "status"}})["error_message"], "instance_id is required");
    EXPECT_EQ(Run({{"command", "list"}, {"user_id", 42}})["success"], false);
}
