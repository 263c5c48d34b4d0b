/**
 * @file test_models.cpp
 * @brief Instance model, enum names and JSON mapping
 */

#include <gtest/gtest.h>

#include "cerberus/core/models.hpp"

using namespace cerberus::core;
using json = nlohmann::json;

TEST(InstanceStatusTest, ActiveStates) {
    ChallengeInstance instance;
    for (auto status : {InstanceStatus::CREATING, InstanceStatus::RUNNING,
                        InstanceStatus::HEALTHY, InstanceStatus::UNHEALTHY}) {
        instance.status = status;
        EXPECT_TRUE(instance.IsActive()) << ToString(status);
    }
    for (auto status : {InstanceStatus::PENDING, InstanceStatus::STOPPING, InstanceStatus::STOPPED,
                        InstanceStatus::DESTROYING, InstanceStatus::DESTROYED, InstanceStatus::ERROR}) {
        instance.status = status;
        EXPECT_FALSE(instance.IsActive()) << ToString(status);
    }
}

TEST(InstanceStatusTest, TerminalStates) {
    ChallengeInstance instance;
    instance.status = InstanceStatus::DESTROYED;
    EXPECT_TRUE(instance.IsTerminal());
    instance.status = InstanceStatus::ERROR;
    EXPECT_TRUE(instance.IsTerminal());
    instance.status = InstanceStatus::DESTROYING;
    EXPECT_FALSE(instance.IsTerminal());
}

TEST(InstanceStatusTest, NamesRoundTrip) {
    for (auto status : {InstanceStatus::PENDING, InstanceStatus::CREATING, InstanceStatus::RUNNING,
                        InstanceStatus::HEALTHY, InstanceStatus::UNHEALTHY, InstanceStatus::STOPPING,
                        InstanceStatus::STOPPED, InstanceStatus::DESTROYING, InstanceStatus::DESTROYED,
                        InstanceStatus::ERROR}) {
        EXPECT_EQ(ParseInstanceStatus(ToString(status)), status);
    }
    EXPECT_THROW(ParseInstanceStatus("exploded"), std::invalid_argument);
}

TEST(SandboxTypeTest, AcceptsLegacyNames) {
    EXPECT_EQ(ParseSandboxType("docker"), SandboxType::CONTAINER);
    EXPECT_EQ(ParseSandboxType("firecracker"), SandboxType::MICROVM);
    EXPECT_EQ(ParseSandboxType("terraform_aws"), SandboxType::CLOUD_AWS);
    EXPECT_EQ(ParseSandboxType("cloud_gcp"), SandboxType::CLOUD_GCP);
    EXPECT_FALSE(ParseSandboxType("kubernetes").has_value());
}

TEST(ChallengeInstanceTest, UpdateStatusStampsTimes) {
    ChallengeInstance instance;
    EXPECT_FALSE(instance.started_at.has_value());

    instance.UpdateStatus(InstanceStatus::RUNNING);
    ASSERT_TRUE(instance.started_at.has_value());
    EXPECT_FALSE(instance.destroyed_at.has_value());

    instance.UpdateStatus(InstanceStatus::DESTROYED);
    EXPECT_TRUE(instance.destroyed_at.has_value());
}

TEST(ChallengeInstanceTest, TerminalStatesCannotBeLeft) {
    ChallengeInstance instance;
    ASSERT_TRUE(instance.UpdateStatus(InstanceStatus::DESTROYED));
    const auto destroyed_at = instance.destroyed_at;

    EXPECT_FALSE(instance.UpdateStatus(InstanceStatus::RUNNING));
    EXPECT_FALSE(instance.UpdateStatus(InstanceStatus::ERROR));
    EXPECT_EQ(instance.status, InstanceStatus::DESTROYED);
    EXPECT_FALSE(instance.started_at.has_value());
    EXPECT_TRUE(instance.UpdateStatus(InstanceStatus::DESTROYED));
    EXPECT_EQ(instance.destroyed_at, destroyed_at);

    ChallengeInstance failed;
    failed.UpdateStatus(InstanceStatus::ERROR);
    EXPECT_FALSE(failed.UpdateStatus(InstanceStatus::HEALTHY));
    EXPECT_EQ(failed.status, InstanceStatus::ERROR);
}

TEST(ChallengeInstanceTest, ExpiryAndRemainingSeconds) {
    const auto now = Clock::now();
    ChallengeInstance instance;
    EXPECT_FALSE(instance.IsExpired(now));
    EXPECT_EQ(instance.RemainingSeconds(7200, now), 7200);

    instance.expires_at = now + std::chrono::seconds(90);
    EXPECT_FALSE(instance.IsExpired(now));
    EXPECT_EQ(instance.RemainingSeconds(7200, now), 90);

    instance.expires_at = now - std::chrono::seconds(5);
    EXPECT_TRUE(instance.IsExpired(now));
    EXPECT_EQ(instance.RemainingSeconds(7200, now), 1);
}

TEST(ChallengeInstanceJsonTest, PreservesRecord) {
    ChallengeInstance instance;
    instance.id = "5f0c";
    instance.challenge_id = "pwn-200";
    instance.user_id = "alice";
    instance.team_id = "red";
    instance.sandbox_type = SandboxType::MICROVM;
    instance.UpdateStatus(InstanceStatus::RUNNING);
    instance.network.internal_ip = "172.16.3.40";
    instance.network.port_mappings = {{22, 22}, {8080, 80}};
    instance.resources.cpu_quota = 1.5;
    instance.resources.memory_limit_mb = 1024;
    instance.security.add_capabilities = {"NET_BIND_SERVICE"};
    instance.access_url = "ssh://root@172.16.3.40:22";
    instance.canary_token = "0123456789abcdef0123456789abcdef";
    instance.expires_at = instance.created_at + std::chrono::hours(2);
    instance.provider_instance_id = "/srv/jailer/firecracker/5f0c0000/root";
    instance.provider_metadata = {{"image", "kali"}};
    instance.health_check_failures = 2;

    json j = instance;
    EXPECT_EQ(j["status"], "running");
    EXPECT_EQ(j["sandbox_type"], "microvm");

    auto restored = j.get<ChallengeInstance>();
    EXPECT_EQ(restored.id, instance.id);
    EXPECT_EQ(restored.team_id, instance.team_id);
    EXPECT_EQ(restored.sandbox_type, SandboxType::MICROVM);
    EXPECT_EQ(restored.status, InstanceStatus::RUNNING);
    EXPECT_EQ(restored.network.port_mappings, instance.network.port_mappings);
    EXPECT_EQ(restored.resources.cpu_quota, 1.5);
    EXPECT_EQ(restored.security.add_capabilities, instance.security.add_capabilities);
    EXPECT_EQ(restored.canary_token, instance.canary_token);
    EXPECT_EQ(restored.provider_instance_id, instance.provider_instance_id);
    EXPECT_EQ(restored.provider_metadata["image"], "kali");
    EXPECT_EQ(restored.health_check_failures, 2);
    ASSERT_TRUE(restored.expires_at.has_value());
    EXPECT_EQ(FormatTimestamp(*restored.expires_at), FormatTimestamp(*instance.expires_at));
}

TEST(SpawnRequestJsonTest, DefaultsAndUnknownType) {
    auto request = json{{"challenge_id", "web-1"}, {"user_id", "bob"}}.get<SpawnRequest>();
    EXPECT_EQ(request.sandbox_type, SandboxType::CONTAINER);
    EXPECT_EQ(request.timeout_seconds, 7200);
    EXPECT_FALSE(request.team_id.has_value());

    auto unknown = json{{"challenge_id", "web-1"}, {"user_id", "bob"},
                        {"sandbox_type", "quantum"}}.get<SpawnRequest>();
    EXPECT_FALSE(unknown.sandbox_type.has_value());
}

TEST(SpawnResultTest, FailureCarriesKind) {
    auto failure = SpawnResult::Failure(ErrorKind::QUOTA, "Maximum active instances reached (3)", false);
    EXPECT_FALSE(failure.success);
    EXPECT_FALSE(failure.instance.has_value());

    json j = failure;
    EXPECT_EQ(j["error_kind"], "quota");
    EXPECT_EQ(j["retryable"], false);
    EXPECT_TRUE(j["instance"].is_null());
}

TEST(TimestampTest, ParsesMillisecondPrecision) {
    auto tp = ParseTimestamp("2025-03-01T12:30:45.250Z");
    EXPECT_EQ(FormatTimestamp(tp), "2025-03-01T12:30:45.250Z");
    EXPECT_THROW(ParseTimestamp("yesterday"), std::invalid_argument);
}
