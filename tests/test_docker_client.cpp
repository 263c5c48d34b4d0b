/**
 * @file test_docker_client.cpp
 * @brief docker command building, output parsing and error classification
 */

#include <gtest/gtest.h>

#include "cerberus/utils/docker_client.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace cerberus::utils;
using cerberus::test::ScriptedRunner;

namespace {

/// Value following @p flag in @p args, empty if absent
std::string ValueOf(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || std::next(it) == args.end()) {
        return "";
    }
    return *std::next(it);
}

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

const char* kInspectJson = R"([{
    "Id": "9f2c1e0b7a",
    "State": {"Status": "running", "Running": true},
    "NetworkSettings": {
        "Networks": {
            "bridge": {"IPAddress": "172.17.0.9", "MacAddress": "02:42:ac:11:00:09"},
            "cerberus-challenges": {"IPAddress": "172.30.0.5", "MacAddress": "02:42:ac:1e:00:05"}
        },
        "Ports": {
            "80/tcp": [{"HostIp": "0.0.0.0", "HostPort": "32768"}, {"HostIp": "::", "HostPort": "32768"}],
            "22/tcp": [{"HostIp": "0.0.0.0", "HostPort": "32770"}],
            "9000/tcp": null
        }
    }
}])";

} // anonymous namespace

TEST(DockerClientTest, CreateCommandAppliesHardening) {
    ContainerCreateConfig config;
    config.name = "cerberus-abc";
    config.image = "nginx:alpine";
    config.hostname = "chal-abc";
    config.network = "cerberus-challenges";
    config.exposed_ports = {80, 22};
    config.cpu_quota = 150000;
    config.memory_limit_mb = 512;
    config.memory_swap_mb = 256;
    config.pids_limit = 64;
    config.capabilities_add = {"NET_BIND_SERVICE"};
    config.seccomp_profile = "/etc/cerberus/seccomp.json";
    config.tmpfs_mounts = {"/tmp:rw,size=64m,mode=1777"};
    config.environment_vars = {{"CERBERUS_CANARY", "deadbeef"}};
    config.labels = {{"cerberus.instance_id", "abc"}};
    config.command = std::vector<std::string>{"nginx", "-g", "daemon off;"};

    auto args = DockerClient::BuildCreateCommand(config);

    EXPECT_EQ(args.front(), "create");
    EXPECT_EQ(ValueOf(args, "--name"), "cerberus-abc");
    EXPECT_EQ(ValueOf(args, "--hostname"), "chal-abc");
    EXPECT_EQ(ValueOf(args, "--cpu-quota"), "150000");
    EXPECT_EQ(ValueOf(args, "--memory"), "512m");
    // Swap total never drops below the memory limit
    EXPECT_EQ(ValueOf(args, "--memory-swap"), "512m");
    EXPECT_EQ(ValueOf(args, "--pids-limit"), "64");
    EXPECT_EQ(ValueOf(args, "--network"), "cerberus-challenges");
    EXPECT_TRUE(HasPair(args, "-p", "0:80/tcp"));
    EXPECT_TRUE(HasPair(args, "-p", "0:22/tcp"));
    EXPECT_NE(std::find(args.begin(), args.end(), "--read-only"), args.end());
    EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(HasPair(args, "--cap-add", "NET_BIND_SERVICE"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges:true"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "seccomp=/etc/cerberus/seccomp.json"));
    EXPECT_TRUE(HasPair(args, "--tmpfs", "/tmp:rw,size=64m,mode=1777"));
    EXPECT_TRUE(HasPair(args, "-e", "CERBERUS_CANARY=deadbeef"));
    EXPECT_TRUE(HasPair(args, "--label", "cerberus.instance_id=abc"));

    // Image precedes the command override
    auto image = std::find(args.begin(), args.end(), "nginx:alpine");
    ASSERT_NE(image, args.end());
    EXPECT_EQ(std::vector<std::string>(image + 1, args.end()),
              (std::vector<std::string>{"nginx", "-g", "daemon off;"}));
}

TEST(DockerClientTest, CreateCommandOmitsUnsetOptions) {
    ContainerCreateConfig config;
    config.name = "cerberus-min";
    config.image = "alpine";
    config.read_only_rootfs = false;
    config.no_new_privileges = false;
    config.capabilities_drop.clear();

    auto args = DockerClient::BuildCreateCommand(config);
    EXPECT_EQ(std::find(args.begin(), args.end(), "--read-only"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--security-opt"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--network"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--storage-opt"), args.end());
    EXPECT_EQ(args.back(), "alpine");
}

TEST(DockerClientTest, ParseInspectPrefersNamedNetwork) {
    auto info = DockerClient::ParseInspectOutput(kInspectJson, "cerberus-challenges");
    EXPECT_EQ(info.id, "9f2c1e0b7a");
    EXPECT_TRUE(info.running);
    EXPECT_EQ(info.state, "running");
    EXPECT_EQ(info.ip_address, "172.30.0.5");
    EXPECT_EQ(info.mac_address, "02:42:ac:1e:00:05");

    const std::map<int, int> expected = {{32768, 80}, {32770, 22}};
    EXPECT_EQ(info.port_mappings, expected);
}

TEST(DockerClientTest, ParseInspectFallsBackToFirstNetwork) {
    auto info = DockerClient::ParseInspectOutput(kInspectJson, "missing-net");
    EXPECT_TRUE(info.ip_address.has_value());
}

TEST(DockerClientTest, ParseInspectRejectsGarbage) {
    EXPECT_ANY_THROW(DockerClient::ParseInspectOutput("not json", "x"));
    EXPECT_ANY_THROW(DockerClient::ParseInspectOutput("[]", "x"));
}

TEST(DockerClientTest, ParseStats) {
    const std::string line =
        R"({"CPUPerc":"12.50%","MemPerc":"25.00%","MemUsage":"64MiB / 256MiB",)"
        R"("NetIO":"1.5kB / 2kB","BlockIO":"0B / 4.1MB","PIDs":"7"})";

    auto stats = DockerClient::ParseStatsOutput(line + "\n");
    EXPECT_DOUBLE_EQ(stats.cpu_percent, 12.5);
    EXPECT_DOUBLE_EQ(stats.memory_percent, 25.0);
    EXPECT_EQ(stats.memory_usage_bytes, 64ull * 1024 * 1024);
    EXPECT_EQ(stats.memory_limit_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(stats.network_rx_bytes, 1500u);
    EXPECT_EQ(stats.network_tx_bytes, 2000u);
    EXPECT_EQ(stats.block_read_bytes, 0u);
    EXPECT_EQ(stats.block_write_bytes, 4100000u);
    EXPECT_EQ(stats.pids, 7);
}

TEST(DockerClientTest, ParseSizeUnits) {
    EXPECT_EQ(DockerClient::ParseSize("0B"), 0u);
    EXPECT_EQ(DockerClient::ParseSize("512"), 512u);
    EXPECT_EQ(DockerClient::ParseSize("12kB"), 12000u);
    EXPECT_EQ(DockerClient::ParseSize("1.5MiB"), 1572864u);
    EXPECT_EQ(DockerClient::ParseSize(" 2GiB "), 2147483648ull);
    EXPECT_EQ(DockerClient::ParseSize("--"), 0u);
    EXPECT_EQ(DockerClient::ParseSize("3 parsecs"), 0u);
}

TEST(DockerClientTest, ClassifyError) {
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Ok()), DockerErrorKind::NONE);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail("Error: No such container: abc")),
              DockerErrorKind::NOT_FOUND);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail(
                  "Conflict. The container name \"/cerberus-1\" is already in use")),
              DockerErrorKind::CONFLICT);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail(
                  "Bind for 0.0.0.0:32768 failed: port is already allocated")),
              DockerErrorKind::RESOURCE_EXHAUSTED);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail("write /var/lib/docker: no space left on device")),
              DockerErrorKind::RESOURCE_EXHAUSTED);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail(
                  "toomanyrequests: You have reached your pull rate limit")),
              DockerErrorKind::RATE_LIMITED);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail(
                  "Cannot connect to the Docker daemon at unix:///var/run/docker.sock")),
              DockerErrorKind::DAEMON_UNAVAILABLE);
    EXPECT_EQ(DockerClient::ClassifyError(ScriptedRunner::Fail("exec format error")),
              DockerErrorKind::OTHER);

    CommandResult timed_out;
    timed_out.timed_out = true;
    timed_out.exit_code = 124;
    EXPECT_EQ(DockerClient::ClassifyError(timed_out), DockerErrorKind::TIMEOUT);
}

TEST(DockerClientTest, CommandsUseConfiguredBinary) {
    auto runner = std::make_shared<ScriptedRunner>();
    DockerClient docker(runner, "/usr/bin/docker");

    docker.StopContainer("cerberus-1", std::chrono::seconds(5), std::chrono::seconds(30));
    docker.RemoveContainer("cerberus-1", true, true, std::chrono::seconds(30));
    docker.GetContainerLogs("cerberus-1", 50, std::chrono::seconds(30));

    auto calls = runner->Calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].argv, (std::vector<std::string>{"/usr/bin/docker", "stop", "--time", "5", "cerberus-1"}));
    EXPECT_EQ(calls[1].argv, (std::vector<std::string>{"/usr/bin/docker", "rm", "-f", "-v", "cerberus-1"}));
    EXPECT_EQ(calls[2].argv,
              (std::vector<std::string>{"/usr/bin/docker", "logs", "--timestamps", "--tail", "50", "cerberus-1"}));
    EXPECT_EQ(calls[0].timeout, std::chrono::milliseconds(30000));
}
