/**
 * @file test_provider_specs.cpp
 * @brief provider_metadata parsing
 */

#include <gtest/gtest.h>

#include "cerberus/core/errors.hpp"
#include "cerberus/providers/provider_specs.hpp"

using namespace cerberus::providers;
using cerberus::core::ValidationError;
using json = nlohmann::json;

TEST(ContainerSpecTest, DefaultsApply) {
    auto spec = ParseContainerSpec(json::object(), "nginx:alpine");
    EXPECT_EQ(spec.image, "nginx:alpine");
    EXPECT_FALSE(spec.command.has_value());
    EXPECT_TRUE(spec.env.empty());
    EXPECT_EQ(spec.ports, (std::vector<int>{80}));
}

TEST(ContainerSpecTest, ParsesOverrides) {
    auto spec = ParseContainerSpec(json{
        {"image", "ctf/web-101:latest"},
        {"command", "python3 app.py"},
        {"env", {{"FLAG_PATH", "/flag"}, {"WORKERS", 4}, {"DEBUG", false}}},
        {"ports", {5000, 22}}
    }, "nginx:alpine");

    EXPECT_EQ(spec.image, "ctf/web-101:latest");
    ASSERT_TRUE(spec.command.has_value());
    EXPECT_EQ(*spec.command, (std::vector<std::string>{"/bin/sh", "-c", "python3 app.py"}));
    EXPECT_EQ(spec.env.at("FLAG_PATH"), "/flag");
    EXPECT_EQ(spec.env.at("WORKERS"), "4");
    EXPECT_EQ(spec.env.at("DEBUG"), "false");
    EXPECT_EQ(spec.ports, (std::vector<int>{5000, 22}));

    auto argv = ParseContainerSpec(json{{"command", {"nginx", "-g", "daemon off;"}}}, "x");
    EXPECT_EQ(*argv.command, (std::vector<std::string>{"nginx", "-g", "daemon off;"}));
}

TEST(ContainerSpecTest, RejectsUnsafeOrMalformedValues) {
    EXPECT_THROW(ParseContainerSpec(json{{"image", ""}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"image", 42}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"ports", json::array({0})}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"ports", json::array({70000})}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"ports", "80"}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"env", {{"BAD-NAME", "1"}}}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"env", {{"NESTED", {{"a", 1}}}}}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"command", {"ok", 1}}}, "x"), ValidationError);
    EXPECT_THROW(ParseContainerSpec(json{{"network_mode", "host"}}, "x"), ValidationError);
}

TEST(MicroVmSpecTest, ReadinessPortFollowsPlatform) {
    auto linux_vm = ParseMicroVmSpec(json::object(), "ubuntu-22.04");
    EXPECT_EQ(linux_vm.image, "ubuntu-22.04");
    EXPECT_FALSE(linux_vm.is_windows);
    EXPECT_EQ(linux_vm.readiness_port, 22);

    auto windows_vm = ParseMicroVmSpec(json{{"vm_image", "win-server"}, {"is_windows", true}}, "ubuntu-22.04");
    EXPECT_TRUE(windows_vm.is_windows);
    EXPECT_EQ(windows_vm.readiness_port, 3389);

    auto custom = ParseMicroVmSpec(json{{"readiness_port", 8022}}, "ubuntu-22.04");
    EXPECT_EQ(custom.readiness_port, 8022);
}

TEST(MicroVmSpecTest, RejectsPathTraversal) {
    EXPECT_THROW(ParseMicroVmSpec(json{{"vm_image", "../../etc/passwd"}}, "x"), ValidationError);
    EXPECT_THROW(ParseMicroVmSpec(json{{"vm_image", "a/b"}}, "x"), ValidationError);
    EXPECT_THROW(ParseMicroVmSpec(json{{"is_windows", "yes"}}, "x"), ValidationError);
}

TEST(CloudSpecTest, ModuleAndVars) {
    auto spec = ParseCloudSpec(json{{"terraform_module", "ec2_kali"},
                                    {"module_vars", {{"instance_type", "t3.small"}}}},
                               "challenge_instance");
    EXPECT_EQ(spec.module, "ec2_kali");
    EXPECT_EQ(spec.module_vars["instance_type"], "t3.small");

    EXPECT_EQ(ParseCloudSpec(json::object(), "challenge_instance").module, "challenge_instance");
}

TEST(CloudSpecTest, RejectsReservedAndInvalidNames) {
    EXPECT_THROW(ParseCloudSpec(json{{"terraform_module", "../evil"}}, "m"), ValidationError);
    EXPECT_THROW(ParseCloudSpec(json{{"module_vars", {{"canary_token", "x"}}}}, "m"), ValidationError);
    EXPECT_THROW(ParseCloudSpec(json{{"module_vars", {{"source", "git::evil"}}}}, "m"), ValidationError);
    EXPECT_THROW(ParseCloudSpec(json{{"module_vars", "x=1"}}, "m"), ValidationError);
}

TEST(HealthCheckSpecTest, DefaultsToHttp) {
    auto spec = ParseHealthCheckSpec(json::object());
    EXPECT_EQ(spec.type, HealthCheckType::HTTP);
    EXPECT_FALSE(spec.url.has_value());
    EXPECT_EQ(spec.expected_status, 200);
    EXPECT_EQ(spec.port, 80);
    EXPECT_FALSE(spec.command.has_value());
}

TEST(HealthCheckSpecTest, ParsesEachType) {
    auto tcp = ParseHealthCheckSpec(json{{"health_check_type", "tcp"}, {"health_check_port", 1337}});
    EXPECT_EQ(tcp.type, HealthCheckType::TCP);
    EXPECT_EQ(tcp.port, 1337);

    auto cmd = ParseHealthCheckSpec(json{{"health_check_type", "command"},
                                         {"health_check_command", "test -f /ready"}});
    EXPECT_EQ(cmd.type, HealthCheckType::COMMAND);
    ASSERT_TRUE(cmd.command.has_value());
    EXPECT_EQ(cmd.command->back(), "test -f /ready");

    auto http = ParseHealthCheckSpec(json{{"health_check_url", "http://10.0.0.2/ping"},
                                          {"health_check_status", 204}});
    EXPECT_EQ(*http.url, "http://10.0.0.2/ping");
    EXPECT_EQ(http.expected_status, 204);
}

TEST(HealthCheckSpecTest, RejectsInvalidValues) {
    EXPECT_THROW(ParseHealthCheckSpec(json{{"health_check_type", "icmp"}}), ValidationError);
    EXPECT_THROW(ParseHealthCheckSpec(json{{"health_check_status", 42}}), ValidationError);
    EXPECT_THROW(ParseHealthCheckSpec(json{{"health_check_port", -1}}), ValidationError);
}
