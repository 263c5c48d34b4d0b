/**
 * @file config.cpp
 * @brief JSON mapping, environment overrides and validation for
 *        OrchestratorConfig
 *
 * Durations are expressed in whole seconds in JSON under `*_seconds` keys
 * (milliseconds for the boot probe interval).
 *
 * @date 2025
 */

#include "cerberus/core/config.hpp"
#include "cerberus/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace cerberus {
namespace core {

namespace {

template <typename T>
void Read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

template <typename Duration>
void ReadDuration(const json& j, const char* key, Duration& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer() && !it->is_number_unsigned()) {
        throw ConfigError(std::string("Invalid value for '") + key + "': expected integer");
    }
    out = Duration(it->get<long long>());
}

void ReadOptionalString(const json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (it->is_null()) {
        out.reset();
        return;
    }
    if (!it->is_string()) {
        throw ConfigError(std::string("Invalid value for '") + key + "': expected string");
    }
    out = it->get<std::string>();
}

const json& Section(const json& j, const char* key) {
    static const json kEmpty = json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return kEmpty;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("Section '") + key + "' must be an object");
    }
    return *it;
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

OrchestratorConfig ConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    OrchestratorConfig config;

    Read(j, "max_instances_per_user", config.max_instances_per_user);
    ReadDuration(j, "spawn_timeout_seconds", config.spawn_timeout);
    ReadDuration(j, "cleanup_interval_seconds", config.cleanup_interval);
    ReadDuration(j, "zombie_check_interval_seconds", config.zombie_check_interval);
    ReadDuration(j, "default_ttl_seconds", config.default_ttl);
    ReadDuration(j, "tombstone_ttl_seconds", config.tombstone_ttl);
    Read(j, "state_file", config.state_file);
    Read(j, "enabled_providers", config.enabled_providers);
    Read(j, "log_level", config.log_level);

    const json& c = Section(j, "container");
    Read(c, "docker_binary", config.container.docker_binary);
    Read(c, "network_name", config.container.network_name);
    Read(c, "proxy_domain", config.container.proxy_domain);
    Read(c, "default_image", config.container.default_image);
    Read(c, "default_cpu_quota", config.container.default_cpu_quota);
    Read(c, "default_memory_mb", config.container.default_memory_mb);
    Read(c, "default_pids_limit", config.container.default_pids_limit);
    Read(c, "tmpfs_options", config.container.tmpfs_options);
    ReadOptionalString(c, "default_seccomp_profile", config.container.default_seccomp_profile);
    ReadDuration(c, "command_timeout_seconds", config.container.command_timeout);
    ReadDuration(c, "stop_grace_seconds", config.container.stop_grace);

    const json& m = Section(j, "microvm");
    Read(m, "firecracker_binary", config.microvm.firecracker_binary);
    Read(m, "jailer_binary", config.microvm.jailer_binary);
    Read(m, "images_dir", config.microvm.images_dir);
    Read(m, "jail_base_dir", config.microvm.jail_base_dir);
    Read(m, "bridge_name", config.microvm.bridge_name);
    Read(m, "tap_prefix", config.microvm.tap_prefix);
    Read(m, "jailer_uid", config.microvm.jailer_uid);
    Read(m, "jailer_gid", config.microvm.jailer_gid);
    Read(m, "default_vcpus", config.microvm.default_vcpus);
    Read(m, "default_memory_mb", config.microvm.default_memory_mb);
    Read(m, "default_image", config.microvm.default_image);
    Read(m, "boot_args", config.microvm.boot_args);
    ReadDuration(m, "api_socket_timeout_seconds", config.microvm.api_socket_timeout);
    ReadDuration(m, "boot_timeout_seconds", config.microvm.boot_timeout);
    ReadDuration(m, "boot_probe_interval_ms", config.microvm.boot_probe_interval);

    const json& t = Section(j, "cloud");
    Read(t, "terraform_binary", config.cloud.terraform_binary);
    Read(t, "modules_dir", config.cloud.modules_dir);
    Read(t, "state_dir", config.cloud.state_dir);
    Read(t, "aws_region", config.cloud.aws_region);
    Read(t, "aws_default_module", config.cloud.aws_default_module);
    Read(t, "gcp_project", config.cloud.gcp_project);
    Read(t, "gcp_region", config.cloud.gcp_region);
    Read(t, "gcp_default_module", config.cloud.gcp_default_module);
    ReadDuration(t, "init_timeout_seconds", config.cloud.init_timeout);
    ReadDuration(t, "apply_timeout_seconds", config.cloud.apply_timeout);
    ReadDuration(t, "destroy_timeout_seconds", config.cloud.destroy_timeout);
    ReadDuration(t, "output_timeout_seconds", config.cloud.output_timeout);

    const json& h = Section(j, "health");
    ReadDuration(h, "check_interval_seconds", config.health.check_interval);
    ReadDuration(h, "probe_timeout_seconds", config.health.probe_timeout);
    Read(h, "failure_threshold", config.health.failure_threshold);

    const json& r = Section(j, "retry");
    Read(r, "max_attempts", config.retry.max_attempts);
    ReadDuration(r, "base_delay_seconds", config.retry.base_delay);
    ReadDuration(r, "max_delay_seconds", config.retry.max_delay);
    Read(r, "multiplier", config.retry.multiplier);

    ValidateConfig(config);
    return config;
}

OrchestratorConfig LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path);
    return ConfigFromJson(j);
}

void ApplyEnvironmentOverrides(OrchestratorConfig& config) {
    if (auto v = GetEnv("CHALLENGE_PROXY_DOMAIN")) {
        config.container.proxy_domain = *v;
    }
    if (auto v = GetEnv("AWS_DEFAULT_REGION")) {
        config.cloud.aws_region = *v;
    }
    if (auto v = GetEnv("GCP_PROJECT_ID")) {
        config.cloud.gcp_project = *v;
    }
    if (auto v = GetEnv("GCP_REGION")) {
        config.cloud.gcp_region = *v;
    }
    if (auto v = GetEnv("CERBERUS_STATE_FILE")) {
        config.state_file = *v;
    }
}

void ValidateConfig(const OrchestratorConfig& config) {
    static const std::set<std::string> kKnownProviders = {
        "container", "microvm", "cloud_aws", "cloud_gcp"};

    if (config.max_instances_per_user < 1) {
        throw ConfigError("max_instances_per_user must be at least 1");
    }
    if (config.spawn_timeout.count() <= 0) {
        throw ConfigError("spawn_timeout_seconds must be positive");
    }
    if (config.cleanup_interval.count() <= 0 || config.zombie_check_interval.count() <= 0) {
        throw ConfigError("Background loop intervals must be positive");
    }
    if (config.health.check_interval.count() <= 0 || config.health.probe_timeout.count() <= 0) {
        throw ConfigError("Health check interval and probe timeout must be positive");
    }
    if (config.health.failure_threshold < 1) {
        throw ConfigError("health.failure_threshold must be at least 1");
    }
    if (config.retry.max_attempts < 1) {
        throw ConfigError("retry.max_attempts must be at least 1");
    }
    if (config.retry.multiplier < 1.0) {
        throw ConfigError("retry.multiplier must be >= 1");
    }
    if (config.container.default_cpu_quota <= 0.0 || config.container.default_memory_mb <= 0) {
        throw ConfigError("Container default CPU and memory limits must be positive");
    }
    for (const auto& name : config.enabled_providers) {
        if (kKnownProviders.count(name) == 0) {
            throw ConfigError("Unknown provider in enabled_providers: " + name);
        }
    }
}

json ConfigToJson(const OrchestratorConfig& config) {
    json j;
    j["max_instances_per_user"] = config.max_instances_per_user;
    j["spawn_timeout_seconds"] = config.spawn_timeout.count();
    j["cleanup_interval_seconds"] = config.cleanup_interval.count();
    j["zombie_check_interval_seconds"] = config.zombie_check_interval.count();
    j["default_ttl_seconds"] = config.default_ttl.count();
    j["tombstone_ttl_seconds"] = config.tombstone_ttl.count();
    j["state_file"] = config.state_file;
    j["enabled_providers"] = config.enabled_providers;
    j["log_level"] = config.log_level;

    j["container"] = {
        {"docker_binary", config.container.docker_binary},
        {"network_name", config.container.network_name},
        {"proxy_domain", config.container.proxy_domain},
        {"default_image", config.container.default_image},
        {"default_cpu_quota", config.container.default_cpu_quota},
        {"default_memory_mb", config.container.default_memory_mb},
        {"default_pids_limit", config.container.default_pids_limit},
        {"tmpfs_options", config.container.tmpfs_options},
        {"command_timeout_seconds", config.container.command_timeout.count()},
        {"stop_grace_seconds", config.container.stop_grace.count()},
    };
    if (config.container.default_seccomp_profile) {
        j["container"]["default_seccomp_profile"] = *config.container.default_seccomp_profile;
    } else {
        j["container"]["default_seccomp_profile"] = nullptr;
    }

    j["microvm"] = {
        {"firecracker_binary", config.microvm.firecracker_binary},
        {"jailer_binary", config.microvm.jailer_binary},
        {"images_dir", config.microvm.images_dir},
        {"jail_base_dir", config.microvm.jail_base_dir},
        {"bridge_name", config.microvm.bridge_name},
        {"tap_prefix", config.microvm.tap_prefix},
        {"jailer_uid", config.microvm.jailer_uid},
        {"jailer_gid", config.microvm.jailer_gid},
        {"default_vcpus", config.microvm.default_vcpus},
        {"default_memory_mb", config.microvm.default_memory_mb},
        {"default_image", config.microvm.default_image},
        {"boot_args", config.microvm.boot_args},
        {"api_socket_timeout_seconds", config.microvm.api_socket_timeout.count()},
        {"boot_timeout_seconds", config.microvm.boot_timeout.count()},
        {"boot_probe_interval_ms", config.microvm.boot_probe_interval.count()},
    };

    j["cloud"] = {
        {"terraform_binary", config.cloud.terraform_binary},
        {"modules_dir", config.cloud.modules_dir},
        {"state_dir", config.cloud.state_dir},
        {"aws_region", config.cloud.aws_region},
        {"aws_default_module", config.cloud.aws_default_module},
        {"gcp_project", config.cloud.gcp_project},
        {"gcp_region", config.cloud.gcp_region},
        {"gcp_default_module", config.cloud.gcp_default_module},
        {"init_timeout_seconds", config.cloud.init_timeout.count()},
        {"apply_timeout_seconds", config.cloud.apply_timeout.count()},
        {"destroy_timeout_seconds", config.cloud.destroy_timeout.count()},
        {"output_timeout_seconds", config.cloud.output_timeout.count()},
    };

    j["health"] = {
        {"check_interval_seconds", config.health.check_interval.count()},
        {"probe_timeout_seconds", config.health.probe_timeout.count()},
        {"failure_threshold", config.health.failure_threshold},
    };

    j["retry"] = {
        {"max_attempts", config.retry.max_attempts},
        {"base_delay_seconds", config.retry.base_delay.count()},
        {"max_delay_seconds", config.retry.max_delay.count()},
        {"multiplier", config.retry.multiplier},
    };

    return j;
}

} // namespace core
} // namespace cerberus
