/**
 * @file container_provider.cpp
 * @brief Docker sandbox lifecycle
 *
 * **Spawn Workflow**:
 * 1. Parse provider metadata into a ContainerSpec
 * 2. Make sure the isolated challenge network exists
 * 3. `docker create` with the hardened configuration
 * 4. `docker start`, then `docker inspect` for addresses and host ports
 * 5. Plant the canary token file
 *
 * Any failure after step 3 force-removes the container before the error is
 * reported. Every docker command is bounded by the spawn deadline.
 *
 * @date 2025
 */

#include "cerberus/providers/container_provider.hpp"
#include "cerberus/core/errors.hpp"
#include "cerberus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace cerberus {
namespace providers {

using utils::DockerErrorKind;
using utils::StringUtils;

namespace {

constexpr long kCpuPeriod = 100000;
constexpr const char* kCanaryPath = "/.cerberus_canary";
constexpr const char* kFallbackCanaryPath = "/tmp/.cerberus_canary";

std::chrono::milliseconds ToMillis(std::chrono::seconds s) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(s);
}

/// docker create prints the new ID as its last line (pull progress may precede it)
std::string ExtractContainerId(const std::string& output) {
    auto lines = StringUtils::SplitLines(output);
    if (lines.empty()) {
        return "";
    }
    return StringUtils::Trim(lines.back());
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerProvider::ContainerProvider(core::ContainerProviderConfig config,
                                     std::shared_ptr<utils::CommandRunner> runner)
    : config_(std::move(config)),
      docker_(std::move(runner), config_.docker_binary) {
    spdlog::debug("Container provider: network={}, proxy={}", config_.network_name, config_.proxy_domain);
}

std::string ContainerProvider::ContainerName(const std::string& instance_id) {
    return "cerberus-" + instance_id;
}

std::string ContainerProvider::ContainerRef(const core::ChallengeInstance& instance) const {
    if (instance.provider_instance_id && !instance.provider_instance_id->empty()) {
        return *instance.provider_instance_id;
    }
    return ContainerName(instance.id);
}

// ============================================================================
// SPAWN
// ============================================================================

core::SpawnResult ContainerProvider::Spawn(core::ChallengeInstance& instance, Deadline deadline) {
    const ContainerSpec spec = ParseContainerSpec(instance.provider_metadata, config_.default_image);
    const auto command_cap = ToMillis(config_.command_timeout);

    EnsureNetwork(deadline);

    const auto create_config = BuildCreateConfig(instance, spec);
    spdlog::info("Creating container {} (image {})", create_config.name, spec.image);

    auto created = docker_.CreateContainer(create_config, RemainingBudget(deadline, command_cap));
    if (!created.Ok()) {
        // A timed-out create may still have produced a container
        if (created.timed_out) {
            docker_.RemoveContainer(create_config.name, true, true, command_cap);
        }
        RaiseFailure(created, "create", deadline);
    }

    std::string container_id = ExtractContainerId(created.stdout_text);
    if (container_id.empty()) {
        container_id = create_config.name;
    }

    try {
        auto started = docker_.StartContainer(container_id, RemainingBudget(deadline, command_cap));
        if (!started.Ok()) {
            RaiseFailure(started, "start", deadline);
        }

        auto inspected = docker_.InspectContainer(container_id, RemainingBudget(deadline, command_cap));
        if (!inspected.Ok()) {
            RaiseFailure(inspected, "inspect", deadline);
        }

        utils::ContainerInspect details;
        try {
            details = utils::DockerClient::ParseInspectOutput(inspected.stdout_text, config_.network_name);
        } catch (const std::exception& e) {
            throw core::ProviderError(std::string("Unparseable docker inspect output: ") + e.what(), false);
        }

        if (!details.id.empty()) {
            container_id = details.id;
        }

        instance.network.internal_ip = details.ip_address;
        instance.network.mac_address = details.mac_address;
        instance.network.port_mappings = details.port_mappings;
        instance.network.hostname = create_config.name;

        // Access goes through the host port bound to the first exposed port
        std::optional<int> access_port;
        for (const auto& [host_port, container_port] : details.port_mappings) {
            if (!spec.ports.empty() && container_port == spec.ports.front()) {
                access_port = host_port;
                break;
            }
        }
        if (!access_port && !details.port_mappings.empty()) {
            access_port = details.port_mappings.begin()->first;
        }
        if (access_port) {
            instance.access_url = "http://" + config_.proxy_domain + ":" + std::to_string(*access_port);
        }

        if (instance.canary_token) {
            WriteCanary(container_id, instance, deadline);
        }
    } catch (const core::ProviderError& e) {
        spdlog::error("Container spawn failed for {}: {}", instance.id, e.what());
        docker_.RemoveContainer(container_id, true, true, command_cap);
        return core::SpawnResult::Failure(core::ErrorKind::PROVIDER, e.what(), e.IsRetryable());
    } catch (const std::exception& e) {
        spdlog::error("Container spawn failed for {}: {}", instance.id, e.what());
        docker_.RemoveContainer(container_id, true, true, command_cap);
        throw;
    }

    instance.provider_instance_id = container_id;
    spdlog::info("Container {} running for instance {} ({})",
                 container_id.substr(0, 12), instance.id, instance.access_url.value_or("no access url"));
    return core::SpawnResult::Success(instance);
}

utils::ContainerCreateConfig ContainerProvider::BuildCreateConfig(const core::ChallengeInstance& instance,
                                                                  const ContainerSpec& spec) const {
    utils::ContainerCreateConfig create;
    create.name = ContainerName(instance.id);
    create.hostname = create.name;
    create.image = spec.image;
    create.command = spec.command;
    create.network = config_.network_name;
    create.exposed_ports = spec.ports;

    // Resource limits, falling back to provider defaults
    const double cores = instance.resources.cpu_quota.value_or(config_.default_cpu_quota);
    create.cpu_period = kCpuPeriod;
    create.cpu_quota = std::max(1000L, static_cast<long>(std::lround(kCpuPeriod * cores)));
    create.memory_limit_mb = instance.resources.memory_limit_mb.value_or(config_.default_memory_mb);
    create.memory_swap_mb = create.memory_limit_mb + std::max(0, instance.resources.memory_swap_mb);
    create.pids_limit = instance.resources.pids_limit > 0 ? instance.resources.pids_limit
                                                          : config_.default_pids_limit;
    create.storage_limit_mb = instance.resources.storage_limit_mb;

    // Security
    const auto& security = instance.security;
    create.read_only_rootfs = security.read_only_rootfs;
    create.no_new_privileges = security.no_new_privileges;
    create.capabilities_drop = security.drop_capabilities;
    create.capabilities_add = security.add_capabilities;
    create.seccomp_profile = security.seccomp_profile ? security.seccomp_profile
                                                      : config_.default_seccomp_profile;
    create.apparmor_profile = security.apparmor_profile;
    create.selinux_label = security.selinux_context;
    create.tmpfs_mounts = {"/tmp:" + config_.tmpfs_options};

    create.environment_vars = spec.env;
    if (instance.canary_token) {
        create.environment_vars["CERBERUS_CANARY"] = *instance.canary_token;
    }

    create.labels = {
        {"cerberus.instance_id", instance.id},
        {"cerberus.challenge_id", instance.challenge_id},
        {"cerberus.user_id", instance.user_id},
    };
    if (instance.team_id) {
        create.labels["cerberus.team_id"] = *instance.team_id;
    }

    return create;
}

void ContainerProvider::EnsureNetwork(Deadline deadline) {
    std::lock_guard<std::mutex> lock(network_mutex_);
    if (network_ready_) {
        return;
    }

    const auto cap = ToMillis(config_.command_timeout);
    auto inspected = docker_.InspectNetwork(config_.network_name, RemainingBudget(deadline, cap));
    if (inspected.Ok()) {
        network_ready_ = true;
        return;
    }
    if (utils::DockerClient::ClassifyError(inspected) != DockerErrorKind::NOT_FOUND) {
        RaiseFailure(inspected, "network inspect", deadline);
    }

    auto created = docker_.CreateNetwork(config_.network_name, {{"cerberus.managed", "true"}},
                                         RemainingBudget(deadline, cap));
    // Lost a race with another orchestrator process: the network exists now
    if (!created.Ok() && utils::DockerClient::ClassifyError(created) != DockerErrorKind::CONFLICT) {
        RaiseFailure(created, "network create", deadline);
    }
    network_ready_ = true;
}

void ContainerProvider::WriteCanary(const std::string& container, const core::ChallengeInstance& instance,
                                    Deadline deadline) {
    const std::string path = instance.security.read_only_rootfs ? kFallbackCanaryPath : kCanaryPath;
    const std::vector<std::string> command = {
        "/bin/sh", "-c", "printf '%s' \"$CERBERUS_CANARY\" > " + path + " && chmod 0400 " + path};

    try {
        auto result = docker_.ExecInContainer(container, command,
                                              RemainingBudget(deadline, ToMillis(config_.command_timeout)));
        if (!result.Ok()) {
            spdlog::warn("Failed to write canary into {}: {}", container.substr(0, 12), result.ErrorText());
        }
    } catch (const core::SpawnTimeoutError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to write canary into {}: {}", container.substr(0, 12), e.what());
    }
}

void ContainerProvider::RaiseFailure(const utils::CommandResult& result,
                                     const std::string& action,
                                     Deadline deadline) const {
    const std::string message = "docker " + action + " failed: " + result.ErrorText();

    switch (utils::DockerClient::ClassifyError(result)) {
        case DockerErrorKind::RESOURCE_EXHAUSTED:
            throw core::ResourceExhaustedError(message);
        case DockerErrorKind::TIMEOUT:
            if (std::chrono::steady_clock::now() >= deadline) {
                throw core::SpawnTimeoutError("docker " + action + " exceeded the spawn deadline");
            }
            throw core::ProviderError("docker " + action + " timed out", true);
        case DockerErrorKind::CONFLICT:
        case DockerErrorKind::RATE_LIMITED:
        case DockerErrorKind::DAEMON_UNAVAILABLE:
            throw core::ProviderError(message, true);
        case DockerErrorKind::NOT_FOUND:
        case DockerErrorKind::OTHER:
        case DockerErrorKind::NONE:
        default:
            throw core::ProviderError(message, false);
    }
}

// ============================================================================
// DESTROY / EXISTS
// ============================================================================

bool ContainerProvider::Destroy(const core::ChallengeInstance& instance) {
    const std::string container = ContainerRef(instance);
    const auto timeout = ToMillis(config_.command_timeout) + ToMillis(config_.stop_grace);

    try {
        auto stopped = docker_.StopContainer(container, config_.stop_grace, timeout);
        if (!stopped.Ok()) {
            if (utils::DockerClient::ClassifyError(stopped) == DockerErrorKind::NOT_FOUND) {
                spdlog::debug("Container {} already gone", container);
                return true;
            }
            spdlog::warn("docker stop {} failed ({}), killing", container, stopped.ErrorText());
            docker_.KillContainer(container, ToMillis(config_.command_timeout));
        }

        auto removed = docker_.RemoveContainer(container, true, true, ToMillis(config_.command_timeout));
        if (removed.Ok() || utils::DockerClient::ClassifyError(removed) == DockerErrorKind::NOT_FOUND) {
            spdlog::info("Container {} removed", container.substr(0, 12));
            return true;
        }
        spdlog::error("Failed to remove container {}: {}", container, removed.ErrorText());
        return false;

    } catch (const std::exception& e) {
        spdlog::error("Container destroy failed for {}: {}", instance.id, e.what());
        return false;
    }
}

bool ContainerProvider::Exists(const core::ChallengeInstance& instance) {
    if (!instance.provider_instance_id || instance.provider_instance_id->empty()) {
        return false;
    }

    auto result = docker_.InspectContainer(*instance.provider_instance_id, ToMillis(config_.command_timeout));
    if (result.Ok()) {
        return true;
    }
    if (utils::DockerClient::ClassifyError(result) == DockerErrorKind::NOT_FOUND) {
        return false;
    }
    throw core::ProviderError("docker inspect failed: " + result.ErrorText(), true);
}

// ============================================================================
// QUERIES
// ============================================================================

std::string ContainerProvider::GetLogs(const core::ChallengeInstance& instance, int tail_lines) {
    if (!instance.provider_instance_id) {
        return "";
    }
    auto result = docker_.GetContainerLogs(*instance.provider_instance_id, tail_lines,
                                           ToMillis(config_.command_timeout));
    if (!result.Ok()) {
        spdlog::error("Failed to get logs for {}: {}", instance.id, result.ErrorText());
        return "";
    }
    // docker logs replays the container's stderr on our stderr
    return result.stdout_text + result.stderr_text;
}

ExecResult ContainerProvider::ExecCommand(const core::ChallengeInstance& instance,
                                          const std::vector<std::string>& command) {
    ExecResult exec;
    if (!instance.provider_instance_id) {
        exec.error = "Instance has no container";
        return exec;
    }
    if (command.empty()) {
        exec.error = "Empty command";
        return exec;
    }

    auto result = docker_.ExecInContainer(*instance.provider_instance_id, command,
                                          ToMillis(config_.command_timeout));
    exec.exit_code = result.exit_code;
    exec.output = result.stdout_text + result.stderr_text;
    if (result.timed_out) {
        exec.error = "Command timed out";
    } else if (result.spawn_failed) {
        exec.error = "Failed to run docker exec";
    }
    return exec;
}

json ContainerProvider::GetStats(const core::ChallengeInstance& instance) {
    if (!instance.provider_instance_id) {
        return json::object();
    }

    auto result = docker_.GetContainerStats(*instance.provider_instance_id, ToMillis(config_.command_timeout));
    if (!result.Ok()) {
        spdlog::error("Failed to get stats for {}: {}", instance.id, result.ErrorText());
        return json::object();
    }

    try {
        auto stats = utils::DockerClient::ParseStatsOutput(result.stdout_text);
        constexpr double kMiB = 1024.0 * 1024.0;
        return json{
            {"cpu_usage_percent", stats.cpu_percent},
            {"memory_usage_mb", stats.memory_usage_bytes / kMiB},
            {"memory_limit_mb", stats.memory_limit_bytes / kMiB},
            {"memory_percent", stats.memory_percent},
            {"network_rx_bytes", stats.network_rx_bytes},
            {"network_tx_bytes", stats.network_tx_bytes},
            {"block_read_bytes", stats.block_read_bytes},
            {"block_write_bytes", stats.block_write_bytes},
            {"pids", stats.pids},
        };
    } catch (const std::exception& e) {
        spdlog::error("Unparseable docker stats for {}: {}", instance.id, e.what());
        return json::object();
    }
}

} // namespace providers
} // namespace cerberus
