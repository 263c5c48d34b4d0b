/**
 * @file docker_client.hpp
 * @brief Docker CLI wrapper for hardened challenge containers
 *
 * Thin, stateless layer over the docker CLI: every method maps to one docker
 * subcommand executed through a CommandRunner and returns the raw
 * CommandResult, leaving retry and error policy to the caller. Static
 * helpers build the `docker create` argument list and parse inspect/stats
 * JSON.
 *
 * **Security Hardening applied by BuildCreateCommand**:
 * 1. Read-only root filesystem with a size-capped tmpfs at /tmp
 * 2. `--cap-drop ALL` plus an explicit allow-list
 * 3. `no-new-privileges`, seccomp and optional AppArmor/SELinux labels
 * 4. CPU quota, memory, swap and PID limits
 * 5. Attachment to a dedicated bridge network (never the host network)
 *
 * **Usage Example**:
 * @code
 * DockerClient docker(std::make_shared<ProcessRunner>());
 *
 * ContainerCreateConfig config;
 * config.name = "cerberus-1234";
 * config.image = "nginx:alpine";
 * config.network = "cerberus-challenges";
 * config.exposed_ports = {80};
 *
 * auto created = docker.CreateContainer(config, std::chrono::seconds(60));
 * if (created.Ok()) {
 *     docker.StartContainer(StringUtils::Trim(created.stdout_text), std::chrono::seconds(60));
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "cerberus/utils/command_runner.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cerberus {
namespace utils {

/**
 * @enum DockerErrorKind
 * @brief Classification of a failed docker command
 */
enum class DockerErrorKind {
    NONE,                ///< Command succeeded
    NOT_FOUND,           ///< No such container/image/network
    CONFLICT,            ///< Name already in use
    RATE_LIMITED,        ///< Registry rate limiting
    DAEMON_UNAVAILABLE,  ///< Cannot reach dockerd
    RESOURCE_EXHAUSTED,  ///< Disk, memory or host port exhausted
    TIMEOUT,             ///< Command killed after its timeout
    OTHER
};

/**
 * @struct ContainerCreateConfig
 * @brief Complete `docker create` configuration
 */
struct ContainerCreateConfig {
    // Basic Settings
    std::string name;
    std::string image;
    std::optional<std::string> hostname;
    std::optional<std::vector<std::string>> command;   ///< Overrides the image CMD

    // Network Settings
    std::string network;                               ///< Bridge network to attach
    std::vector<int> exposed_ports;                    ///< Published on random host ports

    // Resource Limits
    long cpu_period{100000};                           ///< CFS period (us)
    long cpu_quota{50000};                             ///< CFS quota (us); 50000 = half a core
    int memory_limit_mb{256};
    int memory_swap_mb{256};                           ///< Memory + swap; equal to memory = no swap
    int pids_limit{100};
    std::optional<int> storage_limit_mb;               ///< Needs a storage driver with quota support

    // Security Settings
    bool read_only_rootfs{true};
    std::vector<std::string> capabilities_drop{"ALL"};
    std::vector<std::string> capabilities_add;
    bool no_new_privileges{true};
    std::optional<std::string> seccomp_profile;        ///< Profile path or "unconfined"
    std::optional<std::string> apparmor_profile;
    std::optional<std::string> selinux_label;
    std::vector<std::string> tmpfs_mounts;             ///< "<path>:<options>"

    // Environment
    std::map<std::string, std::string> environment_vars;
    std::map<std::string, std::string> labels;
};

/**
 * @struct ContainerInspect
 * @brief Fields of `docker inspect` the orchestrator cares about
 */
struct ContainerInspect {
    std::string id;
    std::string state;                     ///< created, running, exited, dead...
    bool running{false};
    std::optional<std::string> ip_address;
    std::optional<std::string> mac_address;
    std::map<int, int> port_mappings;      ///< host port -> container port
};

/**
 * @struct ContainerStats
 * @brief One `docker stats --no-stream` sample
 */
struct ContainerStats {
    double cpu_percent{0.0};
    std::uint64_t memory_usage_bytes{0};
    std::uint64_t memory_limit_bytes{0};
    double memory_percent{0.0};
    std::uint64_t network_rx_bytes{0};
    std::uint64_t network_tx_bytes{0};
    std::uint64_t block_read_bytes{0};
    std::uint64_t block_write_bytes{0};
    int pids{0};
};

/**
 * @class DockerClient
 * @brief docker CLI operations
 *
 * **Thread Safety**: Stateless; safe to share between threads as long as the
 * underlying CommandRunner is.
 */
class DockerClient {
public:
    using Timeout = std::chrono::milliseconds;

    explicit DockerClient(std::shared_ptr<CommandRunner> runner,
                          std::string docker_binary = "docker");

    /// Run an arbitrary docker subcommand
    CommandResult Run(const std::vector<std::string>& args, Timeout timeout) const;

    /// `docker info` succeeds
    bool IsDaemonAvailable(Timeout timeout) const;

    // Networks
    CommandResult InspectNetwork(const std::string& name, Timeout timeout) const;
    CommandResult CreateNetwork(const std::string& name,
                                const std::map<std::string, std::string>& labels,
                                Timeout timeout) const;

    // Container lifecycle
    CommandResult CreateContainer(const ContainerCreateConfig& config, Timeout timeout) const;
    CommandResult StartContainer(const std::string& container, Timeout timeout) const;
    CommandResult StopContainer(const std::string& container, std::chrono::seconds grace,
                                Timeout timeout) const;
    CommandResult KillContainer(const std::string& container, Timeout timeout) const;
    CommandResult RemoveContainer(const std::string& container, bool force, bool remove_volumes,
                                  Timeout timeout) const;

    // Queries
    CommandResult InspectContainer(const std::string& container, Timeout timeout) const;
    CommandResult ExecInContainer(const std::string& container,
                                  const std::vector<std::string>& command,
                                  Timeout timeout) const;
    CommandResult GetContainerLogs(const std::string& container, int tail, Timeout timeout) const;
    CommandResult GetContainerStats(const std::string& container, Timeout timeout) const;

    /**
     * @brief Build the argument list for `docker create` (without the binary)
     */
    static std::vector<std::string> BuildCreateCommand(const ContainerCreateConfig& config);

    /**
     * @brief Parse `docker inspect` output
     * @param network Network whose address is reported
     * @throws nlohmann::json::exception on malformed output
     */
    static ContainerInspect ParseInspectOutput(const std::string& json_str, const std::string& network);

    /**
     * @brief Parse one `docker stats --format {{json .}}` line
     * @throws nlohmann::json::exception on malformed output
     */
    static ContainerStats ParseStatsOutput(const std::string& json_str);

    /**
     * @brief Parse docker's human-readable sizes ("1.5MiB", "12kB", "0B")
     * @return 0 for unparseable input
     */
    static std::uint64_t ParseSize(const std::string& text);

    static DockerErrorKind ClassifyError(const CommandResult& result);

private:
    std::shared_ptr<CommandRunner> runner_;
    std::string docker_binary_;
};

} // namespace utils
} // namespace cerberus
