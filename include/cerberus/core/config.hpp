/**
 * @file config.hpp
 * @brief Orchestrator configuration with defaults, JSON loading and
 *        environment overrides
 *
 * All tunables live in one aggregate so that main() can build it from a JSON
 * file, patch it from the environment and CLI flags, and hand it to the
 * ChallengeManager and the providers.
 *
 * **Example config file**:
 * @code{.json}
 * {
 *   "max_instances_per_user": 3,
 *   "spawn_timeout_seconds": 120,
 *   "enabled_providers": ["container", "cloud_aws"],
 *   "container": { "network_name": "cerberus-challenges", "proxy_domain": "ctf.example.org" },
 *   "health": { "check_interval_seconds": 30, "failure_threshold": 3 }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace core {

/**
 * @struct ContainerProviderConfig
 * @brief Docker backend settings
 */
struct ContainerProviderConfig {
    std::string docker_binary{"docker"};                 ///< Resolved through PATH
    std::string network_name{"cerberus-challenges"};     ///< Isolated bridge network
    std::string proxy_domain{"challenges.cerberus.local"};  ///< Host part of access URLs
    std::string default_image{"alpine:latest"};                 ///< When metadata names no image
    double default_cpu_quota{0.5};                       ///< Cores
    int default_memory_mb{256};                          ///< When the request sets no memory limit
    int default_pids_limit{100};
    std::string tmpfs_options{"rw,size=64m,mode=1777"};  ///< Mounted at /tmp
    std::optional<std::string> default_seccomp_profile;  ///< Path to a seccomp JSON profile
    std::chrono::seconds command_timeout{60};            ///< Per docker command
    std::chrono::seconds stop_grace{10};                 ///< SIGTERM to SIGKILL
};

/**
 * @struct MicroVmProviderConfig
 * @brief Firecracker/jailer backend settings
 */
struct MicroVmProviderConfig {
    std::string firecracker_binary{"/usr/local/bin/firecracker"};
    std::string jailer_binary{"/usr/local/bin/jailer"};
    std::string images_dir{"/opt/cerberus/orchestrator/vm-images"};  ///< <image>-vmlinux, <image>-rootfs.ext4
    std::string jail_base_dir{"/srv/jailer"};                        ///< jailer --chroot-base-dir
    std::string bridge_name{"fc-br0"};
    std::string tap_prefix{"fc-tap"};
    int jailer_uid{1000};                                            ///< Owner of the jail tree
    int jailer_gid{1000};
    int default_vcpus{2};
    int default_memory_mb{512};
    std::string default_image{"ubuntu-22.04-minimal"};
    std::string boot_args{"console=ttyS0 reboot=k panic=1 pci=off"};
    std::chrono::seconds api_socket_timeout{10};                     ///< Socket wait and each API call
    std::chrono::seconds boot_timeout{30};                           ///< Readiness probe budget
    std::chrono::milliseconds boot_probe_interval{500};
};

/**
 * @struct CloudProviderConfig
 * @brief Terraform backend settings (shared by the AWS and GCP providers)
 */
struct CloudProviderConfig {
    std::string terraform_binary{"terraform"};
    std::string modules_dir{"/opt/cerberus/orchestrator/terraform"};        ///< <cloud>/<module>
    std::string state_dir{"/opt/cerberus/orchestrator/terraform-state"};    ///< One workspace per instance
    std::string aws_region{"us-east-1"};
    std::string aws_default_module{"ec2"};
    std::string gcp_project;                                                ///< Required for cloud_gcp
    std::string gcp_region{"us-central1"};
    std::string gcp_default_module{"compute"};
    std::chrono::seconds init_timeout{60};
    std::chrono::seconds apply_timeout{300};
    std::chrono::seconds destroy_timeout{300};
    std::chrono::seconds output_timeout{60};
};

/**
 * @struct HealthConfig
 * @brief Health probe scheduling
 */
struct HealthConfig {
    std::chrono::seconds check_interval{30};
    std::chrono::seconds probe_timeout{10};
    int failure_threshold{3};   ///< Consecutive failures before unhealthy
};

/**
 * @struct RetryConfig
 * @brief Backoff for resource-exhausted spawns
 *
 * Delay before attempt n+1 is `base_delay * multiplier^(n-1)`, capped at
 * max_delay.
 */
struct RetryConfig {
    int max_attempts{3};                ///< Including the first attempt
    std::chrono::seconds base_delay{2};
    std::chrono::seconds max_delay{10};
    double multiplier{2.0};
};

/**
 * @struct OrchestratorConfig
 * @brief Complete orchestrator configuration
 */
struct OrchestratorConfig {
    // Lifecycle
    int max_instances_per_user{3};                  ///< Active instances, CREATING included
    std::chrono::seconds spawn_timeout{120};        ///< Deadline handed to the provider
    std::chrono::seconds cleanup_interval{30};
    std::chrono::seconds zombie_check_interval{60};
    std::chrono::seconds default_ttl{7200};         ///< Cache TTL of records without expiry
    std::chrono::seconds tombstone_ttl{3600};       ///< Cache TTL of destroyed records

    // Storage
    std::string state_file;                         ///< Empty: in-memory cache only

    /// Sandbox types to build providers for ("container", "microvm", "cloud_aws", "cloud_gcp")
    std::vector<std::string> enabled_providers{"container"};

    ContainerProviderConfig container;
    MicroVmProviderConfig microvm;
    CloudProviderConfig cloud;
    HealthConfig health;
    RetryConfig retry;

    std::string log_level{"info"};                 ///< spdlog level name
};

/**
 * @brief Build a configuration from a JSON document
 *
 * Missing keys keep their defaults; unknown keys are ignored.
 *
 * @throws ConfigError on type mismatches or out-of-range values
 */
OrchestratorConfig ConfigFromJson(const nlohmann::json& j);

/**
 * @brief Load configuration from a JSON file
 * @throws ConfigError if the file cannot be read or parsed
 */
OrchestratorConfig LoadConfig(const std::string& path);

/**
 * @brief Apply environment variable overrides
 *
 * Honours CHALLENGE_PROXY_DOMAIN, AWS_DEFAULT_REGION, GCP_PROJECT_ID,
 * GCP_REGION and CERBERUS_STATE_FILE.
 */
void ApplyEnvironmentOverrides(OrchestratorConfig& config);

/**
 * @brief Sanity-check a configuration
 * @throws ConfigError describing the first invalid value
 */
void ValidateConfig(const OrchestratorConfig& config);

nlohmann::json ConfigToJson(const OrchestratorConfig& config);

} // namespace core
} // namespace cerberus
