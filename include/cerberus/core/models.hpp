/**
 * @file models.hpp
 * @brief Challenge instance data model and spawn/health value objects
 *
 * Defines the aggregate root of the orchestrator (ChallengeInstance) with its
 * embedded network, resource and security value objects, plus the ephemeral
 * request/result types exchanged between the manager, the sandbox providers
 * and the health checker. Every type round-trips through nlohmann::json so the
 * registry can mirror records into the durable cache.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @enum InstanceStatus
 * @brief Lifecycle state of a challenge instance
 *
 * pending → creating → running → {healthy, unhealthy} → stopping →
 * stopped/destroying → destroyed, plus the terminal error state.
 */
enum class InstanceStatus {
    PENDING,
    CREATING,
    RUNNING,
    HEALTHY,
    UNHEALTHY,
    STOPPING,
    STOPPED,
    DESTROYING,
    DESTROYED,
    ERROR
};

/**
 * @enum SandboxType
 * @brief Backend technology hosting an instance (immutable per instance)
 */
enum class SandboxType {
    STATIC,      ///< Static files, no infrastructure
    CONTAINER,   ///< Docker container
    MICROVM,     ///< Firecracker microVM inside a jailer chroot
    CLOUD_AWS,   ///< Terraform-provisioned AWS resources
    CLOUD_GCP,   ///< Terraform-provisioned GCP resources
    HARDWARE     ///< Physical lab equipment
};

std::string ToString(InstanceStatus status);
std::string ToString(SandboxType type);

/// @throws std::invalid_argument on unknown names
InstanceStatus ParseInstanceStatus(const std::string& name);

/// Accepts both current and legacy names ("docker", "firecracker", "terraform_aws"...).
std::optional<SandboxType> ParseSandboxType(const std::string& name);

/**
 * @struct NetworkConfig
 * @brief Addressing of a spawned sandbox
 */
struct NetworkConfig {
    std::optional<std::string> internal_ip;
    std::optional<std::string> external_ip;
    std::map<int, int> port_mappings;        ///< host port -> guest port
    std::optional<std::string> hostname;
    std::optional<std::string> mac_address;
};

/**
 * @struct ResourceLimits
 * @brief Resource caps applied by the provider
 *
 * Unset values fall back to the provider's configured defaults.
 */
struct ResourceLimits {
    std::optional<double> cpu_quota;               ///< CPU cores (0.5 = half a core)
    std::optional<int> memory_limit_mb;
    int memory_swap_mb{0};                         ///< 0 = no swap
    int pids_limit{100};
    std::optional<int> storage_limit_mb;
    std::optional<int> network_bandwidth_mbps;
};

/**
 * @struct SecurityProfile
 * @brief Mandatory access control and capability settings
 */
struct SecurityProfile {
    std::optional<std::string> seccomp_profile;
    std::optional<std::string> apparmor_profile;
    std::optional<std::string> selinux_context;
    bool read_only_rootfs{true};
    bool no_new_privileges{true};
    std::vector<std::string> drop_capabilities{"ALL"};
    std::vector<std::string> add_capabilities;
};

/**
 * @struct ChallengeInstance
 * @brief One spawned sandbox and everything known about it
 *
 * The ChallengeManager owns the authoritative copy (through the
 * InstanceRegistry). Providers receive it by reference for the duration of a
 * single call and fill in the provider binding, network and access fields.
 */
struct ChallengeInstance {
    // Identity
    std::string id;
    std::string challenge_id;
    std::string user_id;
    std::optional<std::string> team_id;

    SandboxType sandbox_type{SandboxType::CONTAINER};
    InstanceStatus status{InstanceStatus::PENDING};

    NetworkConfig network;
    ResourceLimits resources;
    SecurityProfile security;

    // Connection info
    std::optional<std::string> connection_string;
    std::optional<std::string> access_url;

    /// Anti-cheat secret planted in the sandbox; immutable once assigned
    std::optional<std::string> canary_token;

    // Lifecycle timestamps
    TimePoint created_at{Clock::now()};
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> last_health_check;
    std::optional<TimePoint> expires_at;
    std::optional<TimePoint> destroyed_at;

    // Provider binding
    std::optional<std::string> provider_instance_id;  ///< Container ID, jail path, cloud resource ID
    nlohmann::json provider_metadata = nlohmann::json::object();

    // Health counters
    int health_check_failures{0};
    int restart_count{0};

    /// creating, running, healthy or unhealthy
    bool IsActive() const;

    bool IsExpired(TimePoint now = Clock::now()) const;

    /// destroyed or error; no transition leaves these states
    bool IsTerminal() const;

    /**
     * @brief Move to @p new_status, stamping started_at on RUNNING and destroyed_at on DESTROYED
     *
     * @return false, leaving the record untouched, if the instance is already terminal
     */
    bool UpdateStatus(InstanceStatus new_status);

    /// Seconds until expiry (clamped at 1), or fallback when no expiry is set
    long RemainingSeconds(long fallback, TimePoint now = Clock::now()) const;
};

/**
 * @struct SpawnRequest
 * @brief Ephemeral input to ChallengeManager::Spawn
 */
struct SpawnRequest {
    std::string challenge_id;
    std::string user_id;
    std::optional<std::string> team_id;
    std::optional<SandboxType> sandbox_type{SandboxType::CONTAINER};
    int timeout_seconds{7200};

    std::optional<ResourceLimits> resource_overrides;
    std::optional<NetworkConfig> network_overrides;
    std::optional<SecurityProfile> security_overrides;
    nlohmann::json provider_metadata = nlohmann::json::object();
};

/**
 * @enum ErrorKind
 * @brief Failure classification carried by SpawnResult
 */
enum class ErrorKind {
    NONE,
    VALIDATION,
    QUOTA,
    RESOURCE_EXHAUSTED,
    TIMEOUT,
    PROVIDER
};

std::string ToString(ErrorKind kind);

/**
 * @struct SpawnResult
 * @brief Outcome of a spawn, from a provider or from the manager
 */
struct SpawnResult {
    bool success{false};
    std::optional<ChallengeInstance> instance;
    std::string error_message;
    bool retryable{false};
    ErrorKind error_kind{ErrorKind::NONE};

    static SpawnResult Success(ChallengeInstance instance);
    static SpawnResult Failure(ErrorKind kind, std::string message, bool retryable);
};

/**
 * @struct HealthStatus
 * @brief Result of one health probe
 */
struct HealthStatus {
    bool healthy{false};
    std::map<std::string, bool> checks;
    nlohmann::json metrics = nlohmann::json::object();
    std::optional<std::string> message;
    TimePoint timestamp{Clock::now()};
};

// ============================================================================
// JSON serialisation (ADL hooks for nlohmann::json)
// ============================================================================

std::string FormatTimestamp(TimePoint tp);

/// @throws std::invalid_argument on malformed input
TimePoint ParseTimestamp(const std::string& text);

void to_json(nlohmann::json& j, const NetworkConfig& network);
void from_json(const nlohmann::json& j, NetworkConfig& network);
void to_json(nlohmann::json& j, const ResourceLimits& limits);
void from_json(const nlohmann::json& j, ResourceLimits& limits);
void to_json(nlohmann::json& j, const SecurityProfile& security);
void from_json(const nlohmann::json& j, SecurityProfile& security);
void to_json(nlohmann::json& j, const ChallengeInstance& instance);
void from_json(const nlohmann::json& j, ChallengeInstance& instance);
void to_json(nlohmann::json& j, const SpawnRequest& request);
void from_json(const nlohmann::json& j, SpawnRequest& request);
void to_json(nlohmann::json& j, const SpawnResult& result);
void to_json(nlohmann::json& j, const HealthStatus& status);

} // namespace core
} // namespace cerberus
