/**
 * @file models.cpp
 * @brief Implementation of the instance data model and its JSON mapping
 *
 * Timestamps are serialised as ISO-8601 UTC with millisecond precision
 * (`2025-03-01T12:00:00.000Z`). Optional fields are written as `null` and
 * tolerated when missing so that records persisted by older builds still load.
 *
 * @date 2025
 */

#include "cerberus/core/models.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cerberus {
namespace core {

namespace {

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
void GetOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->get<T>();
}

void PutTimestamp(json& j, const char* key, const std::optional<TimePoint>& tp) {
    if (tp) {
        j[key] = FormatTimestamp(*tp);
    } else {
        j[key] = nullptr;
    }
}

void GetTimestamp(const json& j, const char* key, std::optional<TimePoint>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = ParseTimestamp(it->get<std::string>());
}

} // anonymous namespace

// ============================================================================
// Enum names
// ============================================================================

std::string ToString(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::PENDING:    return "pending";
        case InstanceStatus::CREATING:   return "creating";
        case InstanceStatus::RUNNING:    return "running";
        case InstanceStatus::HEALTHY:    return "healthy";
        case InstanceStatus::UNHEALTHY:  return "unhealthy";
        case InstanceStatus::STOPPING:   return "stopping";
        case InstanceStatus::STOPPED:    return "stopped";
        case InstanceStatus::DESTROYING: return "destroying";
        case InstanceStatus::DESTROYED:  return "destroyed";
        case InstanceStatus::ERROR:      return "error";
    }
    return "unknown";
}

std::string ToString(SandboxType type) {
    switch (type) {
        case SandboxType::STATIC:    return "static";
        case SandboxType::CONTAINER: return "container";
        case SandboxType::MICROVM:   return "microvm";
        case SandboxType::CLOUD_AWS: return "cloud_aws";
        case SandboxType::CLOUD_GCP: return "cloud_gcp";
        case SandboxType::HARDWARE:  return "hardware";
    }
    return "unknown";
}

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::VALIDATION:         return "validation";
        case ErrorKind::QUOTA:              return "quota";
        case ErrorKind::RESOURCE_EXHAUSTED: return "resource_exhausted";
        case ErrorKind::TIMEOUT:            return "timeout";
        case ErrorKind::PROVIDER:           return "provider";
    }
    return "unknown";
}

InstanceStatus ParseInstanceStatus(const std::string& name) {
    static const std::map<std::string, InstanceStatus> kStatuses = {
        {"pending", InstanceStatus::PENDING},
        {"creating", InstanceStatus::CREATING},
        {"running", InstanceStatus::RUNNING},
        {"healthy", InstanceStatus::HEALTHY},
        {"unhealthy", InstanceStatus::UNHEALTHY},
        {"stopping", InstanceStatus::STOPPING},
        {"stopped", InstanceStatus::STOPPED},
        {"destroying", InstanceStatus::DESTROYING},
        {"destroyed", InstanceStatus::DESTROYED},
        {"error", InstanceStatus::ERROR},
    };

    auto it = kStatuses.find(name);
    if (it == kStatuses.end()) {
        throw std::invalid_argument("Unknown instance status: " + name);
    }
    return it->second;
}

std::optional<SandboxType> ParseSandboxType(const std::string& name) {
    static const std::map<std::string, SandboxType> kTypes = {
        {"static", SandboxType::STATIC},
        {"container", SandboxType::CONTAINER},
        {"docker", SandboxType::CONTAINER},
        {"microvm", SandboxType::MICROVM},
        {"firecracker", SandboxType::MICROVM},
        {"cloud_aws", SandboxType::CLOUD_AWS},
        {"terraform_aws", SandboxType::CLOUD_AWS},
        {"cloud_gcp", SandboxType::CLOUD_GCP},
        {"terraform_gcp", SandboxType::CLOUD_GCP},
        {"hardware", SandboxType::HARDWARE},
    };

    auto it = kTypes.find(name);
    if (it == kTypes.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// ChallengeInstance
// ============================================================================

bool ChallengeInstance::IsActive() const {
    return status == InstanceStatus::CREATING ||
           status == InstanceStatus::RUNNING ||
           status == InstanceStatus::HEALTHY ||
           status == InstanceStatus::UNHEALTHY;
}

bool ChallengeInstance::IsExpired(TimePoint now) const {
    return expires_at.has_value() && now > *expires_at;
}

bool ChallengeInstance::IsTerminal() const {
    return status == InstanceStatus::DESTROYED || status == InstanceStatus::ERROR;
}

bool ChallengeInstance::UpdateStatus(InstanceStatus new_status) {
    if (IsTerminal()) {
        return status == new_status;
    }
    status = new_status;
    if (new_status == InstanceStatus::RUNNING) {
        started_at = Clock::now();
    } else if (new_status == InstanceStatus::DESTROYED) {
        destroyed_at = Clock::now();
    }
    return true;
}

long ChallengeInstance::RemainingSeconds(long fallback, TimePoint now) const {
    if (!expires_at) {
        return fallback;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*expires_at - now).count();
    return std::max<long>(1, static_cast<long>(remaining));
}

// ============================================================================
// SpawnResult
// ============================================================================

SpawnResult SpawnResult::Success(ChallengeInstance instance) {
    SpawnResult result;
    result.success = true;
    result.instance = std::move(instance);
    return result;
}

SpawnResult SpawnResult::Failure(ErrorKind kind, std::string message, bool retryable) {
    SpawnResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = std::move(message);
    result.retryable = retryable;
    return result;
}

// ============================================================================
// Timestamps
// ============================================================================

std::string FormatTimestamp(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    if (millis < 0) {
        secs -= std::chrono::seconds(1);
        millis += 1000;
    }

    std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

TimePoint ParseTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }

    long millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string fraction;
        while (std::isdigit(iss.peek())) {
            fraction.push_back(static_cast<char>(iss.get()));
        }
        fraction = fraction.substr(0, 3);
        while (fraction.size() < 3) {
            fraction.push_back('0');
        }
        millis = std::stol(fraction);
    }

    auto tp = Clock::from_time_t(timegm(&tm));
    return tp + std::chrono::milliseconds(millis);
}

// ============================================================================
// JSON mapping
// ============================================================================

void to_json(json& j, const NetworkConfig& network) {
    j = json::object();
    PutOptional(j, "internal_ip", network.internal_ip);
    PutOptional(j, "external_ip", network.external_ip);

    json ports = json::object();
    for (const auto& [host, guest] : network.port_mappings) {
        ports[std::to_string(host)] = guest;
    }
    j["port_mappings"] = ports;

    PutOptional(j, "hostname", network.hostname);
    PutOptional(j, "mac_address", network.mac_address);
}

void from_json(const json& j, NetworkConfig& network) {
    GetOptional(j, "internal_ip", network.internal_ip);
    GetOptional(j, "external_ip", network.external_ip);

    network.port_mappings.clear();
    if (j.contains("port_mappings") && j["port_mappings"].is_object()) {
        for (auto it = j["port_mappings"].begin(); it != j["port_mappings"].end(); ++it) {
            network.port_mappings[std::stoi(it.key())] = it.value().get<int>();
        }
    }

    GetOptional(j, "hostname", network.hostname);
    GetOptional(j, "mac_address", network.mac_address);
}

void to_json(json& j, const ResourceLimits& limits) {
    j = json::object();
    PutOptional(j, "cpu_quota", limits.cpu_quota);
    PutOptional(j, "memory_limit_mb", limits.memory_limit_mb);
    j["memory_swap_mb"] = limits.memory_swap_mb;
    j["pids_limit"] = limits.pids_limit;
    PutOptional(j, "storage_limit_mb", limits.storage_limit_mb);
    PutOptional(j, "network_bandwidth_mbps", limits.network_bandwidth_mbps);
}

void from_json(const json& j, ResourceLimits& limits) {
    GetOptional(j, "cpu_quota", limits.cpu_quota);
    GetOptional(j, "memory_limit_mb", limits.memory_limit_mb);
    limits.memory_swap_mb = j.value("memory_swap_mb", 0);
    limits.pids_limit = j.value("pids_limit", 100);
    GetOptional(j, "storage_limit_mb", limits.storage_limit_mb);
    GetOptional(j, "network_bandwidth_mbps", limits.network_bandwidth_mbps);
}

void to_json(json& j, const SecurityProfile& security) {
    j = json::object();
    PutOptional(j, "seccomp_profile", security.seccomp_profile);
    PutOptional(j, "apparmor_profile", security.apparmor_profile);
    PutOptional(j, "selinux_context", security.selinux_context);
    j["read_only_rootfs"] = security.read_only_rootfs;
    j["no_new_privileges"] = security.no_new_privileges;
    j["drop_capabilities"] = security.drop_capabilities;
    j["add_capabilities"] = security.add_capabilities;
}

void from_json(const json& j, SecurityProfile& security) {
    GetOptional(j, "seccomp_profile", security.seccomp_profile);
    GetOptional(j, "apparmor_profile", security.apparmor_profile);
    GetOptional(j, "selinux_context", security.selinux_context);
    security.read_only_rootfs = j.value("read_only_rootfs", true);
    security.no_new_privileges = j.value("no_new_privileges", true);
    security.drop_capabilities = j.value("drop_capabilities", std::vector<std::string>{"ALL"});
    security.add_capabilities = j.value("add_capabilities", std::vector<std::string>{});
}

void to_json(json& j, const ChallengeInstance& instance) {
    j = json::object();
    j["id"] = instance.id;
    j["challenge_id"] = instance.challenge_id;
    j["user_id"] = instance.user_id;
    PutOptional(j, "team_id", instance.team_id);
    j["sandbox_type"] = ToString(instance.sandbox_type);
    j["status"] = ToString(instance.status);

    j["network"] = instance.network;
    j["resources"] = instance.resources;
    j["security"] = instance.security;

    PutOptional(j, "connection_string", instance.connection_string);
    PutOptional(j, "access_url", instance.access_url);
    PutOptional(j, "canary_token", instance.canary_token);

    j["created_at"] = FormatTimestamp(instance.created_at);
    PutTimestamp(j, "started_at", instance.started_at);
    PutTimestamp(j, "last_health_check", instance.last_health_check);
    PutTimestamp(j, "expires_at", instance.expires_at);
    PutTimestamp(j, "destroyed_at", instance.destroyed_at);

    PutOptional(j, "provider_instance_id", instance.provider_instance_id);
    j["provider_metadata"] = instance.provider_metadata;

    j["health_check_failures"] = instance.health_check_failures;
    j["restart_count"] = instance.restart_count;
}

void from_json(const json& j, ChallengeInstance& instance) {
    instance.id = j.at("id").get<std::string>();
    instance.challenge_id = j.at("challenge_id").get<std::string>();
    instance.user_id = j.at("user_id").get<std::string>();
    GetOptional(j, "team_id", instance.team_id);

    auto type = ParseSandboxType(j.value("sandbox_type", "container"));
    if (!type) {
        throw std::invalid_argument("Unknown sandbox type: " + j.value("sandbox_type", ""));
    }
    instance.sandbox_type = *type;
    instance.status = ParseInstanceStatus(j.value("status", "pending"));

    if (j.contains("network")) {
        instance.network = j["network"].get<NetworkConfig>();
    }
    if (j.contains("resources")) {
        instance.resources = j["resources"].get<ResourceLimits>();
    }
    if (j.contains("security")) {
        instance.security = j["security"].get<SecurityProfile>();
    }

    GetOptional(j, "connection_string", instance.connection_string);
    GetOptional(j, "access_url", instance.access_url);
    GetOptional(j, "canary_token", instance.canary_token);

    if (j.contains("created_at") && j["created_at"].is_string()) {
        instance.created_at = ParseTimestamp(j["created_at"].get<std::string>());
    }
    GetTimestamp(j, "started_at", instance.started_at);
    GetTimestamp(j, "last_health_check", instance.last_health_check);
    GetTimestamp(j, "expires_at", instance.expires_at);
    GetTimestamp(j, "destroyed_at", instance.destroyed_at);

    GetOptional(j, "provider_instance_id", instance.provider_instance_id);
    instance.provider_metadata = j.value("provider_metadata", json::object());

    instance.health_check_failures = j.value("health_check_failures", 0);
    instance.restart_count = j.value("restart_count", 0);
}

void to_json(json& j, const SpawnRequest& request) {
    j = json::object();
    j["challenge_id"] = request.challenge_id;
    j["user_id"] = request.user_id;
    PutOptional(j, "team_id", request.team_id);
    if (request.sandbox_type) {
        j["sandbox_type"] = ToString(*request.sandbox_type);
    } else {
        j["sandbox_type"] = nullptr;
    }
    j["timeout_seconds"] = request.timeout_seconds;
    PutOptional(j, "resource_overrides", request.resource_overrides);
    PutOptional(j, "network_overrides", request.network_overrides);
    PutOptional(j, "security_overrides", request.security_overrides);
    j["provider_metadata"] = request.provider_metadata;
}

void from_json(const json& j, SpawnRequest& request) {
    request.challenge_id = j.value("challenge_id", "");
    request.user_id = j.value("user_id", "");
    GetOptional(j, "team_id", request.team_id);

    auto it = j.find("sandbox_type");
    if (it == j.end()) {
        request.sandbox_type = SandboxType::CONTAINER;
    } else if (it->is_null()) {
        request.sandbox_type.reset();
    } else {
        // Unknown names leave the type unset; Spawn rejects that as a validation error
        request.sandbox_type = ParseSandboxType(it->get<std::string>());
    }

    request.timeout_seconds = j.value("timeout_seconds", 7200);
    GetOptional(j, "resource_overrides", request.resource_overrides);
    GetOptional(j, "network_overrides", request.network_overrides);
    GetOptional(j, "security_overrides", request.security_overrides);
    request.provider_metadata = j.value("provider_metadata", json::object());
}

void to_json(json& j, const SpawnResult& result) {
    j = json::object();
    j["success"] = result.success;
    if (result.instance) {
        j["instance"] = *result.instance;
    } else {
        j["instance"] = nullptr;
    }
    j["error_message"] = result.error_message;
    j["error_kind"] = ToString(result.error_kind);
    j["retryable"] = result.retryable;
}

void to_json(json& j, const HealthStatus& status) {
    j = json::object();
    j["healthy"] = status.healthy;
    j["checks"] = status.checks;
    j["metrics"] = status.metrics;
    PutOptional(j, "message", status.message);
    j["timestamp"] = FormatTimestamp(status.timestamp);
}

} // namespace core
} // namespace cerberus
