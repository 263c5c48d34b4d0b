/**
 * @file docker_client.cpp
 * @brief Implementation of the docker CLI wrapper
 *
 * **Container Lifecycle** as used by the container provider:
 * ```
 * network inspect/create → create → start → inspect → exec (canary)
 *                                  ...
 * stop (grace) → kill (fallback) → rm -f -v
 * ```
 *
 * docker reports failures only through its exit status and stderr text, so
 * ClassifyError() matches the daemon's well-known error messages.
 *
 * @date 2025
 */

#include "cerberus/utils/docker_client.hpp"
#include "cerberus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace cerberus {
namespace utils {

namespace {

/// Percent strings look like "12.34%"
double ParsePercent(const std::string& text) {
    std::string value = text;
    value.erase(std::remove(value.begin(), value.end(), '%'), value.end());
    try {
        return std::stod(StringUtils::Trim(value));
    } catch (const std::exception&) {
        return 0.0;
    }
}

/// "<a> / <b>" pairs as reported for MemUsage, NetIO and BlockIO
std::pair<std::uint64_t, std::uint64_t> ParseSizePair(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return {DockerClient::ParseSize(text), 0};
    }
    return {DockerClient::ParseSize(text.substr(0, slash)),
            DockerClient::ParseSize(text.substr(slash + 1))};
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerClient::DockerClient(std::shared_ptr<CommandRunner> runner, std::string docker_binary)
    : runner_(std::move(runner)), docker_binary_(std::move(docker_binary)) {
}

CommandResult DockerClient::Run(const std::vector<std::string>& args, Timeout timeout) const {
    CommandSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(docker_binary_);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = timeout;
    return runner_->Run(spec);
}

bool DockerClient::IsDaemonAvailable(Timeout timeout) const {
    return Run({"info", "--format", "{{.ServerVersion}}"}, timeout).Ok();
}

// ============================================================================
// NETWORKS
// ============================================================================

CommandResult DockerClient::InspectNetwork(const std::string& name, Timeout timeout) const {
    return Run({"network", "inspect", "--format", "{{.Id}}", name}, timeout);
}

CommandResult DockerClient::CreateNetwork(const std::string& name,
                                          const std::map<std::string, std::string>& labels,
                                          Timeout timeout) const {
    std::vector<std::string> args = {"network", "create", "--driver", "bridge"};
    for (const auto& [key, value] : labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(name);

    spdlog::info("Creating docker network: {}", name);
    return Run(args, timeout);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

CommandResult DockerClient::CreateContainer(const ContainerCreateConfig& config, Timeout timeout) const {
    spdlog::debug("Creating container {} from {}", config.name, config.image);
    return Run(BuildCreateCommand(config), timeout);
}

CommandResult DockerClient::StartContainer(const std::string& container, Timeout timeout) const {
    return Run({"start", container}, timeout);
}

CommandResult DockerClient::StopContainer(const std::string& container, std::chrono::seconds grace,
                                          Timeout timeout) const {
    return Run({"stop", "--time", std::to_string(grace.count()), container}, timeout);
}

CommandResult DockerClient::KillContainer(const std::string& container, Timeout timeout) const {
    return Run({"kill", container}, timeout);
}

CommandResult DockerClient::RemoveContainer(const std::string& container, bool force,
                                            bool remove_volumes, Timeout timeout) const {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("-f");
    }
    if (remove_volumes) {
        args.push_back("-v");
    }
    args.push_back(container);
    return Run(args, timeout);
}

// ============================================================================
// QUERIES
// ============================================================================

CommandResult DockerClient::InspectContainer(const std::string& container, Timeout timeout) const {
    return Run({"inspect", "--type", "container", container}, timeout);
}

CommandResult DockerClient::ExecInContainer(const std::string& container,
                                            const std::vector<std::string>& command,
                                            Timeout timeout) const {
    std::vector<std::string> args = {"exec", container};
    args.insert(args.end(), command.begin(), command.end());
    return Run(args, timeout);
}

CommandResult DockerClient::GetContainerLogs(const std::string& container, int tail, Timeout timeout) const {
    std::vector<std::string> args = {"logs", "--timestamps"};
    if (tail > 0) {
        args.push_back("--tail");
        args.push_back(std::to_string(tail));
    }
    args.push_back(container);
    return Run(args, timeout);
}

CommandResult DockerClient::GetContainerStats(const std::string& container, Timeout timeout) const {
    return Run({"stats", "--no-stream", "--format", "{{json .}}", container}, timeout);
}

// ============================================================================
// COMMAND BUILDING
// ============================================================================

std::vector<std::string> DockerClient::BuildCreateCommand(const ContainerCreateConfig& config) {
    std::vector<std::string> args;
    args.push_back("create");

    args.push_back("--name");
    args.push_back(config.name);

    if (config.hostname) {
        args.push_back("--hostname");
        args.push_back(*config.hostname);
    }

    // Resource limits
    args.push_back("--cpu-period");
    args.push_back(std::to_string(config.cpu_period));
    args.push_back("--cpu-quota");
    args.push_back(std::to_string(config.cpu_quota));

    args.push_back("--memory");
    args.push_back(std::to_string(config.memory_limit_mb) + "m");
    args.push_back("--memory-swap");
    args.push_back(std::to_string(std::max(config.memory_swap_mb, config.memory_limit_mb)) + "m");

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    if (config.storage_limit_mb) {
        args.push_back("--storage-opt");
        args.push_back("size=" + std::to_string(*config.storage_limit_mb) + "M");
    }

    // Network
    if (!config.network.empty()) {
        args.push_back("--network");
        args.push_back(config.network);
    }
    for (int port : config.exposed_ports) {
        args.push_back("-p");
        args.push_back("0:" + std::to_string(port) + "/tcp");
    }

    // Security
    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : config.capabilities_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }
    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges:true");
    }
    if (config.seccomp_profile) {
        args.push_back("--security-opt");
        args.push_back("seccomp=" + *config.seccomp_profile);
    }
    if (config.apparmor_profile) {
        args.push_back("--security-opt");
        args.push_back("apparmor=" + *config.apparmor_profile);
    }
    if (config.selinux_label) {
        args.push_back("--security-opt");
        args.push_back("label=" + *config.selinux_label);
    }

    for (const auto& mount : config.tmpfs_mounts) {
        args.push_back("--tmpfs");
        args.push_back(mount);
    }

    // Environment and labels
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Image (must be last before command)
    args.push_back(config.image);
    if (config.command) {
        args.insert(args.end(), config.command->begin(), config.command->end());
    }

    return args;
}

// ============================================================================
// OUTPUT PARSING
// ============================================================================

ContainerInspect DockerClient::ParseInspectOutput(const std::string& json_str, const std::string& network) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            throw std::runtime_error("docker inspect returned no objects");
        }
        j = j[0];
    }

    ContainerInspect info;
    info.id = j.value("Id", "");
    if (j.contains("State") && j["State"].is_object()) {
        info.state = j["State"].value("Status", "");
        info.running = j["State"].value("Running", false);
    }

    if (!j.contains("NetworkSettings") || !j["NetworkSettings"].is_object()) {
        return info;
    }
    const auto& settings = j["NetworkSettings"];

    if (settings.contains("Networks") && settings["Networks"].is_object()) {
        const auto& networks = settings["Networks"];
        const json* primary = nullptr;
        if (networks.contains(network)) {
            primary = &networks[network];
        } else if (!networks.empty()) {
            primary = &networks.begin().value();
        }
        if (primary != nullptr && primary->is_object()) {
            std::string ip = primary->value("IPAddress", "");
            std::string mac = primary->value("MacAddress", "");
            if (!ip.empty()) {
                info.ip_address = ip;
            }
            if (!mac.empty()) {
                info.mac_address = mac;
            }
        }
    }

    // "80/tcp": [{"HostIp": "0.0.0.0", "HostPort": "32768"}, {"HostIp": "::", ...}]
    if (settings.contains("Ports") && settings["Ports"].is_object()) {
        for (auto it = settings["Ports"].begin(); it != settings["Ports"].end(); ++it) {
            if (!it.value().is_array() || it.value().empty()) {
                continue;
            }
            int container_port = 0;
            try {
                container_port = std::stoi(StringUtils::Split(it.key(), '/')[0]);
            } catch (const std::exception&) {
                continue;
            }
            for (const auto& binding : it.value()) {
                std::string host_port = binding.value("HostPort", "");
                if (host_port.empty()) {
                    continue;
                }
                try {
                    info.port_mappings[std::stoi(host_port)] = container_port;
                } catch (const std::exception&) {
                    spdlog::debug("Ignoring unparseable host port '{}'", host_port);
                }
                break;
            }
        }
    }

    return info;
}

ContainerStats DockerClient::ParseStatsOutput(const std::string& json_str) {
    // --no-stream with a single container yields one line
    auto lines = StringUtils::SplitLines(json_str);
    json j = json::parse(lines.empty() ? json_str : lines.front());

    ContainerStats stats;
    stats.cpu_percent = ParsePercent(j.value("CPUPerc", "0%"));
    stats.memory_percent = ParsePercent(j.value("MemPerc", "0%"));

    auto mem = ParseSizePair(j.value("MemUsage", ""));
    stats.memory_usage_bytes = mem.first;
    stats.memory_limit_bytes = mem.second;

    auto net = ParseSizePair(j.value("NetIO", ""));
    stats.network_rx_bytes = net.first;
    stats.network_tx_bytes = net.second;

    auto block = ParseSizePair(j.value("BlockIO", ""));
    stats.block_read_bytes = block.first;
    stats.block_write_bytes = block.second;

    try {
        stats.pids = std::stoi(j.value("PIDs", "0"));
    } catch (const std::exception&) {
        stats.pids = 0;
    }
    return stats;
}

std::uint64_t DockerClient::ParseSize(const std::string& text) {
    static const std::map<std::string, double> kUnits = {
        {"b", 1.0},
        {"kb", 1e3}, {"mb", 1e6}, {"gb", 1e9}, {"tb", 1e12},
        {"kib", 1024.0}, {"mib", 1048576.0}, {"gib", 1073741824.0}, {"tib", 1099511627776.0},
    };

    std::string value = StringUtils::Trim(text);
    std::size_t pos = 0;
    while (pos < value.size() && (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) {
        ++pos;
    }
    if (pos == 0) {
        return 0;
    }

    double number = 0.0;
    try {
        number = std::stod(value.substr(0, pos));
    } catch (const std::exception&) {
        return 0;
    }

    std::string unit = StringUtils::ToLower(StringUtils::Trim(value.substr(pos)));
    if (unit.empty()) {
        unit = "b";
    }
    auto it = kUnits.find(unit);
    if (it == kUnits.end()) {
        return 0;
    }
    return static_cast<std::uint64_t>(std::llround(number * it->second));
}

DockerErrorKind DockerClient::ClassifyError(const CommandResult& result) {
    if (result.Ok()) {
        return DockerErrorKind::NONE;
    }
    if (result.timed_out) {
        return DockerErrorKind::TIMEOUT;
    }

    const std::string text = StringUtils::ToLower(result.stderr_text + "\n" + result.stdout_text);
    auto has = [&text](const char* needle) { return text.find(needle) != std::string::npos; };

    if (has("no space left on device") || has("cannot allocate memory") ||
        has("port is already allocated") || has("address already in use")) {
        return DockerErrorKind::RESOURCE_EXHAUSTED;
    }
    if (has("no such container") || has("no such image") || has("no such object") ||
        has("no such network") || has("pull access denied") || has("manifest unknown") ||
        has("repository does not exist")) {
        return DockerErrorKind::NOT_FOUND;
    }
    if (has("conflict") || has("is already in use")) {
        return DockerErrorKind::CONFLICT;
    }
    if (has("toomanyrequests") || has("rate limit")) {
        return DockerErrorKind::RATE_LIMITED;
    }
    if (has("cannot connect to the docker daemon") || has("is the docker daemon running") ||
        has("connection refused") || has("context deadline exceeded") || result.spawn_failed) {
        return DockerErrorKind::DAEMON_UNAVAILABLE;
    }
    return DockerErrorKind::OTHER;
}

} // namespace utils
} // namespace cerberus
