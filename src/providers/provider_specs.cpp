/**
 * @file provider_specs.cpp
 * @brief provider_metadata parsing and validation
 *
 * @date 2025
 */

#include "cerberus/providers/provider_specs.hpp"
#include "cerberus/core/errors.hpp"

#include <regex>

using json = nlohmann::json;

namespace cerberus {
namespace providers {

namespace {

bool IsValidPort(long long port) {
    return port > 0 && port <= 65535;
}

std::string RequireString(const json& metadata, const char* key, const std::string& fallback) {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        throw core::ValidationError(std::string("'") + key + "' must be a non-empty string");
    }
    return it->get<std::string>();
}

int RequirePort(const json& metadata, const char* key, int fallback) {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer() || !IsValidPort(it->get<long long>())) {
        throw core::ValidationError(std::string("'") + key + "' must be a port number");
    }
    return it->get<int>();
}

/// A command is either an argv array or a string run through `sh -c`
std::optional<std::vector<std::string>> ParseCommand(const json& metadata, const char* key) {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        if (it->get<std::string>().empty()) {
            return std::nullopt;
        }
        return std::vector<std::string>{"/bin/sh", "-c", it->get<std::string>()};
    }
    if (it->is_array()) {
        std::vector<std::string> argv;
        for (const auto& arg : *it) {
            if (!arg.is_string()) {
                throw core::ValidationError(std::string("'") + key + "' entries must be strings");
            }
            argv.push_back(arg.get<std::string>());
        }
        if (argv.empty()) {
            return std::nullopt;
        }
        return argv;
    }
    throw core::ValidationError(std::string("'") + key + "' must be a string or an array of strings");
}

std::string ScalarToString(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw core::ValidationError("Environment values must be scalars");
}

} // anonymous namespace

ContainerSpec ParseContainerSpec(const json& metadata, const std::string& default_image) {
    ContainerSpec spec;
    spec.image = RequireString(metadata, "image", default_image);
    spec.command = ParseCommand(metadata, "command");

    if (metadata.contains("env") && !metadata["env"].is_null()) {
        const auto& env = metadata["env"];
        if (!env.is_object()) {
            throw core::ValidationError("'env' must be an object");
        }
        static const std::regex kEnvName("^[A-Za-z_][A-Za-z0-9_]*$");
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!std::regex_match(it.key(), kEnvName)) {
                throw core::ValidationError("Invalid environment variable name: " + it.key());
            }
            spec.env[it.key()] = ScalarToString(it.value());
        }
    }

    if (metadata.contains("ports") && !metadata["ports"].is_null()) {
        const auto& ports = metadata["ports"];
        if (!ports.is_array()) {
            throw core::ValidationError("'ports' must be an array of port numbers");
        }
        spec.ports.clear();
        for (const auto& port : ports) {
            if (!port.is_number_integer() || !IsValidPort(port.get<long long>())) {
                throw core::ValidationError("Invalid port in 'ports': " + port.dump());
            }
            spec.ports.push_back(port.get<int>());
        }
    }

    if (metadata.contains("network_mode") && metadata["network_mode"].is_string() &&
        metadata["network_mode"].get<std::string>() == "host") {
        throw core::ValidationError("Host networking is not allowed for challenge containers");
    }

    return spec;
}

MicroVmSpec ParseMicroVmSpec(const json& metadata, const std::string& default_image) {
    MicroVmSpec spec;
    spec.image = RequireString(metadata, "vm_image", default_image);

    // Image names become file names under the images directory
    static const std::regex kImageName("^[A-Za-z0-9._-]+$");
    if (!std::regex_match(spec.image, kImageName) || spec.image.find("..") != std::string::npos) {
        throw core::ValidationError("Invalid VM image name: " + spec.image);
    }

    if (metadata.contains("is_windows") && !metadata["is_windows"].is_null()) {
        if (!metadata["is_windows"].is_boolean()) {
            throw core::ValidationError("'is_windows' must be a boolean");
        }
        spec.is_windows = metadata["is_windows"].get<bool>();
    }

    spec.readiness_port = RequirePort(metadata, "readiness_port", spec.is_windows ? 3389 : 22);
    return spec;
}

CloudSpec ParseCloudSpec(const json& metadata, const std::string& default_module) {
    CloudSpec spec;
    spec.module = RequireString(metadata, "terraform_module", default_module);

    static const std::regex kModuleName("^[A-Za-z0-9_-]+$");
    if (!std::regex_match(spec.module, kModuleName)) {
        throw core::ValidationError("Invalid terraform module name: " + spec.module);
    }

    if (metadata.contains("module_vars") && !metadata["module_vars"].is_null()) {
        if (!metadata["module_vars"].is_object()) {
            throw core::ValidationError("'module_vars' must be an object");
        }
        spec.module_vars = metadata["module_vars"];
    }

    for (const char* reserved : {"source", "instance_id", "user_id", "team_id", "canary_token"}) {
        if (spec.module_vars.contains(reserved)) {
            throw core::ValidationError(std::string("'module_vars' may not override '") + reserved + "'");
        }
    }
    return spec;
}

HealthCheckSpec ParseHealthCheckSpec(const json& metadata) {
    HealthCheckSpec spec;

    std::string type = RequireString(metadata, "health_check_type", "http");
    if (type == "http") {
        spec.type = HealthCheckType::HTTP;
    } else if (type == "tcp") {
        spec.type = HealthCheckType::TCP;
    } else if (type == "command") {
        spec.type = HealthCheckType::COMMAND;
    } else {
        throw core::ValidationError("Unknown health_check_type: " + type);
    }

    if (metadata.contains("health_check_url") && metadata["health_check_url"].is_string()) {
        spec.url = metadata["health_check_url"].get<std::string>();
    }

    if (metadata.contains("health_check_status") && !metadata["health_check_status"].is_null()) {
        const auto& status = metadata["health_check_status"];
        if (!status.is_number_integer() || status.get<int>() < 100 || status.get<int>() > 599) {
            throw core::ValidationError("'health_check_status' must be an HTTP status code");
        }
        spec.expected_status = status.get<int>();
    }

    spec.port = RequirePort(metadata, "health_check_port", 80);
    spec.command = ParseCommand(metadata, "health_check_command");
    return spec;
}

} // namespace providers
} // namespace cerberus
