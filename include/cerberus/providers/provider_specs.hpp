/**
 * @file provider_specs.hpp
 * @brief Typed views of the free-form provider_metadata bag
 *
 * Metadata is parsed once at the provider boundary; malformed values raise
 * core::ValidationError before any backend resource is touched.
 *
 * | Key                   | Used by      | Default               |
 * |-----------------------|--------------|-----------------------|
 * | image                 | container    | provider default      |
 * | command               | container    | image entrypoint      |
 * | env                   | container    | {}                    |
 * | ports                 | container    | [80]                  |
 * | network_mode          | container    | isolated network      |
 * | vm_image              | microvm      | provider default      |
 * | is_windows            | microvm      | false                 |
 * | readiness_port        | microvm      | 22 / 3389             |
 * | terraform_module      | cloud        | provider default      |
 * | module_vars           | cloud        | {}                    |
 * | health_check_type     | health       | http                  |
 * | health_check_url      | health       | <access_url>/health   |
 * | health_check_status   | health       | 200                   |
 * | health_check_port     | health       | 80                    |
 * | health_check_command  | health       | none                  |
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace providers {

/**
 * @struct ContainerSpec
 * @brief Docker-specific part of an instance's provider metadata
 */
struct ContainerSpec {
    std::string image;                                  ///< Image reference, default from config
    std::optional<std::vector<std::string>> command;    ///< argv; a string becomes `/bin/sh -c`
    std::map<std::string, std::string> env;             ///< Scalars converted to strings
    std::vector<int> ports{80};                         ///< Container ports published on random host ports
};

/**
 * @struct MicroVmSpec
 * @brief Firecracker-specific part of an instance's provider metadata
 */
struct MicroVmSpec {
    std::string image;              ///< Base name under the images directory
    bool is_windows{false};
    int readiness_port{22};         ///< 3389 for Windows guests
};

/**
 * @struct CloudSpec
 * @brief Terraform module selection and its input variables
 */
struct CloudSpec {
    std::string module;                                     ///< Directory under <modules_dir>/<cloud>
    nlohmann::json module_vars = nlohmann::json::object();  ///< Reserved identity keys are rejected
};

enum class HealthCheckType {
    HTTP,
    TCP,
    COMMAND
};

/**
 * @struct HealthCheckSpec
 * @brief Probe configuration read from `health_check_*` metadata keys
 */
struct HealthCheckSpec {
    HealthCheckType type{HealthCheckType::HTTP};
    std::optional<std::string> url;                     ///< Defaults to the instance's access_url
    int expected_status{200};
    int port{80};                                       ///< TCP probes
    std::optional<std::vector<std::string>> command;    ///< Command probes; exit code 0 is healthy
};

/// @throws core::ValidationError
ContainerSpec ParseContainerSpec(const nlohmann::json& metadata, const std::string& default_image);

/// @throws core::ValidationError
MicroVmSpec ParseMicroVmSpec(const nlohmann::json& metadata, const std::string& default_image);

/// @throws core::ValidationError
CloudSpec ParseCloudSpec(const nlohmann::json& metadata, const std::string& default_module);

/// @throws core::ValidationError
HealthCheckSpec ParseHealthCheckSpec(const nlohmann::json& metadata);

} // namespace providers
} // namespace cerberus
