/**
 * @file provider_factory.hpp
 * @brief Builds the sandbox type → provider table from configuration
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/config.hpp"
#include "cerberus/providers/sandbox_provider.hpp"
#include "cerberus/utils/command_runner.hpp"

#include <memory>

namespace cerberus {
namespace providers {

/**
 * @brief Instantiate every provider named in config.enabled_providers
 *
 * Names are `container`, `microvm`, `cloud_aws` and `cloud_gcp`.
 *
 * @throws core::ConfigError on an unknown provider name
 */
ProviderTable BuildProviders(const core::OrchestratorConfig& config,
                             std::shared_ptr<utils::CommandRunner> runner);

} // namespace providers
} // namespace cerberus
