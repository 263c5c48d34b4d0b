/**
 * @file provider_factory.cpp
 * @brief Builds the sandbox type → provider table from configuration
 *
 * @date 2025
 */

#include "cerberus/providers/provider_factory.hpp"
#include "cerberus/core/errors.hpp"
#include "cerberus/providers/cloud_provider.hpp"
#include "cerberus/providers/container_provider.hpp"
#include "cerberus/providers/microvm_provider.hpp"

#include <spdlog/spdlog.h>

namespace cerberus {
namespace providers {

ProviderTable BuildProviders(const core::OrchestratorConfig& config,
                             std::shared_ptr<utils::CommandRunner> runner) {
    ProviderTable table;

    for (const auto& name : config.enabled_providers) {
        if (name == "container") {
            table[core::SandboxType::CONTAINER] =
                std::make_shared<ContainerProvider>(config.container, runner);
        } else if (name == "microvm") {
            table[core::SandboxType::MICROVM] =
                std::make_shared<MicroVmProvider>(config.microvm, runner);
        } else if (name == "cloud_aws") {
            table[core::SandboxType::CLOUD_AWS] =
                std::make_shared<CloudProvider>(CloudKind::AWS, config.cloud, runner);
        } else if (name == "cloud_gcp") {
            table[core::SandboxType::CLOUD_GCP] =
                std::make_shared<CloudProvider>(CloudKind::GCP, config.cloud, runner);
        } else {
            throw core::ConfigError("Unknown provider in enabled_providers: " + name);
        }
        spdlog::info("Enabled provider: {}", name);
    }

    if (table.empty()) {
        spdlog::warn("No sandbox providers enabled; every spawn will be rejected");
    }
    return table;
}

} // namespace providers
} // namespace cerberus
