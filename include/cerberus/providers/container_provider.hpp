/**
 * @file container_provider.hpp
 * @brief Docker-backed sandbox provider
 *
 * Each instance becomes one hardened container named `cerberus-<id>` on an
 * isolated bridge network. Services are published on random host ports and
 * exposed to players through the proxy domain.
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/config.hpp"
#include "cerberus/providers/provider_specs.hpp"
#include "cerberus/providers/sandbox_provider.hpp"
#include "cerberus/utils/docker_client.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace cerberus {
namespace providers {

/**
 * @class ContainerProvider
 * @brief SandboxProvider backed by hardened Docker containers
 */
class ContainerProvider : public SandboxProvider {
public:
    ContainerProvider(core::ContainerProviderConfig config,
                      std::shared_ptr<utils::CommandRunner> runner);

    core::SpawnResult Spawn(core::ChallengeInstance& instance, Deadline deadline) override;
    bool Destroy(const core::ChallengeInstance& instance) override;
    bool Exists(const core::ChallengeInstance& instance) override;
    std::string GetLogs(const core::ChallengeInstance& instance, int tail_lines = 100) override;
    ExecResult ExecCommand(const core::ChallengeInstance& instance,
                           const std::vector<std::string>& command) override;
    nlohmann::json GetStats(const core::ChallengeInstance& instance) override;
    std::string Name() const override { return "container"; }

    /// Container name used for an instance
    static std::string ContainerName(const std::string& instance_id);

    /**
     * @brief Translate an instance and its parsed metadata into `docker create` settings
     */
    utils::ContainerCreateConfig BuildCreateConfig(const core::ChallengeInstance& instance,
                                                   const ContainerSpec& spec) const;

private:
    /// Create the challenge network once per process if it does not exist yet
    void EnsureNetwork(Deadline deadline);

    /**
     * @brief Convert a failed docker command into the matching exception
     *
     * @throws core::ResourceExhaustedError, core::SpawnTimeoutError or core::ProviderError
     */
    [[noreturn]] void RaiseFailure(const utils::CommandResult& result,
                                   const std::string& action,
                                   Deadline deadline) const;

    void WriteCanary(const std::string& container, const core::ChallengeInstance& instance,
                     Deadline deadline);

    /// Container reference for an instance: its recorded ID, else its deterministic name
    std::string ContainerRef(const core::ChallengeInstance& instance) const;

    core::ContainerProviderConfig config_;
    utils::DockerClient docker_;

    std::mutex network_mutex_;
    bool network_ready_{false};
};

} // namespace providers
} // namespace cerberus
