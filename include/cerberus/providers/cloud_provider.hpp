/**
 * @file cloud_provider.hpp
 * @brief Terraform-provisioned cloud sandbox provider (AWS and GCP)
 *
 * Each instance gets its own Terraform workspace
 * `<state_dir>/<cloud>-<instance id>` holding generated JSON configuration and
 * a local state file. The workspace name is deterministic, so destroy and
 * existence checks keep working across orchestrator restarts.
 *
 * Cloud credentials are never written to the workspace; terraform picks them
 * up from the orchestrator's environment.
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/config.hpp"
#include "cerberus/providers/provider_specs.hpp"
#include "cerberus/providers/sandbox_provider.hpp"
#include "cerberus/utils/command_runner.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace cerberus {
namespace providers {

enum class CloudKind {
    AWS,
    GCP
};

/**
 * @class CloudProvider
 * @brief SandboxProvider running one Terraform workspace per instance
 *
 * The same class serves AWS and GCP; CloudKind selects the module tree,
 * the default module and the provider block written to main.tf.json.
 */
class CloudProvider : public SandboxProvider {
public:
    CloudProvider(CloudKind kind, core::CloudProviderConfig config,
                  std::shared_ptr<utils::CommandRunner> runner);

    core::SpawnResult Spawn(core::ChallengeInstance& instance, Deadline deadline) override;
    bool Destroy(const core::ChallengeInstance& instance) override;
    bool Exists(const core::ChallengeInstance& instance) override;
    std::string GetLogs(const core::ChallengeInstance& instance, int tail_lines = 100) override;
    ExecResult ExecCommand(const core::ChallengeInstance& instance,
                           const std::vector<std::string>& command) override;
    nlohmann::json GetStats(const core::ChallengeInstance& instance) override;
    std::string Name() const override;

    /// "aws" or "gcp"; also the module subdirectory
    std::string CloudName() const;

    std::filesystem::path WorkspaceDir(const std::string& instance_id) const;

    /**
     * @brief Generate main.tf.json for an instance
     */
    nlohmann::json BuildMainConfig(const core::ChallengeInstance& instance, const CloudSpec& spec) const;

    /**
     * @brief Flatten `terraform output -json` into name → value
     */
    static nlohmann::json FlattenOutputs(const nlohmann::json& outputs);

private:
    utils::CommandResult RunTerraform(const std::filesystem::path& workspace,
                                      const std::vector<std::string>& args,
                                      std::chrono::milliseconds timeout);

    /**
     * @brief Turn a failed terraform command into the matching exception
     */
    [[noreturn]] void RaiseFailure(const utils::CommandResult& result, const std::string& action,
                                   Deadline deadline) const;

    void WriteWorkspace(const std::filesystem::path& workspace, const core::ChallengeInstance& instance,
                        const CloudSpec& spec) const;

    void ApplyOutputs(core::ChallengeInstance& instance, const nlohmann::json& outputs,
                      const std::filesystem::path& workspace) const;

    /// terraform destroy + workspace removal; false when resources may remain
    bool DestroyWorkspace(const std::filesystem::path& workspace);

    CloudKind kind_;
    core::CloudProviderConfig config_;
    std::shared_ptr<utils::CommandRunner> runner_;
};

} // namespace providers
} // namespace cerberus
