/**
 * @file sandbox_provider.hpp
 * @brief Abstract sandbox backend
 *
 * A SandboxProvider turns a ChallengeInstance record into running
 * infrastructure and back. The ChallengeManager holds one provider per
 * sandbox type and always calls it under the instance's lock, so an
 * implementation only has to protect its own bookkeeping against calls for
 * *different* instances.
 *
 * **Contract**:
 * - Spawn() fills in provider_instance_id, network and access fields on
 *   success and leaves provider_instance_id unset on failure
 * - Spawn() tears down whatever it created before returning a failure
 * - Destroy() is idempotent and never throws
 * - Exists() answers authoritatively: "not found" is false, any other
 *   backend error throws ProviderError
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/models.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace providers {

using Deadline = std::chrono::steady_clock::time_point;

/**
 * @struct ExecResult
 * @brief Outcome of a command executed inside a sandbox
 */
struct ExecResult {
    int exit_code{-1};
    std::string output;
    std::optional<std::string> error;
};

class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    /**
     * @brief Create and start the sandbox for @p instance
     *
     * @param instance Record to populate (provider binding, network, access URL)
     * @param deadline Absolute time by which the spawn must complete
     *
     * @return SpawnResult; the instance copy inside is informational, the
     *         caller keeps using @p instance
     *
     * @throws core::SpawnTimeoutError if the deadline passed mid-spawn
     * @throws core::ResourceExhaustedError if the backend is out of capacity
     * @throws core::ValidationError on malformed provider metadata
     */
    virtual core::SpawnResult Spawn(core::ChallengeInstance& instance, Deadline deadline) = 0;

    /**
     * @brief Tear the sandbox down
     * @return true if nothing of the sandbox remains
     */
    virtual bool Destroy(const core::ChallengeInstance& instance) = 0;

    /**
     * @brief Check whether the backing resource is still present
     * @throws core::ProviderError when the backend cannot answer
     */
    virtual bool Exists(const core::ChallengeInstance& instance) = 0;

    /// Recent console/log output, empty when unavailable
    virtual std::string GetLogs(const core::ChallengeInstance& instance, int tail_lines = 100) = 0;

    virtual ExecResult ExecCommand(const core::ChallengeInstance& instance,
                                   const std::vector<std::string>& command) = 0;

    /// Resource usage metrics, empty object when unavailable
    virtual nlohmann::json GetStats(const core::ChallengeInstance& instance) = 0;

    virtual std::string Name() const = 0;
};

/// Sandbox type → backend serving it
using ProviderTable = std::map<core::SandboxType, std::shared_ptr<SandboxProvider>>;

/**
 * @brief Time left until @p deadline, capped at @p cap
 * @throws core::SpawnTimeoutError if the deadline has already passed
 */
std::chrono::milliseconds RemainingBudget(Deadline deadline, std::chrono::milliseconds cap);

} // namespace providers
} // namespace cerberus
