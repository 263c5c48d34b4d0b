/**
 * @file health_checker.hpp
 * @brief Periodic liveness probing of running instances
 *
 * Runs one supervised probe loop per instance. A loop looks up the current
 * instance through a registry lookup function on every iteration and ends
 * by itself once the instance is gone or no longer active; it never owns
 * instance state.
 *
 * **Escalation**:
 * ```
 * running ──success──▶ healthy
 *    │                    │
 *    └── N consecutive failures ──▶ unhealthy ──success──▶ healthy
 * ```
 * Status callbacks fire once per transition, result observers once per
 * probe.
 *
 * **Probe types** (metadata `health_check_type`):
 * - `http`: GET the health URL, compare the status code
 * - `tcp`: connect to the instance address
 * - `command`: run a command inside the sandbox through the provider
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/config.hpp"
#include "cerberus/core/models.hpp"
#include "cerberus/providers/sandbox_provider.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cerberus {
namespace health {

/// Fired on healthy/unhealthy transitions
using StatusCallback = std::function<void(const std::string& instance_id,
                                          core::InstanceStatus new_status,
                                          const core::HealthStatus& result)>;

/// Fired for every probe result
using ResultObserver = std::function<void(const std::string& instance_id,
                                          const core::HealthStatus& result)>;

/// Runs a health command inside an instance's sandbox
using CommandExecutor = std::function<providers::ExecResult(const core::ChallengeInstance& instance,
                                                            const std::vector<std::string>& command)>;

/// Current state of an instance, std::nullopt when unknown
using InstanceLookup = std::function<std::optional<core::ChallengeInstance>(const std::string& instance_id)>;

/**
 * @class HealthChecker
 * @brief Periodic per-instance probes with failure escalation
 *
 * Each scheduled instance gets its own loop thread. Result observers see
 * every probe; status callbacks fire only on healthy/unhealthy transitions.
 */
class HealthChecker {
public:
    explicit HealthChecker(core::HealthConfig config = core::HealthConfig{});

    /// Cancels and joins every probe loop
    ~HealthChecker();

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    void SetInstanceLookup(InstanceLookup lookup);
    void SetCommandExecutor(CommandExecutor executor);

    void AddStatusCallback(StatusCallback callback);
    void AddResultObserver(ResultObserver observer);

    /**
     * @brief Start (or restart) the probe loop for an instance
     *
     * An existing loop for the same id is cancelled and joined first. The
     * first probe runs one interval after scheduling.
     */
    void ScheduleCheck(const core::ChallengeInstance& instance);

    /**
     * @brief Perform exactly one probe
     *
     * Never throws; transport errors yield an unhealthy result.
     */
    core::HealthStatus CheckOnce(const core::ChallengeInstance& instance);

    /**
     * @brief Feed one probe result into the escalation state machine
     *
     * Results for instances without a scheduled check are dropped.
     */
    void RecordResult(const std::string& instance_id, const core::HealthStatus& status);

    /**
     * @brief Stop the probe loop of an instance and forget its counters
     *
     * Safe to call from the loop's own thread (for example from a status
     * callback); the thread is then detached instead of joined.
     */
    void CancelCheck(const std::string& instance_id);

    void CancelAll();

    std::size_t ScheduledCount() const;

    int ConsecutiveFailures(const std::string& instance_id) const;

private:
    struct ProbeTask {
        std::thread thread;
        std::mutex mutex;
        std::condition_variable cv;
        bool stop{false};
    };

    struct Tracking {
        int consecutive_failures{0};
        std::optional<core::InstanceStatus> reported;   ///< Last status announced by a callback
    };

    void RunLoop(core::ChallengeInstance snapshot, std::shared_ptr<ProbeTask> task);

    /// Signal and join (or detach, if called from the task itself)
    static void StopTask(const std::shared_ptr<ProbeTask>& task);

    core::HealthStatus ProbeHttp(const core::ChallengeInstance& instance, const std::string& url, int expected);
    core::HealthStatus ProbeTcp(const core::ChallengeInstance& instance, int port);
    core::HealthStatus ProbeCommand(const core::ChallengeInstance& instance,
                                    const std::optional<std::vector<std::string>>& command);

    core::HealthConfig config_;

    mutable std::mutex mutex_;                                  ///< Guards everything below
    std::map<std::string, std::shared_ptr<ProbeTask>> tasks_;   ///< instance id -> loop
    std::map<std::string, Tracking> tracking_;                  ///< Present only while scheduled
    std::vector<StatusCallback> status_callbacks_;
    std::vector<ResultObserver> result_observers_;
    InstanceLookup lookup_;                                     ///< Unset: probe the scheduled snapshot
    CommandExecutor executor_;                                  ///< Unset: command probes fail

    std::condition_variable idle_cv_;
    int running_loops_{0};                      ///< Loop threads not yet finished, joined or detached
};

} // namespace health
} // namespace cerberus
