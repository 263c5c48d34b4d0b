/**
 * @file challenge_manager.hpp
 * @brief Challenge instance lifecycle orchestration
 *
 * The ChallengeManager is the single owner of challenge instance records. It
 * accepts spawn requests, enforces per-user quotas, drives the sandbox
 * provider selected by the instance's sandbox type, retries spawns the
 * backend rejected for lack of capacity, and runs two background loops:
 * expiry cleanup and zombie reaping.
 *
 * **State Machine**:
 * ```
 * pending → creating → running ⇄ {healthy, unhealthy} → destroying → destroyed
 *              └──────────────▶ error
 * ```
 *
 * **Locking**:
 * - Every operation on one instance holds that instance's mutex
 * - Quota check and reservation hold the user's mutex
 * - Lock order is instance before user; health checks are cancelled before
 *   an instance lock is taken for destruction
 *
 * **Usage Example**:
 * @code
 * std::map<SandboxType, std::shared_ptr<providers::SandboxProvider>> table;
 * table[SandboxType::CONTAINER] = std::make_shared<providers::ContainerProvider>(cfg.container, runner);
 *
 * ChallengeManager manager(cfg, table, cache, events);
 * manager.Recover();
 * manager.StartBackgroundTasks();
 *
 * SpawnRequest request;
 * request.challenge_id = "web-101";
 * request.user_id = "alice";
 * auto result = manager.Spawn(request);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/config.hpp"
#include "cerberus/core/event_sink.hpp"
#include "cerberus/core/instance_registry.hpp"
#include "cerberus/core/models.hpp"
#include "cerberus/health/health_checker.hpp"
#include "cerberus/providers/sandbox_provider.hpp"
#include "cerberus/storage/kv_cache.hpp"

#include <atomic>
#include <chrono>
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
namespace core {

using ProviderTable = providers::ProviderTable;

/**
 * @class ChallengeManager
 * @brief Owner of the challenge instance lifecycle
 *
 * All public methods are thread-safe. Spawn() blocks for the duration of
 * the provider call and any backoff sleeps.
 */
class ChallengeManager {
public:
    /// Durable list receiving requests rejected for lack of capacity
    static constexpr const char* kSpawnQueueKey = "spawn_queue";

    /// Blocking wait between spawn attempts
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param providers Sandbox type → backend; types without an entry are rejected
     * @param cache Durable cache for instance records and the spawn queue
     * @param events Optional event sink
     */
    ChallengeManager(OrchestratorConfig config,
                     ProviderTable providers,
                     std::shared_ptr<storage::KeyValueCache> cache,
                     std::shared_ptr<EventSink> events = nullptr);

    /// Stops background loops and health checks; does not destroy instances
    ~ChallengeManager();

    ChallengeManager(const ChallengeManager&) = delete;
    ChallengeManager& operator=(const ChallengeManager&) = delete;

    // ------------------------------------------------------------------------
    // Lifecycle operations
    // ------------------------------------------------------------------------

    /**
     * @brief Spawn a challenge instance
     *
     * Never throws; every failure is reported through SpawnResult with its
     * ErrorKind and retryable flag.
     */
    SpawnResult Spawn(const SpawnRequest& request);

    /**
     * @brief Tear an instance down
     *
     * @return true if the instance is destroyed (now or previously), false if
     *         the id is unknown
     */
    bool Destroy(const std::string& instance_id);

    /**
     * @brief Push expires_at forward
     * @return false unless the instance is active and @p additional_seconds > 0
     */
    bool ExtendTimeout(const std::string& instance_id, long additional_seconds);

    /**
     * @brief Fold one probe result into the record
     *
     * Stamps last_health_check and maintains health_check_failures.
     *
     * @return false if the instance is unknown or not active
     */
    bool UpdateHealthStatus(const std::string& instance_id, const HealthStatus& status);

    /**
     * @brief Apply a healthy/unhealthy transition reported by the HealthChecker
     */
    bool ApplyHealthTransition(const std::string& instance_id, InstanceStatus new_status,
                               const HealthStatus& status);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    /// Current record, or the tombstone of a destroyed/failed one
    std::optional<ChallengeInstance> GetStatus(const std::string& instance_id) const;

    std::vector<ChallengeInstance> ListUserInstances(const std::string& user_id) const;

    std::vector<ChallengeInstance> ListActive() const;

    /// Active and not past expires_at
    bool IsUsable(const std::string& instance_id) const;

    std::optional<std::string> GetLogs(const std::string& instance_id, int tail_lines = 100);

    std::optional<nlohmann::json> GetStats(const std::string& instance_id);

    /// Requests recorded in the durable spawn queue, newest first
    std::vector<SpawnRequest> PendingSpawnRequests() const;

    // ------------------------------------------------------------------------
    // Background work
    // ------------------------------------------------------------------------

    /// Destroy every tracked instance past expires_at. Returns the number destroyed.
    int RunCleanupCycle();

    /// Destroy records whose backing resource vanished. Returns the number reaped.
    int RunZombieCycle();

    /**
     * @brief Reload non-terminal records from the cache after a restart
     *
     * Records caught mid-spawn are destroyed; active ones are tracked again
     * and get their health checks rescheduled.
     *
     * @return number of records now tracked
     */
    int Recover();

    void StartBackgroundTasks();
    void StopBackgroundTasks();

    /**
     * @brief Stop everything and destroy every active instance concurrently
     */
    void Shutdown();

    // ------------------------------------------------------------------------
    // Wiring
    // ------------------------------------------------------------------------

    health::HealthChecker& GetHealthChecker() { return *health_; }

    void SetSleeper(Sleeper sleeper);

    const OrchestratorConfig& GetConfig() const { return config_; }

    const InstanceRegistry& GetRegistry() const { return *registry_; }

    /// Delay before attempt @p attempt + 1 (attempt counts from 1)
    std::chrono::milliseconds BackoffDelay(int attempt) const;

private:
    /// Outcome of one spawn attempt; resource exhaustion is reported separately for retry
    struct AttemptOutcome {
        SpawnResult result;
        bool exhausted{false};
    };

    AttemptOutcome SpawnAttempt(const SpawnRequest& request, SandboxType type,
                                const std::shared_ptr<providers::SandboxProvider>& provider);

    ChallengeInstance BuildRecord(const SpawnRequest& request, SandboxType type) const;

    /// Best-effort provider teardown after a failed spawn
    void CleanupPartial(providers::SandboxProvider& provider, const ChallengeInstance& instance);

    /// Mark error, persist a tombstone, release the lock entry. Caller holds the instance lock.
    void FailRecord(ChallengeInstance& instance, const std::string& reason);

    /// Caller holds the instance lock
    void DestroyLocked(ChallengeInstance instance, bool call_provider, const std::string& reason);

    std::shared_ptr<providers::SandboxProvider> FindProvider(SandboxType type) const;

    std::optional<ChallengeInstance> LoadTombstone(const std::string& instance_id) const;

    void EnqueueForRetry(const SpawnRequest& request);

    void Emit(const std::string& event_type, const nlohmann::json& data);

    void RunLoop(std::chrono::seconds interval, const char* name, const std::function<int()>& cycle);

    /// Sleep unless shutdown starts first
    void InterruptibleSleep(std::chrono::milliseconds duration);

    OrchestratorConfig config_;
    ProviderTable providers_;                           ///< Fixed at construction
    std::shared_ptr<storage::KeyValueCache> cache_;     ///< Records, tombstones and spawn_queue
    std::shared_ptr<EventSink> events_;                 ///< May be null
    std::unique_ptr<InstanceRegistry> registry_;
    std::unique_ptr<health::HealthChecker> health_;

    Sleeper sleeper_;                                   ///< Backoff wait between spawn attempts

    std::mutex loop_mutex_;                             ///< Guards stopping_ and loops_
    std::condition_variable loop_cv_;                   ///< Wakes loops and sleeps on shutdown
    bool stopping_{false};
    std::vector<std::thread> loops_;                    ///< Cleanup and zombie reaper
    std::atomic<bool> shut_down_{false};                ///< Shutdown() ran
};

} // namespace core
} // namespace cerberus
