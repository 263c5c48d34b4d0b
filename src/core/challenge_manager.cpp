/**
 * @file challenge_manager.cpp
 * @brief Challenge instance lifecycle orchestration
 *
 * @date 2025
 */

#include "cerberus/core/challenge_manager.hpp"
#include "cerberus/core/errors.hpp"
#include "cerberus/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

using json = nlohmann::json;

namespace cerberus {
namespace core {

namespace {

json InstanceEventData(const ChallengeInstance& instance) {
    json data = {
        {"instance_id", instance.id},
        {"challenge_id", instance.challenge_id},
        {"user_id", instance.user_id},
        {"sandbox_type", ToString(instance.sandbox_type)}
    };
    if (instance.team_id) {
        data["team_id"] = *instance.team_id;
    }
    return data;
}

std::optional<std::string> ValidateRequest(const SpawnRequest& request) {
    if (request.challenge_id.empty()) {
        return "challenge_id is required";
    }
    if (request.user_id.empty()) {
        return "user_id is required";
    }
    if (request.timeout_seconds <= 0) {
        return "timeout_seconds must be positive";
    }
    if (!request.sandbox_type) {
        return "Unknown sandbox type";
    }
    return std::nullopt;
}

} // anonymous namespace

ChallengeManager::ChallengeManager(OrchestratorConfig config,
                                   ProviderTable providers,
                                   std::shared_ptr<storage::KeyValueCache> cache,
                                   std::shared_ptr<EventSink> events)
    : config_(std::move(config)),
      providers_(std::move(providers)),
      cache_(std::move(cache)),
      events_(std::move(events)) {

    registry_ = std::make_unique<InstanceRegistry>(cache_, config_.default_ttl, config_.tombstone_ttl);
    health_ = std::make_unique<health::HealthChecker>(config_.health);

    sleeper_ = [this](std::chrono::milliseconds duration) { InterruptibleSleep(duration); };

    health_->SetInstanceLookup([this](const std::string& id) { return registry_->Get(id); });

    health_->SetCommandExecutor(
        [this](const ChallengeInstance& instance, const std::vector<std::string>& command) {
            auto provider = FindProvider(instance.sandbox_type);
            if (!provider) {
                providers::ExecResult result;
                result.error = "No provider for " + ToString(instance.sandbox_type);
                return result;
            }
            return provider->ExecCommand(instance, command);
        });

    health_->AddResultObserver([this](const std::string& id, const HealthStatus& status) {
        UpdateHealthStatus(id, status);
    });

    health_->AddStatusCallback(
        [this](const std::string& id, InstanceStatus new_status, const HealthStatus& status) {
            ApplyHealthTransition(id, new_status, status);
        });

    std::vector<std::string> names;
    for (const auto& [type, provider] : providers_) {
        names.push_back(ToString(type) + "=" + provider->Name());
    }
    spdlog::info("ChallengeManager initialized with {} provider(s)", names.size());
    for (const auto& name : names) {
        spdlog::debug("  provider {}", name);
    }
}

ChallengeManager::~ChallengeManager() {
    StopBackgroundTasks();
    health_->CancelAll();
}

void ChallengeManager::SetSleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

std::shared_ptr<providers::SandboxProvider> ChallengeManager::FindProvider(SandboxType type) const {
    auto it = providers_.find(type);
    if (it == providers_.end()) {
        return nullptr;
    }
    return it->second;
}

void ChallengeManager::Emit(const std::string& event_type, const json& data) {
    if (!events_) {
        return;
    }
    try {
        events_->Emit(event_type, data);
    } catch (const std::exception& e) {
        spdlog::warn("Event {} not delivered: {}", event_type, e.what());
    }
}

// ============================================================================
// SPAWN
// ============================================================================

std::chrono::milliseconds ChallengeManager::BackoffDelay(int attempt) const {
    const auto& retry = config_.retry;
    double delay_ms = std::chrono::duration_cast<std::chrono::milliseconds>(retry.base_delay).count();
    for (int i = 1; i < attempt; ++i) {
        delay_ms *= retry.multiplier;
    }
    const double cap_ms = std::chrono::duration_cast<std::chrono::milliseconds>(retry.max_delay).count();
    return std::chrono::milliseconds(static_cast<long long>(std::min(delay_ms, cap_ms)));
}

SpawnResult ChallengeManager::Spawn(const SpawnRequest& request) {
    if (auto problem = ValidateRequest(request)) {
        spdlog::warn("Rejected spawn request: {}", *problem);
        return SpawnResult::Failure(ErrorKind::VALIDATION, *problem, false);
    }

    const SandboxType type = *request.sandbox_type;
    auto provider = FindProvider(type);
    if (!provider) {
        const std::string message = "No provider registered for sandbox type '" + ToString(type) + "'";
        spdlog::warn("Rejected spawn request: {}", message);
        return SpawnResult::Failure(ErrorKind::VALIDATION, message, false);
    }

    const int attempts = std::max(1, config_.retry.max_attempts);
    bool queued = false;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        AttemptOutcome outcome = SpawnAttempt(request, type, provider);
        if (!outcome.exhausted) {
            return outcome.result;
        }

        if (!queued) {
            EnqueueForRetry(request);
            queued = true;
        }

        if (attempt == attempts) {
            spdlog::error("Spawn of {} for {} still out of capacity after {} attempts",
                          request.challenge_id, request.user_id, attempts);
            return SpawnResult::Failure(ErrorKind::RESOURCE_EXHAUSTED,
                                        "Resources exhausted: " + outcome.result.error_message, true);
        }

        auto delay = BackoffDelay(attempt);
        spdlog::warn("Spawn attempt {}/{} out of capacity, retrying in {}ms",
                     attempt, attempts, delay.count());
        sleeper_(delay);
    }

    // Unreachable: the loop returns on its last iteration
    return SpawnResult::Failure(ErrorKind::RESOURCE_EXHAUSTED, "Resources exhausted", true);
}

ChallengeInstance ChallengeManager::BuildRecord(const SpawnRequest& request, SandboxType type) const {
    ChallengeInstance instance;
    instance.id = utils::HashUtils::GenerateUuid();
    instance.challenge_id = request.challenge_id;
    instance.user_id = request.user_id;
    instance.team_id = request.team_id;
    instance.sandbox_type = type;
    instance.created_at = Clock::now();
    instance.expires_at = instance.created_at + std::chrono::seconds(request.timeout_seconds);
    instance.canary_token = utils::HashUtils::GenerateCanaryToken(
        request.challenge_id, request.user_id, request.team_id);

    if (request.resource_overrides) {
        instance.resources = *request.resource_overrides;
    }
    if (request.network_overrides) {
        instance.network = *request.network_overrides;
    }
    if (request.security_overrides) {
        instance.security = *request.security_overrides;
    }
    if (request.provider_metadata.is_object()) {
        instance.provider_metadata = request.provider_metadata;
    }
    return instance;
}

ChallengeManager::AttemptOutcome ChallengeManager::SpawnAttempt(
    const SpawnRequest& request, SandboxType type,
    const std::shared_ptr<providers::SandboxProvider>& provider) {

    ChallengeInstance instance = BuildRecord(request, type);

    auto instance_lock = registry_->InstanceLock(instance.id);
    std::lock_guard<std::mutex> guard(*instance_lock);

    // Quota check and reservation
    {
        auto user_lock = registry_->UserLock(request.user_id);
        std::lock_guard<std::mutex> user_guard(*user_lock);

        const int active = registry_->CountActiveForUser(request.user_id);
        if (active >= config_.max_instances_per_user) {
            registry_->ReleaseInstanceLock(instance.id);
            const std::string message = "Maximum active instances reached (" +
                                        std::to_string(config_.max_instances_per_user) + ")";
            spdlog::warn("Quota exceeded for user {}: {} active", request.user_id, active);
            return {SpawnResult::Failure(ErrorKind::QUOTA, message, false), false};
        }

        instance.UpdateStatus(InstanceStatus::CREATING);
        registry_->Put(instance);
    }

    spdlog::info("Spawning instance {} ({}) for user {} via {}",
                 instance.id, request.challenge_id, request.user_id, provider->Name());

    const auto deadline = std::chrono::steady_clock::now() + config_.spawn_timeout;

    SpawnResult result;
    try {
        result = provider->Spawn(instance, deadline);
        if (result.success && std::chrono::steady_clock::now() > deadline) {
            throw SpawnTimeoutError("Provider returned after the spawn deadline");
        }
    } catch (const SpawnTimeoutError& e) {
        spdlog::error("Spawn of {} timed out: {}", instance.id, e.what());
        CleanupPartial(*provider, instance);
        FailRecord(instance, "timeout");
        return {SpawnResult::Failure(ErrorKind::TIMEOUT, "Instance spawn timeout", true), false};
    } catch (const ResourceExhaustedError& e) {
        spdlog::warn("Backend out of capacity for {}: {}", instance.id, e.what());
        CleanupPartial(*provider, instance);
        registry_->Erase(instance.id);
        registry_->ReleaseInstanceLock(instance.id);
        return {SpawnResult::Failure(ErrorKind::RESOURCE_EXHAUSTED, e.what(), true), true};
    } catch (const ValidationError& e) {
        spdlog::error("Invalid provider metadata for {}: {}", instance.id, e.what());
        CleanupPartial(*provider, instance);
        FailRecord(instance, e.what());
        return {SpawnResult::Failure(ErrorKind::VALIDATION, e.what(), false), false};
    } catch (const ProviderError& e) {
        spdlog::error("Provider failed to spawn {}: {}", instance.id, e.what());
        CleanupPartial(*provider, instance);
        FailRecord(instance, e.what());
        return {SpawnResult::Failure(ErrorKind::PROVIDER, e.what(), e.IsRetryable()), false};
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error spawning {}: {}", instance.id, e.what());
        CleanupPartial(*provider, instance);
        FailRecord(instance, e.what());
        return {SpawnResult::Failure(ErrorKind::PROVIDER, e.what(), false), false};
    }

    if (!result.success) {
        switch (result.error_kind) {
        case ErrorKind::RESOURCE_EXHAUSTED:
            spdlog::warn("Backend out of capacity for {}: {}", instance.id, result.error_message);
            CleanupPartial(*provider, instance);
            registry_->Erase(instance.id);
            registry_->ReleaseInstanceLock(instance.id);
            return {SpawnResult::Failure(ErrorKind::RESOURCE_EXHAUSTED, result.error_message, true), true};
        case ErrorKind::TIMEOUT:
            CleanupPartial(*provider, instance);
            FailRecord(instance, "timeout");
            return {SpawnResult::Failure(ErrorKind::TIMEOUT, "Instance spawn timeout", true), false};
        default:
            spdlog::error("Provider failed to spawn {}: {}", instance.id, result.error_message);
            CleanupPartial(*provider, instance);
            FailRecord(instance, result.error_message);
            return {SpawnResult::Failure(result.error_kind == ErrorKind::NONE ? ErrorKind::PROVIDER
                                                                              : result.error_kind,
                                         result.error_message, result.retryable), false};
        }
    }

    instance.UpdateStatus(InstanceStatus::RUNNING);
    registry_->Put(instance);
    health_->ScheduleCheck(instance);

    spdlog::info("Instance {} running ({})", instance.id,
                 instance.access_url.value_or(instance.provider_instance_id.value_or("-")));

    json data = InstanceEventData(instance);
    if (instance.access_url) {
        data["access_url"] = *instance.access_url;
    }
    Emit("instance.spawned", data);

    return {SpawnResult::Success(instance), false};
}

void ChallengeManager::CleanupPartial(providers::SandboxProvider& provider, const ChallengeInstance& instance) {
    try {
        if (!provider.Destroy(instance)) {
            spdlog::warn("Partial state of {} may remain after failed spawn", instance.id);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Cleanup after failed spawn of {} failed: {}", instance.id, e.what());
    }
}

void ChallengeManager::FailRecord(ChallengeInstance& instance, const std::string& reason) {
    instance.UpdateStatus(InstanceStatus::ERROR);
    instance.provider_metadata["error"] = reason;
    registry_->Retire(instance);
    registry_->ReleaseInstanceLock(instance.id);
}

void ChallengeManager::EnqueueForRetry(const SpawnRequest& request) {
    if (!cache_) {
        return;
    }
    try {
        json entry = request;
        entry["queued_at"] = FormatTimestamp(Clock::now());
        cache_->LPush(kSpawnQueueKey, entry.dump());
        spdlog::info("Queued spawn request for {} / {}", request.challenge_id, request.user_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to queue spawn request: {}", e.what());
    }
}

void ChallengeManager::InterruptibleSleep(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    loop_cv_.wait_for(lock, duration, [this] { return stopping_; });
}

// ============================================================================
// DESTROY / EXTEND
// ============================================================================

bool ChallengeManager::Destroy(const std::string& instance_id) {
    health_->CancelCheck(instance_id);

    bool destroyed = false;
    {
        auto instance_lock = registry_->InstanceLock(instance_id);
        std::lock_guard<std::mutex> guard(*instance_lock);

        auto instance = registry_->Get(instance_id);
        if (!instance) {
            registry_->ReleaseInstanceLock(instance_id);
            auto tombstone = LoadTombstone(instance_id);
            if (tombstone && tombstone->status == InstanceStatus::DESTROYED) {
                spdlog::debug("Instance {} already destroyed", instance_id);
                destroyed = true;
            } else {
                spdlog::warn("Destroy requested for unknown instance {}", instance_id);
            }
        } else if (instance->status == InstanceStatus::DESTROYED ||
                   instance->status == InstanceStatus::DESTROYING) {
            destroyed = true;
        } else {
            DestroyLocked(*instance, true, "requested");
            destroyed = true;
        }
    }

    // A spawn holding the lock above may have scheduled a check in the meantime
    health_->CancelCheck(instance_id);
    return destroyed;
}

void ChallengeManager::DestroyLocked(ChallengeInstance instance, bool call_provider, const std::string& reason) {
    spdlog::info("Destroying instance {} ({})", instance.id, reason);

    instance.UpdateStatus(InstanceStatus::DESTROYING);
    registry_->Put(instance);

    if (call_provider) {
        auto provider = FindProvider(instance.sandbox_type);
        if (provider) {
            try {
                if (!provider->Destroy(instance)) {
                    spdlog::warn("Provider {} reported incomplete teardown of {}",
                                 provider->Name(), instance.id);
                }
            } catch (const std::exception& e) {
                spdlog::error("Provider teardown of {} failed: {}", instance.id, e.what());
            }
        }
    }

    instance.UpdateStatus(InstanceStatus::DESTROYED);
    registry_->Retire(instance);
    registry_->ReleaseInstanceLock(instance.id);

    json data = InstanceEventData(instance);
    data["reason"] = reason;
    Emit("instance.destroyed", data);
}

bool ChallengeManager::ExtendTimeout(const std::string& instance_id, long additional_seconds) {
    if (additional_seconds <= 0) {
        return false;
    }

    auto instance_lock = registry_->InstanceLock(instance_id);
    std::lock_guard<std::mutex> guard(*instance_lock);

    auto instance = registry_->Get(instance_id);
    if (!instance) {
        registry_->ReleaseInstanceLock(instance_id);
        return false;
    }
    if (!instance->IsActive()) {
        return false;
    }

    const auto extra = std::chrono::seconds(additional_seconds);
    instance->expires_at = instance->expires_at ? *instance->expires_at + extra : Clock::now() + extra;
    registry_->Put(*instance);

    spdlog::info("Extended instance {} by {}s (expires {})", instance_id, additional_seconds,
                 FormatTimestamp(*instance->expires_at));

    json data = InstanceEventData(*instance);
    data["expires_at"] = FormatTimestamp(*instance->expires_at);
    data["extended_by"] = additional_seconds;
    Emit("instance.extended", data);
    return true;
}

// ============================================================================
// HEALTH
// ============================================================================

bool ChallengeManager::UpdateHealthStatus(const std::string& instance_id, const HealthStatus& status) {
    auto instance_lock = registry_->InstanceLock(instance_id);
    std::lock_guard<std::mutex> guard(*instance_lock);

    auto instance = registry_->Get(instance_id);
    if (!instance) {
        registry_->ReleaseInstanceLock(instance_id);
        return false;
    }
    if (!instance->IsActive()) {
        return false;
    }

    instance->last_health_check = status.timestamp;
    instance->health_check_failures = status.healthy ? 0 : instance->health_check_failures + 1;
    registry_->Put(*instance);
    return true;
}

bool ChallengeManager::ApplyHealthTransition(const std::string& instance_id, InstanceStatus new_status,
                                             const HealthStatus& status) {
    if (new_status != InstanceStatus::HEALTHY && new_status != InstanceStatus::UNHEALTHY) {
        return false;
    }

    auto instance_lock = registry_->InstanceLock(instance_id);
    std::lock_guard<std::mutex> guard(*instance_lock);

    auto instance = registry_->Get(instance_id);
    if (!instance) {
        registry_->ReleaseInstanceLock(instance_id);
        return false;
    }
    if (!instance->IsActive() || instance->status == InstanceStatus::CREATING) {
        return false;
    }
    if (instance->status == new_status) {
        return true;
    }

    const InstanceStatus previous = instance->status;
    instance->UpdateStatus(new_status);
    registry_->Put(*instance);

    json data = InstanceEventData(*instance);
    data["health"] = status;

    if (new_status == InstanceStatus::UNHEALTHY) {
        spdlog::warn("Instance {} is unhealthy after {} failed checks", instance_id,
                     instance->health_check_failures);
        Emit("instance.health_degraded", data);
    } else if (previous == InstanceStatus::UNHEALTHY) {
        spdlog::info("Instance {} recovered", instance_id);
        Emit("instance.health_recovered", data);
    } else {
        spdlog::debug("Instance {} is healthy", instance_id);
    }
    return true;
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<ChallengeInstance> ChallengeManager::LoadTombstone(const std::string& instance_id) const {
    if (!cache_) {
        return std::nullopt;
    }
    try {
        auto raw = cache_->Get(InstanceRegistry::CacheKey(instance_id));
        if (!raw) {
            return std::nullopt;
        }
        return json::parse(*raw).get<ChallengeInstance>();
    } catch (const std::exception& e) {
        spdlog::warn("Unreadable cached record {}: {}", instance_id, e.what());
        return std::nullopt;
    }
}

std::optional<ChallengeInstance> ChallengeManager::GetStatus(const std::string& instance_id) const {
    if (auto instance = registry_->Get(instance_id)) {
        return instance;
    }
    auto tombstone = LoadTombstone(instance_id);
    if (tombstone && tombstone->IsTerminal()) {
        return tombstone;
    }
    return std::nullopt;
}

std::vector<ChallengeInstance> ChallengeManager::ListUserInstances(const std::string& user_id) const {
    return registry_->ListByUser(user_id);
}

std::vector<ChallengeInstance> ChallengeManager::ListActive() const {
    auto all = registry_->Snapshot();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [](const ChallengeInstance& i) { return !i.IsActive(); }),
              all.end());
    return all;
}

bool ChallengeManager::IsUsable(const std::string& instance_id) const {
    auto instance = registry_->Get(instance_id);
    return instance && instance->IsActive() && !instance->IsExpired();
}

std::optional<std::string> ChallengeManager::GetLogs(const std::string& instance_id, int tail_lines) {
    auto instance = registry_->Get(instance_id);
    if (!instance) {
        return std::nullopt;
    }
    auto provider = FindProvider(instance->sandbox_type);
    if (!provider) {
        return std::string();
    }
    try {
        return provider->GetLogs(*instance, tail_lines);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to fetch logs of {}: {}", instance_id, e.what());
        return std::string();
    }
}

std::optional<json> ChallengeManager::GetStats(const std::string& instance_id) {
    auto instance = registry_->Get(instance_id);
    if (!instance) {
        return std::nullopt;
    }
    auto provider = FindProvider(instance->sandbox_type);
    if (!provider) {
        return json::object();
    }
    try {
        return provider->GetStats(*instance);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to fetch stats of {}: {}", instance_id, e.what());
        return json::object();
    }
}

std::vector<SpawnRequest> ChallengeManager::PendingSpawnRequests() const {
    std::vector<SpawnRequest> requests;
    if (!cache_) {
        return requests;
    }
    for (const auto& raw : cache_->LRange(kSpawnQueueKey, 0, -1)) {
        try {
            requests.push_back(json::parse(raw).get<SpawnRequest>());
        } catch (const std::exception& e) {
            spdlog::warn("Skipping unreadable queued request: {}", e.what());
        }
    }
    return requests;
}

// ============================================================================
// BACKGROUND WORK
// ============================================================================

int ChallengeManager::RunCleanupCycle() {
    const auto now = Clock::now();
    int destroyed = 0;

    for (const auto& instance : registry_->Snapshot()) {
        if (instance.IsTerminal() || !instance.IsExpired(now)) {
            continue;
        }
        spdlog::info("Instance {} expired", instance.id);
        if (Destroy(instance.id)) {
            ++destroyed;
        }
    }

    if (destroyed > 0) {
        spdlog::info("Cleanup cycle destroyed {} expired instance(s)", destroyed);
    }
    return destroyed;
}

int ChallengeManager::RunZombieCycle() {
    int reaped = 0;

    for (const auto& instance : registry_->Snapshot()) {
        if (!instance.IsActive() || !instance.provider_instance_id) {
            continue;
        }
        auto provider = FindProvider(instance.sandbox_type);
        if (!provider) {
            continue;
        }

        bool exists = true;
        try {
            exists = provider->Exists(instance);
        } catch (const std::exception& e) {
            spdlog::warn("Existence check of {} failed, keeping it: {}", instance.id, e.what());
            continue;
        }
        if (exists) {
            continue;
        }

        health_->CancelCheck(instance.id);

        bool zombie = false;
        {
            auto instance_lock = registry_->InstanceLock(instance.id);
            std::lock_guard<std::mutex> guard(*instance_lock);

            // Re-read: the record may have been destroyed while Exists() ran
            auto current = registry_->Get(instance.id);
            if (!current) {
                registry_->ReleaseInstanceLock(instance.id);
            } else if (current->IsActive() &&
                       current->provider_instance_id == instance.provider_instance_id) {
                spdlog::warn("Zombie instance {}: backing {} resource is gone", instance.id, provider->Name());
                DestroyLocked(*current, false, "zombie");
                zombie = true;
            }
        }

        if (zombie) {
            health_->CancelCheck(instance.id);
            ++reaped;
        }
    }

    if (reaped > 0) {
        spdlog::info("Zombie cycle reaped {} instance(s)", reaped);
    }
    return reaped;
}

int ChallengeManager::Recover() {
    int tracked = 0;
    std::vector<std::string> interrupted;

    for (auto& instance : registry_->LoadPersisted()) {
        if (instance.IsTerminal() || registry_->Contains(instance.id)) {
            continue;
        }
        if (!FindProvider(instance.sandbox_type)) {
            spdlog::warn("Recovered instance {} has no provider ({}), dropping it",
                         instance.id, ToString(instance.sandbox_type));
            instance.UpdateStatus(InstanceStatus::ERROR);
            registry_->Retire(instance);
            continue;
        }

        registry_->Put(instance);
        if (instance.status == InstanceStatus::CREATING || instance.status == InstanceStatus::PENDING ||
            instance.status == InstanceStatus::DESTROYING) {
            interrupted.push_back(instance.id);
            continue;
        }

        ++tracked;
        if (instance.IsActive()) {
            health_->ScheduleCheck(instance);
        }
    }

    for (const auto& id : interrupted) {
        spdlog::warn("Instance {} was interrupted mid-operation, tearing it down", id);
        auto instance_lock = registry_->InstanceLock(id);
        std::lock_guard<std::mutex> guard(*instance_lock);
        if (auto instance = registry_->Get(id)) {
            DestroyLocked(*instance, true, "recovery");
        } else {
            registry_->ReleaseInstanceLock(id);
        }
    }

    spdlog::info("Recovered {} instance(s), tore down {}", tracked, interrupted.size());
    return tracked;
}

void ChallengeManager::RunLoop(std::chrono::seconds interval, const char* name,
                               const std::function<int()>& cycle) {
    spdlog::debug("{} loop started (every {}s)", name, interval.count());
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (!stopping_) {
        if (loop_cv_.wait_for(lock, interval, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        try {
            cycle();
        } catch (const std::exception& e) {
            spdlog::error("{} cycle failed: {}", name, e.what());
        }
        lock.lock();
    }
    spdlog::debug("{} loop stopped", name);
}

void ChallengeManager::StartBackgroundTasks() {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (!loops_.empty()) {
        return;
    }
    stopping_ = false;

    loops_.emplace_back([this] {
        RunLoop(config_.cleanup_interval, "Cleanup", [this] { return RunCleanupCycle(); });
    });
    loops_.emplace_back([this] {
        RunLoop(config_.zombie_check_interval, "Zombie reaper", [this] { return RunZombieCycle(); });
    });
    spdlog::info("Background tasks started");
}

void ChallengeManager::StopBackgroundTasks() {
    std::vector<std::thread> loops;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stopping_ = true;
        loops.swap(loops_);
    }
    loop_cv_.notify_all();

    for (auto& thread : loops) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ChallengeManager::Shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    spdlog::info("Shutting down ChallengeManager");

    StopBackgroundTasks();
    health_->CancelAll();

    std::vector<std::pair<std::string, std::future<bool>>> pending;
    for (const auto& instance : ListActive()) {
        const std::string id = instance.id;
        pending.emplace_back(id, std::async(std::launch::async, [this, id] { return Destroy(id); }));
    }

    int destroyed = 0;
    int failed = 0;
    for (auto& [id, future] : pending) {
        try {
            if (future.get()) {
                ++destroyed;
            } else {
                ++failed;
            }
        } catch (const std::exception& e) {
            spdlog::error("Shutdown teardown of {} failed: {}", id, e.what());
            ++failed;
        }
    }

    spdlog::info("Shutdown complete: {} destroyed, {} failed", destroyed, failed);
}

} // namespace core
} // namespace cerberus
