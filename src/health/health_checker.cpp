/**
 * @file health_checker.cpp
 * @brief Health probe loops and failure escalation
 *
 * @date 2025
 */

#include "cerberus/health/health_checker.hpp"
#include "cerberus/providers/provider_specs.hpp"
#include "cerberus/utils/net_utils.hpp"

#include <spdlog/spdlog.h>

namespace cerberus {
namespace health {

namespace {

long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

core::HealthStatus Healthy(const std::string& check, const std::string& message) {
    core::HealthStatus status;
    status.healthy = true;
    status.checks[check] = true;
    status.message = message;
    return status;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION / REGISTRATION
// ============================================================================

HealthChecker::HealthChecker(core::HealthConfig config)
    : config_(config) {
    spdlog::debug("Health checker: interval {}s, timeout {}s, threshold {}",
                  config_.check_interval.count(), config_.probe_timeout.count(), config_.failure_threshold);
}

HealthChecker::~HealthChecker() {
    CancelAll();

    // Loops cancelled from their own thread were detached; wait for them to leave
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return running_loops_ == 0; });
}

void HealthChecker::SetInstanceLookup(InstanceLookup lookup) {
    std::lock_guard<std::mutex> lock(mutex_);
    lookup_ = std::move(lookup);
}

void HealthChecker::SetCommandExecutor(CommandExecutor executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    executor_ = std::move(executor);
}

void HealthChecker::AddStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callbacks_.push_back(std::move(callback));
}

void HealthChecker::AddResultObserver(ResultObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_observers_.push_back(std::move(observer));
}

// ============================================================================
// SCHEDULING
// ============================================================================

void HealthChecker::ScheduleCheck(const core::ChallengeInstance& instance) {
    CancelCheck(instance.id);

    auto task = std::make_shared<ProbeTask>();

    std::lock_guard<std::mutex> lock(mutex_);
    Tracking tracking;
    tracking.consecutive_failures = instance.health_check_failures;
    if (instance.status == core::InstanceStatus::HEALTHY || instance.status == core::InstanceStatus::UNHEALTHY) {
        tracking.reported = instance.status;
    }
    tracking_[instance.id] = tracking;

    ++running_loops_;
    task->thread = std::thread(&HealthChecker::RunLoop, this, instance, task);
    tasks_[instance.id] = task;

    spdlog::debug("Health check scheduled for {}", instance.id);
}

void HealthChecker::RunLoop(core::ChallengeInstance snapshot, std::shared_ptr<ProbeTask> task) {
    const std::string instance_id = snapshot.id;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(task->mutex);
            if (task->cv.wait_for(lock, config_.check_interval, [&task] { return task->stop; })) {
                break;
            }
        }

        InstanceLookup lookup;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lookup = lookup_;
        }

        std::optional<core::ChallengeInstance> current;
        try {
            current = lookup ? lookup(instance_id) : std::optional<core::ChallengeInstance>(snapshot);
        } catch (const std::exception& e) {
            spdlog::error("Health check lookup for {} failed: {}", instance_id, e.what());
            continue;
        }

        if (!current || !current->IsActive()) {
            spdlog::debug("Health check loop for {} ends: instance no longer active", instance_id);
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tasks_.find(instance_id);
            if (it != tasks_.end() && it->second == task) {
                tasks_.erase(it);
                tracking_.erase(instance_id);
                task->thread.detach();
            }
            break;
        }

        auto status = CheckOnce(*current);

        {
            std::lock_guard<std::mutex> lock(task->mutex);
            if (task->stop) {
                break;
            }
        }
        RecordResult(instance_id, status);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --running_loops_;
    idle_cv_.notify_all();
}

void HealthChecker::StopTask(const std::shared_ptr<ProbeTask>& task) {
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->stop = true;
    }
    task->cv.notify_all();

    if (task->thread.joinable()) {
        if (task->thread.get_id() == std::this_thread::get_id()) {
            task->thread.detach();
        } else {
            task->thread.join();
        }
    }
}

void HealthChecker::CancelCheck(const std::string& instance_id) {
    std::shared_ptr<ProbeTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(instance_id);
        if (it != tasks_.end()) {
            task = it->second;
            tasks_.erase(it);
        }
        tracking_.erase(instance_id);
    }

    if (task) {
        StopTask(task);
        spdlog::debug("Health check cancelled for {}", instance_id);
    }
}

void HealthChecker::CancelAll() {
    std::map<std::string, std::shared_ptr<ProbeTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
        tracking_.clear();
    }

    for (auto& [id, task] : tasks) {
        StopTask(task);
    }
    if (!tasks.empty()) {
        spdlog::info("Cancelled {} health check(s)", tasks.size());
    }
}

std::size_t HealthChecker::ScheduledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

int HealthChecker::ConsecutiveFailures(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracking_.find(instance_id);
    return it == tracking_.end() ? 0 : it->second.consecutive_failures;
}

// ============================================================================
// PROBES
// ============================================================================

core::HealthStatus HealthChecker::CheckOnce(const core::ChallengeInstance& instance) {
    providers::HealthCheckSpec spec;
    try {
        spec = providers::ParseHealthCheckSpec(instance.provider_metadata);
    } catch (const std::exception& e) {
        core::HealthStatus status;
        status.healthy = false;
        status.checks["config"] = false;
        status.message = std::string("Invalid health check configuration: ") + e.what();
        return status;
    }

    try {
        switch (spec.type) {
            case providers::HealthCheckType::TCP:
                return ProbeTcp(instance, spec.port);
            case providers::HealthCheckType::COMMAND:
                return ProbeCommand(instance, spec.command);
            case providers::HealthCheckType::HTTP:
            default: {
                std::string url;
                if (spec.url) {
                    url = *spec.url;
                } else if (instance.access_url) {
                    url = *instance.access_url;
                    while (!url.empty() && url.back() == '/') {
                        url.pop_back();
                    }
                    url += "/health";
                }
                if (url.empty()) {
                    return Healthy("http", "No health check URL");
                }
                return ProbeHttp(instance, url, spec.expected_status);
            }
        }
    } catch (const std::exception& e) {
        core::HealthStatus status;
        status.healthy = false;
        status.message = std::string("Health probe error: ") + e.what();
        return status;
    }
}

core::HealthStatus HealthChecker::ProbeHttp(const core::ChallengeInstance& instance, const std::string& url,
                                            int expected) {
    core::HealthStatus status;
    const auto start = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.probe_timeout);

    try {
        auto response = utils::NetUtils::HttpRequest("GET", url, "", timeout);
        status.healthy = response.status_code == expected;
        status.checks["http"] = status.healthy;
        status.metrics["status_code"] = response.status_code;
        status.metrics["response_time_ms"] = ElapsedMs(start);
        if (!status.healthy) {
            status.message = "Unexpected status " + std::to_string(response.status_code) +
                             " (expected " + std::to_string(expected) + ")";
        }
    } catch (const utils::NetworkError& e) {
        status.healthy = false;
        status.checks["http"] = false;
        status.message = std::string("HTTP probe failed: ") + e.what();
    }

    spdlog::debug("HTTP probe {} for {}: {}", url, instance.id, status.healthy ? "ok" : "failed");
    return status;
}

core::HealthStatus HealthChecker::ProbeTcp(const core::ChallengeInstance& instance, int port) {
    const auto& host = instance.network.external_ip ? instance.network.external_ip
                                                    : instance.network.internal_ip;
    if (!host || host->empty()) {
        return Healthy("tcp", "No address to probe");
    }

    core::HealthStatus status;
    const auto start = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.probe_timeout);

    status.healthy = utils::NetUtils::TcpProbe(*host, port, timeout);
    status.checks["tcp"] = status.healthy;
    status.metrics["connect_time_ms"] = ElapsedMs(start);
    if (!status.healthy) {
        status.message = "TCP connect to " + *host + ":" + std::to_string(port) + " failed";
    }
    return status;
}

core::HealthStatus HealthChecker::ProbeCommand(const core::ChallengeInstance& instance,
                                               const std::optional<std::vector<std::string>>& command) {
    if (!command || command->empty()) {
        return Healthy("command", "No health check command");
    }

    CommandExecutor executor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        executor = executor_;
    }

    core::HealthStatus status;
    status.checks["command"] = false;
    if (!executor) {
        status.message = "No command executor registered";
        return status;
    }

    auto result = executor(instance, *command);
    status.healthy = result.exit_code == 0 && !result.error;
    status.checks["command"] = status.healthy;
    status.metrics["exit_code"] = result.exit_code;
    if (!status.healthy) {
        status.message = result.error.value_or("Command exited with " + std::to_string(result.exit_code));
    }
    return status;
}

// ============================================================================
// ESCALATION
// ============================================================================

void HealthChecker::RecordResult(const std::string& instance_id, const core::HealthStatus& status) {
    std::optional<core::InstanceStatus> transition;
    std::vector<StatusCallback> callbacks;
    std::vector<ResultObserver> observers;
    int failures = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tracking_.find(instance_id);
        if (it == tracking_.end()) {
            // Cancelled while the probe was in flight
            spdlog::debug("Dropping health result for untracked instance {}", instance_id);
            return;
        }
        auto& tracking = it->second;

        if (status.healthy) {
            tracking.consecutive_failures = 0;
            if (tracking.reported != core::InstanceStatus::HEALTHY) {
                tracking.reported = core::InstanceStatus::HEALTHY;
                transition = core::InstanceStatus::HEALTHY;
            }
        } else {
            ++tracking.consecutive_failures;
            if (tracking.consecutive_failures >= config_.failure_threshold &&
                tracking.reported != core::InstanceStatus::UNHEALTHY) {
                tracking.reported = core::InstanceStatus::UNHEALTHY;
                transition = core::InstanceStatus::UNHEALTHY;
            }
        }
        failures = tracking.consecutive_failures;
        callbacks = status_callbacks_;
        observers = result_observers_;
    }

    if (!status.healthy) {
        spdlog::debug("Health check failed for {} ({} consecutive): {}",
                      instance_id, failures, status.message.value_or(""));
    }

    for (const auto& observer : observers) {
        try {
            observer(instance_id, status);
        } catch (const std::exception& e) {
            spdlog::error("Health result observer failed for {}: {}", instance_id, e.what());
        }
    }

    if (!transition) {
        return;
    }

    if (*transition == core::InstanceStatus::UNHEALTHY) {
        spdlog::warn("Instance {} is unhealthy after {} consecutive failures", instance_id, failures);
    } else {
        spdlog::info("Instance {} is healthy", instance_id);
    }

    for (const auto& callback : callbacks) {
        try {
            callback(instance_id, *transition, status);
        } catch (const std::exception& e) {
            spdlog::error("Health status callback failed for {}: {}", instance_id, e.what());
        }
    }
}

} // namespace health
} // namespace cerberus
