/**
 * @file test_health_checker.cpp
 * @brief Probe types, failure escalation and loop supervision
 */

#include <gtest/gtest.h>

#include "cerberus/health/health_checker.hpp"
#include "test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <thread>

using namespace cerberus;
using core::InstanceStatus;

namespace {

core::HealthStatus Result(bool healthy) {
    core::HealthStatus status;
    status.healthy = healthy;
    return status;
}

core::ChallengeInstance RunningInstance(const std::string& id) {
    core::ChallengeInstance instance;
    instance.id = id;
    instance.status = InstanceStatus::RUNNING;
    return instance;
}

/**
 * @class LocalServer
 * @brief Loopback listener answering each connection with a fixed HTTP response
 */
class LocalServer {
public:
    explicit LocalServer(std::string response) : response_(std::move(response)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { Serve(); });
    }

    ~LocalServer() {
        stop_ = true;
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        thread_.join();
    }

    int Port() const { return port_; }

private:
    void Serve() {
        while (!stop_) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            char buffer[2048];
            (void)::recv(client, buffer, sizeof(buffer), 0);
            (void)::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
            ::close(client);
        }
    }

    std::string response_;
    int fd_{-1};
    int port_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // anonymous namespace

TEST(HealthCheckerTest, EscalatesAfterThresholdOnce) {
    core::HealthConfig config;
    config.failure_threshold = 3;
    health::HealthChecker checker(config);

    std::vector<InstanceStatus> transitions;
    int observed = 0;
    checker.AddStatusCallback([&](const std::string&, InstanceStatus status, const core::HealthStatus&) {
        transitions.push_back(status);
    });
    checker.AddResultObserver([&](const std::string&, const core::HealthStatus&) { ++observed; });
    checker.ScheduleCheck(RunningInstance("i-1"));

    checker.RecordResult("i-1", Result(false));
    checker.RecordResult("i-1", Result(false));
    EXPECT_TRUE(transitions.empty());
    EXPECT_EQ(checker.ConsecutiveFailures("i-1"), 2);

    checker.RecordResult("i-1", Result(false));
    checker.RecordResult("i-1", Result(false));
    EXPECT_EQ(transitions, (std::vector<InstanceStatus>{InstanceStatus::UNHEALTHY}));

    checker.RecordResult("i-1", Result(true));
    EXPECT_EQ(checker.ConsecutiveFailures("i-1"), 0);
    EXPECT_EQ(transitions, (std::vector<InstanceStatus>{InstanceStatus::UNHEALTHY, InstanceStatus::HEALTHY}));

    checker.RecordResult("i-1", Result(true));
    EXPECT_EQ(transitions.size(), 2u);
    EXPECT_EQ(observed, 6);
}

TEST(HealthCheckerTest, FirstSuccessReportsHealthy) {
    health::HealthChecker checker;
    int healthy = 0;
    checker.AddStatusCallback([&](const std::string&, InstanceStatus status, const core::HealthStatus&) {
        healthy += status == InstanceStatus::HEALTHY ? 1 : 0;
    });
    checker.ScheduleCheck(RunningInstance("i-2"));

    checker.RecordResult("i-2", Result(true));
    checker.RecordResult("i-2", Result(true));
    EXPECT_EQ(healthy, 1);
}

TEST(HealthCheckerTest, CallbackExceptionsAreContained) {
    health::HealthChecker checker;
    bool second_called = false;
    checker.AddStatusCallback([](const std::string&, InstanceStatus, const core::HealthStatus&) {
        throw std::runtime_error("boom");
    });
    checker.AddStatusCallback([&](const std::string&, InstanceStatus, const core::HealthStatus&) {
        second_called = true;
    });
    checker.ScheduleCheck(RunningInstance("i-3"));

    EXPECT_NO_THROW(checker.RecordResult("i-3", Result(true)));
    EXPECT_TRUE(second_called);
}

TEST(HealthCheckerTest, ResultsAfterCancelAreDropped) {
    health::HealthChecker checker;
    int observed = 0;
    int transitions = 0;
    checker.AddResultObserver([&](const std::string&, const core::HealthStatus&) { ++observed; });
    checker.AddStatusCallback([&](const std::string&, InstanceStatus, const core::HealthStatus&) {
        ++transitions;
    });

    checker.ScheduleCheck(RunningInstance("i-10"));
    checker.RecordResult("i-10", Result(false));
    checker.CancelCheck("i-10");

    checker.RecordResult("i-10", Result(false));
    checker.RecordResult("i-10", Result(true));
    EXPECT_EQ(observed, 1);
    EXPECT_EQ(transitions, 0);
    EXPECT_EQ(checker.ConsecutiveFailures("i-10"), 0);
    EXPECT_EQ(checker.ScheduledCount(), 0u);

    checker.RecordResult("never-scheduled", Result(true));
    EXPECT_EQ(observed, 1);
}

TEST(HealthCheckerTest, MissingTargetsCountAsHealthy) {
    health::HealthChecker checker;
    auto instance = RunningInstance("i-4");

    EXPECT_TRUE(checker.CheckOnce(instance).healthy);

    instance.provider_metadata = {{"health_check_type", "tcp"}};
    EXPECT_TRUE(checker.CheckOnce(instance).healthy);

    instance.provider_metadata = {{"health_check_type", "command"}};
    EXPECT_TRUE(checker.CheckOnce(instance).healthy);
}

TEST(HealthCheckerTest, InvalidConfigurationIsUnhealthy) {
    health::HealthChecker checker;
    auto instance = RunningInstance("i-5");
    instance.provider_metadata = {{"health_check_type", "icmp"}};

    auto status = checker.CheckOnce(instance);
    EXPECT_FALSE(status.healthy);
    EXPECT_EQ(status.checks.at("config"), false);
}

TEST(HealthCheckerTest, CommandProbeUsesExecutor) {
    health::HealthChecker checker;
    auto instance = RunningInstance("i-6");
    instance.provider_metadata = {{"health_check_type", "command"},
                                  {"health_check_command", {"test", "-f", "/ready"}}};

    EXPECT_FALSE(checker.CheckOnce(instance).healthy);

    std::vector<std::string> seen;
    int exit_code = 0;
    checker.SetCommandExecutor([&](const core::ChallengeInstance&, const std::vector<std::string>& command) {
        seen = command;
        providers::ExecResult result;
        result.exit_code = exit_code;
        return result;
    });

    EXPECT_TRUE(checker.CheckOnce(instance).healthy);
    EXPECT_EQ(seen, (std::vector<std::string>{"test", "-f", "/ready"}));

    exit_code = 1;
    auto failed = checker.CheckOnce(instance);
    EXPECT_FALSE(failed.healthy);
    EXPECT_EQ(failed.metrics["exit_code"], 1);
}

TEST(HealthCheckerTest, TcpProbe) {
    health::HealthChecker checker;
    LocalServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

    auto instance = RunningInstance("i-7");
    instance.network.internal_ip = "127.0.0.1";
    instance.provider_metadata = {{"health_check_type", "tcp"}, {"health_check_port", server.Port()}};
    EXPECT_TRUE(checker.CheckOnce(instance).healthy);
}

TEST(HealthCheckerTest, HttpProbeComparesStatus) {
    core::HealthConfig config;
    config.probe_timeout = std::chrono::seconds(2);
    health::HealthChecker checker(config);
    LocalServer server("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");

    auto instance = RunningInstance("i-8");
    instance.access_url = "http://127.0.0.1:" + std::to_string(server.Port()) + "/";

    auto down = checker.CheckOnce(instance);
    EXPECT_FALSE(down.healthy);
    EXPECT_EQ(down.metrics["status_code"], 503);

    instance.provider_metadata = {{"health_check_status", 503}};
    EXPECT_TRUE(checker.CheckOnce(instance).healthy);
}

TEST(HealthCheckerTest, LoopEndsWhenInstanceDisappears) {
    core::HealthConfig config;
    config.check_interval = std::chrono::seconds(1);
    health::HealthChecker checker(config);

    std::mutex mutex;
    std::optional<core::ChallengeInstance> current = RunningInstance("i-9");
    checker.SetInstanceLookup([&](const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    });

    std::atomic<int> healthy{0};
    checker.AddStatusCallback([&](const std::string&, InstanceStatus status, const core::HealthStatus&) {
        if (status == InstanceStatus::HEALTHY) {
            ++healthy;
        }
    });

    checker.ScheduleCheck(*current);
    EXPECT_EQ(checker.ScheduledCount(), 1u);

    for (int i = 0; i < 60 && healthy == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_EQ(healthy.load(), 1);

    {
        std::lock_guard<std::mutex> lock(mutex);
        current.reset();
    }
    for (int i = 0; i < 60 && checker.ScheduledCount() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_EQ(checker.ScheduledCount(), 0u);
}

TEST(HealthCheckerTest, CancelStopsLoop) {
    health::HealthChecker checker;
    checker.ScheduleCheck(RunningInstance("a"));
    checker.ScheduleCheck(RunningInstance("b"));
    checker.ScheduleCheck(RunningInstance("b"));
    EXPECT_EQ(checker.ScheduledCount(), 2u);

    checker.CancelCheck("a");
    EXPECT_EQ(checker.ScheduledCount(), 1u);
    checker.CancelAll();
    EXPECT_EQ(checker.ScheduledCount(), 0u);
}
