/**
 * @file main.cpp
 * @brief Cerberus Challenge Instance Orchestrator - Command-line interface
 *
 * Loads the orchestrator configuration, wires the sandbox providers, the
 * durable cache and the ChallengeManager together, then serves the JSON-lines
 * control protocol on stdin/stdout until EOF, SIGINT or SIGTERM. Logs go to
 * stderr so that stdout carries protocol responses only.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "cerberus/cli/command_handler.hpp"
#include "cerberus/core/challenge_manager.hpp"
#include "cerberus/core/config.hpp"
#include "cerberus/core/errors.hpp"
#include "cerberus/core/event_sink.hpp"
#include "cerberus/providers/provider_factory.hpp"
#include "cerberus/storage/file_cache.hpp"
#include "cerberus/storage/memory_cache.hpp"
#include "cerberus/utils/command_runner.hpp"

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void HandleSignal(int) {
    g_shutdown_requested = 1;
}

/// Without SA_RESTART a pending read on stdin fails with EINTR, ending the loop
void InstallSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

void ConfigureLogging(const std::string& level, bool verbose) {
    auto logger = spdlog::stderr_color_mt("cerberus");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::from_str(level));
    }
}

std::shared_ptr<cerberus::storage::KeyValueCache> OpenCache(const std::string& state_file) {
    if (state_file.empty()) {
        spdlog::warn("No state file configured; instance records will not survive a restart");
        return std::make_shared<cerberus::storage::MemoryCache>();
    }
    auto parent = std::filesystem::path(state_file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    spdlog::info("State file: {}", state_file);
    return std::make_shared<cerberus::storage::FileCache>(state_file);
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Cerberus Challenge Instance Orchestrator"};
    app.footer("\nReads JSON-lines commands on stdin and answers one JSON object per line.");

    std::string config_path;
    std::string state_file;
    std::string log_level;
    std::vector<std::string> providers;
    int max_instances = 0;
    bool verbose = false;
    bool print_config = false;
    bool no_recover = false;
    bool keep_instances = false;

    app.add_option("-c,--config", config_path, "Path to orchestrator JSON configuration")
        ->check(CLI::ExistingFile);
    app.add_option("--state-file", state_file, "Durable state snapshot (overrides config)");
    app.add_option("--providers", providers, "Enabled providers (container, microvm, cloud_aws, cloud_gcp)")
        ->delimiter(',');
    app.add_option("--max-instances", max_instances, "Maximum active instances per user");
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--print-config", print_config, "Print the effective configuration and exit");
    app.add_flag("--no-recover", no_recover, "Do not reload persisted instances at startup");
    app.add_flag("--keep-instances", keep_instances, "Leave instances running on shutdown");

    CLI11_PARSE(app, argc, argv);

    try {
        auto config = config_path.empty() ? cerberus::core::OrchestratorConfig{}
                                          : cerberus::core::LoadConfig(config_path);
        cerberus::core::ApplyEnvironmentOverrides(config);

        if (!state_file.empty()) {
            config.state_file = state_file;
        }
        if (!providers.empty()) {
            config.enabled_providers = providers;
        }
        if (max_instances > 0) {
            config.max_instances_per_user = max_instances;
        }
        if (!log_level.empty()) {
            config.log_level = log_level;
        }
        cerberus::core::ValidateConfig(config);

        if (print_config) {
            std::cout << cerberus::core::ConfigToJson(config).dump(2) << std::endl;
            return 0;
        }

        ConfigureLogging(config.log_level, verbose);
        InstallSignalHandlers();

        spdlog::info("[INIT] Starting Cerberus orchestrator");

        auto runner = std::make_shared<cerberus::utils::ProcessRunner>();
        auto cache = OpenCache(config.state_file);
        auto events = std::make_shared<cerberus::core::CacheEventPublisher>(cache);
        auto table = cerberus::providers::BuildProviders(config, runner);

        cerberus::core::ChallengeManager manager(config, std::move(table), cache, events);
        if (!no_recover) {
            manager.Recover();
        }
        manager.StartBackgroundTasks();

        cerberus::cli::CommandHandler handler(manager);

        spdlog::info("[READY] Accepting commands on stdin");

        std::string line;
        while (!g_shutdown_requested && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            std::cout << handler.HandleLine(line) << std::endl;
        }

        if (g_shutdown_requested) {
            spdlog::info("[STOP] Signal received");
        } else {
            spdlog::info("[STOP] End of input");
        }

        if (keep_instances) {
            manager.StopBackgroundTasks();
            manager.GetHealthChecker().CancelAll();
            spdlog::info("Leaving {} instance(s) running", manager.ListActive().size());
        } else {
            manager.Shutdown();
        }
        return 0;

    } catch (const cerberus::core::ConfigError& e) {
        spdlog::error("[ERROR] Configuration error: {}", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
