/**
 * @file cloud_provider.cpp
 * @brief Terraform workspace lifecycle
 *
 * **Spawn Workflow**:
 * ```
 * write main.tf.json + backend.tf.json
 *   → terraform init -input=false
 *   → terraform apply -input=false -auto-approve
 *   → terraform output -json
 * ```
 *
 * A failed spawn runs a best-effort `terraform destroy` before the workspace
 * is deleted, so partially applied resources are not leaked.
 *
 * @date 2025
 */

#include "cerberus/providers/cloud_provider.hpp"
#include "cerberus/core/errors.hpp"
#include "cerberus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace cerberus {
namespace providers {

using utils::StringUtils;

namespace {

constexpr const char* kApplyLog = "apply.log";

std::chrono::milliseconds ToMillis(std::chrono::seconds s) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(s);
}

/// Output values may be numbers or lists; connection fields are strings
std::optional<std::string> OutputString(const json& outputs, const char* key) {
    auto it = outputs.find(key);
    if (it == outputs.end() || it->is_null()) {
        return std::nullopt;
    }
    std::string value = it->is_string() ? it->get<std::string>() : it->dump();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool IsThrottled(const std::string& text) {
    return StringUtils::ContainsIgnoreCase(text, "RequestLimitExceeded") ||
           StringUtils::ContainsIgnoreCase(text, "Throttling") ||
           StringUtils::ContainsIgnoreCase(text, "rateLimitExceeded");
}

bool IsCapacityError(const std::string& text) {
    for (const char* marker : {"quota", "LimitExceeded", "InsufficientInstanceCapacity",
                               "ZONE_RESOURCE_POOL_EXHAUSTED", "RESOURCE_EXHAUSTED",
                               "InsufficientFreeAddressesInSubnet"}) {
        if (StringUtils::ContainsIgnoreCase(text, marker)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / NAMING
// ============================================================================

CloudProvider::CloudProvider(CloudKind kind, core::CloudProviderConfig config,
                             std::shared_ptr<utils::CommandRunner> runner)
    : kind_(kind), config_(std::move(config)), runner_(std::move(runner)) {
    spdlog::debug("Cloud provider {}: modules {}, state {}", CloudName(), config_.modules_dir, config_.state_dir);
}

std::string CloudProvider::Name() const {
    return "cloud_" + CloudName();
}

std::string CloudProvider::CloudName() const {
    return kind_ == CloudKind::AWS ? "aws" : "gcp";
}

fs::path CloudProvider::WorkspaceDir(const std::string& instance_id) const {
    return fs::path(config_.state_dir) / (CloudName() + "-" + instance_id);
}

utils::CommandResult CloudProvider::RunTerraform(const fs::path& workspace,
                                                 const std::vector<std::string>& args,
                                                 std::chrono::milliseconds timeout) {
    utils::CommandSpec spec;
    spec.argv.push_back(config_.terraform_binary);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.working_directory = workspace.string();
    spec.env = {{"TF_IN_AUTOMATION", "1"}, {"TF_INPUT", "0"}};
    spec.timeout = timeout;

    spdlog::debug("Running terraform in {}: {}", workspace.string(), StringUtils::Join(args, " "));
    return runner_->Run(spec);
}

// ============================================================================
// CONFIGURATION GENERATION
// ============================================================================

json CloudProvider::BuildMainConfig(const core::ChallengeInstance& instance, const CloudSpec& spec) const {
    json module = spec.module_vars;
    module["source"] = (fs::path(config_.modules_dir) / CloudName() / spec.module).string();
    module["instance_id"] = instance.id;
    module["user_id"] = instance.user_id;
    module["team_id"] = instance.team_id.value_or("");
    module["canary_token"] = instance.canary_token.value_or("");

    json config;
    config["module"] = {{"challenge", module}};

    if (kind_ == CloudKind::AWS) {
        config["terraform"] = {{"required_providers", {{"aws", {{"source", "hashicorp/aws"}}}}}};
        config["provider"] = {{"aws", {{"region", config_.aws_region}}}};
    } else {
        json google = {{"region", config_.gcp_region}};
        if (!config_.gcp_project.empty()) {
            google["project"] = config_.gcp_project;
        }
        config["terraform"] = {{"required_providers", {{"google", {{"source", "hashicorp/google"}}}}}};
        config["provider"] = {{"google", google}};
    }
    return config;
}

void CloudProvider::WriteWorkspace(const fs::path& workspace, const core::ChallengeInstance& instance,
                                   const CloudSpec& spec) const {
    std::error_code ec;
    fs::create_directories(workspace, ec);
    if (ec) {
        throw core::ProviderError("Cannot create terraform workspace " + workspace.string() + ": " +
                                  ec.message(), false);
    }

    const json backend = {
        {"terraform", {{"backend", {{"local", {{"path", (workspace / "terraform.tfstate").string()}}}}}}}};

    auto write_file = [&workspace](const char* name, const json& content) {
        std::ofstream out(workspace / name, std::ios::trunc);
        if (!out) {
            throw core::ProviderError(std::string("Cannot write ") + name, false);
        }
        out << content.dump(2) << '\n';
    };
    write_file("main.tf.json", BuildMainConfig(instance, spec));
    write_file("backend.tf.json", backend);
}

json CloudProvider::FlattenOutputs(const json& outputs) {
    json flat = json::object();
    if (!outputs.is_object()) {
        return flat;
    }
    for (auto it = outputs.begin(); it != outputs.end(); ++it) {
        if (it.value().is_object() && it.value().contains("value")) {
            flat[it.key()] = it.value()["value"];
        } else {
            flat[it.key()] = it.value();
        }
    }
    return flat;
}

void CloudProvider::ApplyOutputs(core::ChallengeInstance& instance, const json& outputs,
                                 const fs::path& workspace) const {
    instance.provider_instance_id = OutputString(outputs, "instance_id")
                                        .value_or(workspace.filename().string());
    instance.network.external_ip = OutputString(outputs, "public_ip");
    instance.network.internal_ip = OutputString(outputs, "private_ip");
    instance.access_url = OutputString(outputs, "access_url");
    instance.connection_string = OutputString(outputs, "connection_string");
    instance.provider_metadata["terraform_outputs"] = outputs;
}

// ============================================================================
// SPAWN
// ============================================================================

core::SpawnResult CloudProvider::Spawn(core::ChallengeInstance& instance, Deadline deadline) {
    const std::string default_module =
        kind_ == CloudKind::AWS ? config_.aws_default_module : config_.gcp_default_module;
    const CloudSpec spec = ParseCloudSpec(instance.provider_metadata, default_module);

    const fs::path module_dir = fs::path(config_.modules_dir) / CloudName() / spec.module;
    if (!fs::is_directory(module_dir)) {
        return core::SpawnResult::Failure(core::ErrorKind::PROVIDER,
                                          "Terraform module not found: " + module_dir.string(), false);
    }

    const fs::path workspace = WorkspaceDir(instance.id);
    spdlog::info("Provisioning {} module '{}' for instance {}", CloudName(), spec.module, instance.id);

    try {
        WriteWorkspace(workspace, instance, spec);

        auto init = RunTerraform(workspace, {"init", "-input=false", "-no-color"},
                                 RemainingBudget(deadline, ToMillis(config_.init_timeout)));
        if (!init.Ok()) {
            RaiseFailure(init, "init", deadline);
        }

        auto apply = RunTerraform(workspace, {"apply", "-input=false", "-auto-approve", "-no-color"},
                                  RemainingBudget(deadline, ToMillis(config_.apply_timeout)));
        {
            std::ofstream log(workspace / kApplyLog, std::ios::trunc);
            log << apply.stdout_text << apply.stderr_text;
        }
        if (!apply.Ok()) {
            RaiseFailure(apply, "apply", deadline);
        }

        auto output = RunTerraform(workspace, {"output", "-json"},
                                   RemainingBudget(deadline, ToMillis(config_.output_timeout)));
        if (!output.Ok()) {
            RaiseFailure(output, "output", deadline);
        }

        json outputs;
        try {
            outputs = FlattenOutputs(json::parse(output.stdout_text));
        } catch (const json::exception& e) {
            throw core::ProviderError(std::string("Unparseable terraform output: ") + e.what(), false);
        }
        ApplyOutputs(instance, outputs, workspace);

    } catch (const core::ProviderError& e) {
        spdlog::error("Cloud spawn failed for {}: {}", instance.id, e.what());
        DestroyWorkspace(workspace);
        instance.provider_instance_id.reset();
        return core::SpawnResult::Failure(core::ErrorKind::PROVIDER, e.what(), e.IsRetryable());
    } catch (const std::exception& e) {
        spdlog::error("Cloud spawn failed for {}: {}", instance.id, e.what());
        DestroyWorkspace(workspace);
        instance.provider_instance_id.reset();
        throw;
    }

    spdlog::info("Cloud instance {} provisioned ({})", instance.id,
                 instance.network.external_ip.value_or("no public ip"));
    return core::SpawnResult::Success(instance);
}

void CloudProvider::RaiseFailure(const utils::CommandResult& result, const std::string& action,
                                 Deadline deadline) const {
    if (result.timed_out) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw core::SpawnTimeoutError("terraform " + action + " exceeded the spawn deadline");
        }
        throw core::ProviderError("terraform " + action + " timed out", true);
    }

    const std::string text = StringUtils::TailLines(result.ErrorText(), 20);
    const std::string message = "Terraform " + action + " failed: " + text;

    if (IsThrottled(text)) {
        throw core::ProviderError(message, true);
    }
    if (IsCapacityError(text)) {
        throw core::ResourceExhaustedError(message);
    }
    // init mostly fails on registry/network hiccups
    throw core::ProviderError(message, action == "init" || result.spawn_failed);
}

// ============================================================================
// DESTROY / EXISTS
// ============================================================================

bool CloudProvider::DestroyWorkspace(const fs::path& workspace) {
    if (!fs::exists(workspace)) {
        return true;
    }

    // Nothing was ever applied if init never ran
    if (fs::exists(workspace / ".terraform") || fs::exists(workspace / "terraform.tfstate")) {
        auto destroyed = RunTerraform(workspace, {"destroy", "-input=false", "-auto-approve", "-no-color"},
                                      ToMillis(config_.destroy_timeout));
        if (!destroyed.Ok()) {
            spdlog::error("terraform destroy failed in {}: {}", workspace.string(),
                          StringUtils::TailLines(destroyed.ErrorText(), 20));
            return false;
        }
    }

    std::error_code ec;
    fs::remove_all(workspace, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", workspace.string(), ec.message());
    }
    return true;
}

bool CloudProvider::Destroy(const core::ChallengeInstance& instance) {
    try {
        const fs::path workspace = WorkspaceDir(instance.id);
        if (!fs::exists(workspace)) {
            spdlog::debug("No terraform workspace for {}", instance.id);
            return true;
        }
        bool destroyed = DestroyWorkspace(workspace);
        if (destroyed) {
            spdlog::info("Cloud infrastructure for {} destroyed", instance.id);
        }
        return destroyed;
    } catch (const std::exception& e) {
        spdlog::error("Cloud destroy failed for {}: {}", instance.id, e.what());
        return false;
    }
}

bool CloudProvider::Exists(const core::ChallengeInstance& instance) {
    const fs::path workspace = WorkspaceDir(instance.id);
    if (!fs::exists(workspace / "terraform.tfstate")) {
        return false;
    }

    auto result = RunTerraform(workspace, {"state", "list"}, ToMillis(config_.output_timeout));
    if (!result.Ok()) {
        throw core::ProviderError("terraform state list failed: " + result.ErrorText(), true);
    }
    return !StringUtils::Trim(result.stdout_text).empty();
}

// ============================================================================
// QUERIES
// ============================================================================

std::string CloudProvider::GetLogs(const core::ChallengeInstance& instance, int tail_lines) {
    std::ifstream log(WorkspaceDir(instance.id) / kApplyLog);
    if (!log) {
        return "";
    }
    std::stringstream buffer;
    buffer << log.rdbuf();
    return StringUtils::TailLines(buffer.str(), tail_lines);
}

ExecResult CloudProvider::ExecCommand(const core::ChallengeInstance&, const std::vector<std::string>&) {
    ExecResult exec;
    exec.error = "Command execution is not supported for cloud instances";
    return exec;
}

json CloudProvider::GetStats(const core::ChallengeInstance& instance) {
    const fs::path workspace = WorkspaceDir(instance.id);
    if (!fs::exists(workspace / "terraform.tfstate")) {
        return json::object();
    }

    json stats = json::object();
    auto state = RunTerraform(workspace, {"state", "list"}, ToMillis(config_.output_timeout));
    if (state.Ok()) {
        stats["resource_count"] = StringUtils::SplitLines(state.stdout_text).size();
    }

    auto output = RunTerraform(workspace, {"output", "-json"}, ToMillis(config_.output_timeout));
    if (output.Ok()) {
        try {
            stats["outputs"] = FlattenOutputs(json::parse(output.stdout_text));
        } catch (const json::exception& e) {
            spdlog::warn("Unparseable terraform output for {}: {}", instance.id, e.what());
        }
    }
    return stats;
}

} // namespace providers
} // namespace cerberus
