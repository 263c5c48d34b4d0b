/**
 * @file command_handler.cpp
 * @brief JSON-lines control protocol of cerberus-orchestrator
 *
 * @date 2025
 */

#include "cerberus/cli/command_handler.hpp"
#include "cerberus/core/errors.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace cerberus {
namespace cli {

namespace {

json Error(const std::string& message) {
    return {{"success", false}, {"error_message", message}};
}

std::string RequireInstanceId(const json& command) {
    auto it = command.find("instance_id");
    if (it == command.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw core::ValidationError("instance_id is required");
    }
    return it->get<std::string>();
}

} // anonymous namespace

CommandHandler::CommandHandler(core::ChallengeManager& manager)
    : manager_(manager) {
}

std::string CommandHandler::HandleLine(const std::string& line) {
    json command;
    try {
        command = json::parse(line);
    } catch (const json::parse_error& e) {
        return Error(std::string("Invalid JSON: ") + e.what()).dump();
    }
    return Handle(command).dump();
}

json CommandHandler::Handle(const json& command) {
    json response;

    try {
        if (!command.is_object()) {
            throw core::ValidationError("Command must be a JSON object");
        }
        const std::string name = command.value("command", "");
        spdlog::debug("Handling command '{}'", name);

        if (name == "spawn") {
            response = HandleSpawn(command);
        } else if (name == "status") {
            response = HandleStatus(command);
        } else if (name == "destroy") {
            response = HandleDestroy(command);
        } else if (name == "extend") {
            response = HandleExtend(command);
        } else if (name == "list") {
            response = HandleList(command);
        } else if (name == "logs") {
            response = HandleLogs(command);
        } else if (name == "stats") {
            response = HandleStats(command);
        } else if (name == "queue") {
            response = HandleQueue();
        } else if (name.empty()) {
            response = Error("Missing 'command' field");
        } else {
            response = Error("Unknown command: " + name);
        }
    } catch (const core::ValidationError& e) {
        response = Error(e.what());
    } catch (const json::exception& e) {
        response = Error(std::string("Malformed command: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Command failed: {}", e.what());
        response = Error(e.what());
    }

    if (command.is_object() && command.contains("id")) {
        response["id"] = command["id"];
    }
    return response;
}

json CommandHandler::HandleSpawn(const json& command) {
    const json& body = command.contains("request") ? command["request"] : command;
    auto request = body.get<core::SpawnRequest>();
    return json(manager_.Spawn(request));
}

json CommandHandler::HandleStatus(const json& command) {
    auto instance = manager_.GetStatus(RequireInstanceId(command));
    if (!instance) {
        return Error("Instance not found");
    }
    return {{"success", true},
            {"instance", *instance},
            {"usable", manager_.IsUsable(instance->id)}};
}

json CommandHandler::HandleDestroy(const json& command) {
    const std::string id = RequireInstanceId(command);
    if (!manager_.Destroy(id)) {
        return Error("Instance not found");
    }
    return {{"success", true}, {"instance_id", id}};
}

json CommandHandler::HandleExtend(const json& command) {
    const std::string id = RequireInstanceId(command);
    const long seconds = command.value("seconds", 0L);
    if (!manager_.ExtendTimeout(id, seconds)) {
        return Error("Instance not active or invalid extension");
    }
    json response = {{"success", true}, {"instance_id", id}};
    auto instance = manager_.GetStatus(id);
    if (instance && instance->expires_at) {
        response["expires_at"] = core::FormatTimestamp(*instance->expires_at);
    }
    return response;
}

json CommandHandler::HandleList(const json& command) {
    std::vector<core::ChallengeInstance> instances;
    if (command.contains("user_id")) {
        instances = manager_.ListUserInstances(command.at("user_id").get<std::string>());
    } else {
        instances = manager_.ListActive();
    }
    return {{"success", true}, {"instances", instances}};
}

json CommandHandler::HandleLogs(const json& command) {
    auto logs = manager_.GetLogs(RequireInstanceId(command), command.value("tail", 100));
    if (!logs) {
        return Error("Instance not found");
    }
    return {{"success", true}, {"logs", *logs}};
}

json CommandHandler::HandleStats(const json& command) {
    auto stats = manager_.GetStats(RequireInstanceId(command));
    if (!stats) {
        return Error("Instance not found");
    }
    return {{"success", true}, {"stats", *stats}};
}

json CommandHandler::HandleQueue() {
    return {{"success", true}, {"requests", manager_.PendingSpawnRequests()}};
}

} // namespace cli
} // namespace cerberus
