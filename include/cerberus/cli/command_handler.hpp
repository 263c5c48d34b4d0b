/**
 * @file command_handler.hpp
 * @brief JSON-lines control protocol of cerberus-orchestrator
 *
 * Every input line is one JSON object with a `command` field; every output
 * line is one JSON object with at least `success`. An optional `id` field is
 * echoed back unchanged.
 *
 * | command   | arguments                          | result fields            |
 * |-----------|------------------------------------|--------------------------|
 * | `spawn`   | spawn request fields (or `request`)| `instance`, `retryable`  |
 * | `status`  | `instance_id`                      | `instance`               |
 * | `destroy` | `instance_id`                      |                          |
 * | `extend`  | `instance_id`, `seconds`           | `expires_at`             |
 * | `list`    | optional `user_id`                 | `instances`              |
 * | `logs`    | `instance_id`, optional `tail`     | `logs`                   |
 * | `stats`   | `instance_id`                      | `stats`                  |
 * | `queue`   |                                    | `requests`               |
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/challenge_manager.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace cerberus {
namespace cli {

/**
 * @class CommandHandler
 * @brief Dispatches protocol commands to a ChallengeManager
 */
class CommandHandler {
public:
    explicit CommandHandler(core::ChallengeManager& manager);

    /// Never throws; failures become `{"success": false, "error_message": ...}`
    nlohmann::json Handle(const nlohmann::json& command);

    /// Parse one line and serialise the answer (without trailing newline)
    std::string HandleLine(const std::string& line);

private:
    nlohmann::json HandleSpawn(const nlohmann::json& command);
    nlohmann::json HandleStatus(const nlohmann::json& command);
    nlohmann::json HandleDestroy(const nlohmann::json& command);
    nlohmann::json HandleExtend(const nlohmann::json& command);
    nlohmann::json HandleList(const nlohmann::json& command);
    nlohmann::json HandleLogs(const nlohmann::json& command);
    nlohmann::json HandleStats(const nlohmann::json& command);
    nlohmann::json HandleQueue();

    core::ChallengeManager& manager_;
};

} // namespace cli
} // namespace cerberus
