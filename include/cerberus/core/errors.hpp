/**
 * @file errors.hpp
 * @brief Orchestrator exception taxonomy
 *
 * Exceptions are used for the exceptional paths between components; the
 * ChallengeManager converts them into SpawnResult values before anything
 * reaches the caller.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cerberus {
namespace core {

/**
 * @class OrchestratorError
 * @brief Base of every error raised by the orchestrator and its providers
 */
class OrchestratorError : public std::runtime_error {
public:
    explicit OrchestratorError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Malformed request or metadata. Terminal.
class ValidationError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
};

/// Per-user instance cap reached. Terminal.
class QuotaExceededError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
};

/// Backend has no capacity right now. Retried with backoff.
class ResourceExhaustedError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
};

/// Spawn deadline passed. Retryable; partial state is torn down by the caller.
class SpawnTimeoutError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
};

/**
 * @class ProviderError
 * @brief Backend failure, classified retryable or not from the backend's status
 */
class ProviderError : public OrchestratorError {
public:
    ProviderError(const std::string& message, bool retryable)
        : OrchestratorError(message), retryable_(retryable) {}

    bool IsRetryable() const { return retryable_; }

private:
    bool retryable_;
};

/// Operation on an id that is neither tracked nor tombstoned.
class InstanceNotFoundError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
};

/// Unreadable or invalid configuration. Fatal at startup.
class ConfigError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
};

} // namespace core
} // namespace cerberus
