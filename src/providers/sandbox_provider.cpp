/**
 * @file sandbox_provider.cpp
 * @brief Shared helpers for sandbox providers
 *
 * @date 2025
 */

#include "cerberus/providers/sandbox_provider.hpp"
#include "cerberus/core/errors.hpp"

#include <algorithm>

namespace cerberus {
namespace providers {

std::chrono::milliseconds RemainingBudget(Deadline deadline, std::chrono::milliseconds cap) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        throw core::SpawnTimeoutError("Spawn deadline exceeded");
    }
    return std::min(remaining, cap);
}

} // namespace providers
} // namespace cerberus
