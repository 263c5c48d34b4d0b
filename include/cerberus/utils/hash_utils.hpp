/**
 * @file hash_utils.hpp
 * @brief Digest and random-token helpers backed by OpenSSL
 *
 * Provides the SHA-256 digests and CSPRNG output the orchestrator needs for
 * instance identifiers, canary tokens and deterministic microVM addressing.
 *
 * **Usage Example**:
 * @code
 * auto id = HashUtils::GenerateUuid();              // "3f2b...-4..."
 * auto canary = HashUtils::GenerateCanaryToken("web-101", "alice", std::nullopt);
 * auto digest = HashUtils::ComputeSHA256(id);       // 64 hex characters
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cerberus {
namespace utils {

/**
 * @class HashUtils
 * @brief Stateless hashing and randomness helpers
 *
 * **Thread Safety**: All methods are static and reentrant.
 */
class HashUtils {
public:
    /// Lowercase hex SHA-256 of a string (64 characters)
    static std::string ComputeSHA256(const std::string& data);

    /// Raw 32-byte SHA-256 digest
    static std::vector<uint8_t> ComputeSHA256Raw(const std::string& data);

    /**
     * @brief Cryptographically secure random bytes
     * @throws std::runtime_error if the OpenSSL generator fails
     */
    static std::vector<uint8_t> RandomBytes(std::size_t count);

    /// Hex encoding of @p count random bytes
    static std::string RandomHex(std::size_t count);

    /**
     * @brief Random RFC 4122 version 4 UUID
     * @return Canonical 36-character lowercase form
     */
    static std::string GenerateUuid();

    /**
     * @brief Unforgeable per-instance canary token
     *
     * SHA-256 over `challenge:user:team:<128 random bits>`, truncated to
     * 32 hex characters. An absent team contributes an empty component.
     */
    static std::string GenerateCanaryToken(const std::string& challenge_id,
                                           const std::string& user_id,
                                           const std::optional<std::string>& team_id);

    static std::string BinaryToHex(const uint8_t* data, std::size_t length);
};

} // namespace utils
} // namespace cerberus
