/**
 * @file hash_utils.cpp
 * @brief Implementation of OpenSSL-backed digest and token helpers
 *
 * SHA-256 uses the one-shot `SHA256()` primitive; randomness comes from
 * `RAND_bytes`, which is seeded by the operating system's entropy source.
 *
 * @date 2025
 */

#include "cerberus/utils/hash_utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cerberus {
namespace utils {

std::string HashUtils::BinaryToHex(const uint8_t* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<uint8_t> HashUtils::ComputeSHA256Raw(const std::string& data) {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto hash = ComputeSHA256Raw(data);
    return BinaryToHex(hash.data(), hash.size());
}

std::vector<uint8_t> HashUtils::RandomBytes(std::size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce random data");
    }
    return bytes;
}

std::string HashUtils::RandomHex(std::size_t count) {
    auto bytes = RandomBytes(count);
    return BinaryToHex(bytes.data(), bytes.size());
}

std::string HashUtils::GenerateUuid() {
    auto bytes = RandomBytes(16);

    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string hex = BinaryToHex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string HashUtils::GenerateCanaryToken(const std::string& challenge_id,
                                           const std::string& user_id,
                                           const std::optional<std::string>& team_id) {
    std::string material = challenge_id + ":" + user_id + ":" + team_id.value_or("") + ":" +
                           RandomHex(16);
    return ComputeSHA256(material).substr(0, 32);
}

} // namespace utils
} // namespace cerberus
