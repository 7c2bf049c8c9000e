/**
 * @file signature_hash.hpp
 * @brief BLAKE3 content hashing for entity and relation signatures
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Broadsheet {

/**
 * @brief Content-addressed identifiers.
 *
 * The same signature string always yields the same digest, across runs and machines,
 * so identical signatures converge on the same global id.
 */
class SignatureHash {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    static constexpr size_t HEX_SIZE = HASH_SIZE * 2;
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Lowercase hex form of a hash (32 characters)
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Full hex digest of a signature string
     */
    static std::string hex_digest(std::string_view signature) {
        return to_hex(hash(signature));
    }

    /**
     * @brief First @p chars hex characters of the digest.
     * @throws std::invalid_argument if chars exceeds the digest length
     */
    static std::string hex_prefix(std::string_view signature, size_t chars);
};

} // namespace Broadsheet
