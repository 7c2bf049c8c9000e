/**
 * @file signature_hash.cpp
 * @brief BLAKE3 signature hashing implementation
 */

#include <hashing/signature_hash.hpp>
#include <stdexcept>

namespace Broadsheet {

static constexpr char k_hex_lut[] = "0123456789abcdef";

SignatureHash::Hash SignatureHash::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string SignatureHash::to_hex(const Hash& hash) {
    std::string out(HEX_SIZE, '0');
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        out[i * 2]     = k_hex_lut[(hash[i] >> 4) & 0xF];
        out[i * 2 + 1] = k_hex_lut[hash[i] & 0xF];
    }
    return out;
}

std::string SignatureHash::hex_prefix(std::string_view signature, size_t chars) {
    if (chars > HEX_SIZE) {
        throw std::invalid_argument("Requested " + std::to_string(chars) +
                                    " hex characters; digest has " + std::to_string(HEX_SIZE) + ".");
    }
    return hex_digest(signature).substr(0, chars);
}

} // namespace Broadsheet
