/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <utils/errors.hpp>

namespace Coalesce {

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::Hasher::finalize() const {
    Hash result;
    blake3_hasher_finalize(&state_, result.data(), HASH_SIZE);
    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0f]);
    }
    return out;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    std::string clean;
    clean.reserve(hex.size());
    for (char c : hex) {
        if (c != '-') clean.push_back(c);
    }

    if (clean.size() != HASH_SIZE * 2) {
        throw ValidationError("invalid hash length " + std::to_string(clean.size()) + ", expected 32 hex digits");
    }

    Hash result{};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        const int hi = hex_value(clean[i * 2]);
        const int lo = hex_value(clean[i * 2 + 1]);
        if (hi < 0 || lo < 0) throw ValidationError("invalid hex digit in '" + hex + "'");
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

} // namespace Coalesce
