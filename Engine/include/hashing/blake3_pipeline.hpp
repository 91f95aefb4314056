/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing for content-derived keys
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Coalesce {

/**
 * @brief BLAKE3 hashing truncated to 128 bits
 *
 * Every persisted identity in the engine (edge keys, golden record keys,
 * cluster content keys) is a hash of its content, so re-running a stage
 * over the same input reproduces the same keys.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Incremental hasher; feeding parts is equivalent to hashing
     * their concatenation.
     */
    class Hasher {
    public:
        Hasher() { blake3_hasher_init(&state_); }

        Hasher& update(std::string_view part) {
            blake3_hasher_update(&state_, part.data(), part.size());
            return *this;
        }

        Hasher& update(char c) {
            blake3_hasher_update(&state_, &c, 1);
            return *this;
        }

        Hash finalize() const;
        std::string finalize_hex() const { return to_hex(finalize()); }

    private:
        blake3_hasher state_;
    };

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static std::string hash_hex(std::string_view str) {
        return to_hex(hash(str));
    }

    /**
     * @brief Lowercase hex (32 chars)
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Parse 32 hex digits. Hyphens (UUID formatting) are ignored.
     * @throws ValidationError on bad length or non-hex characters
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace Coalesce
