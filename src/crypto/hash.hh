#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>
#include <vector>

namespace pledge {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    void update(const void* data, std::size_t len);
    void update_u64(std::uint64_t value);  // little-endian
    void update_amount(const amount_t& value);  // 32 bytes, little-endian
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha3_256_multi(Args&&... args) {
    SHA3Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// Merkle Root
// ============================================================================

[[nodiscard]] hash_t hash_pair(const hash_t& left, const hash_t& right);

// Odd layers duplicate their last node. Empty input gives the zero hash.
[[nodiscard]] hash_t compute_merkle_root(std::span<const hash_t> leaves);

}  // namespace pledge
