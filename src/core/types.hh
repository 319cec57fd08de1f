#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <compare>

#include <boost/multiprecision/cpp_int.hpp>

namespace pledge {

// ============================================================================
// Slashing Constants
// ============================================================================

// Slash points are scaled so that MAX_SLASH represents 100% slashed
inline constexpr std::uint64_t MAX_SLASH = 1'000'000'000'000'000'000ULL;  // 10^18

// ============================================================================
// Timing Constants
// ============================================================================

inline constexpr std::uint64_t SECONDS_PER_DAY = 24 * 60 * 60;
inline constexpr std::uint64_t UNBOND_DELAY_DAYS = 30;
inline constexpr std::uint64_t UNBOND_DELAY = UNBOND_DELAY_DAYS * SECONDS_PER_DAY;  // 2,592,000s

// ============================================================================
// Identity Constants
// ============================================================================

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Accounts, pools and ledger instances are all 32-byte identifiers
inline constexpr std::size_t ADDRESS_SIZE = HASH_SIZE;
inline constexpr std::size_t POOL_ID_SIZE = HASH_SIZE;

// Token amounts are 256-bit unsigned, encoded as 32 little-endian bytes
inline constexpr std::size_t AMOUNT_SIZE = 32;

// Domain tag mixed into every bond identifier preimage
inline constexpr std::string_view BOND_ID_DOMAIN = "pledge.bond.v1";

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using amount_t = boost::multiprecision::uint256_t;
using slash_points_t = std::uint64_t;
using nonce_t = std::uint64_t;
using unix_time_t = std::uint64_t;   // seconds, 0 means "unset" where noted
using bond_id_t = hash_t;

// ============================================================================
// Address (accounts, token identity, ledger instance identity)
// ============================================================================

struct Address {
    hash_t bytes{};

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Address&) const = default;
};

// The account that receives the slashed share of a bond on exit.
// Non-zero because some tokens refuse transfers to the zero account.
[[nodiscard]] Address burn_sink_address();

// ============================================================================
// Pool Identifier
// ============================================================================

struct PoolId {
    hash_t bytes{};

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<PoolId> from_hex(std::string_view hex);

    auto operator<=>(const PoolId&) const = default;
};

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
    dst[4] = static_cast<std::uint8_t>(val >> 32);
    dst[5] = static_cast<std::uint8_t>(val >> 40);
    dst[6] = static_cast<std::uint8_t>(val >> 48);
    dst[7] = static_cast<std::uint8_t>(val >> 56);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    return static_cast<std::uint64_t>(src[0]) |
           (static_cast<std::uint64_t>(src[1]) << 8) |
           (static_cast<std::uint64_t>(src[2]) << 16) |
           (static_cast<std::uint64_t>(src[3]) << 24) |
           (static_cast<std::uint64_t>(src[4]) << 32) |
           (static_cast<std::uint64_t>(src[5]) << 40) |
           (static_cast<std::uint64_t>(src[6]) << 48) |
           (static_cast<std::uint64_t>(src[7]) << 56);
}

inline void encode_amount(std::uint8_t* dst, const amount_t& val) {
    for (std::size_t i = 0; i < AMOUNT_SIZE; ++i) {
        dst[i] = static_cast<std::uint8_t>((val >> (8 * i)) & 0xFF);
    }
}

[[nodiscard]] inline amount_t decode_amount(const std::uint8_t* src) {
    amount_t val = 0;
    for (std::size_t i = AMOUNT_SIZE; i > 0; --i) {
        val <<= 8;
        val |= src[i - 1];
    }
    return val;
}

// Append helpers for building variable-length encodings
inline void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_amount(std::vector<std::uint8_t>& out, const amount_t& val) {
    std::array<std::uint8_t, AMOUNT_SIZE> buf;
    encode_amount(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_bytes(std::vector<std::uint8_t>& out, const hash_t& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

}  // namespace pledge

// ============================================================================
// Hash specializations (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<pledge::hash_t> {
    std::size_t operator()(const pledge::hash_t& h) const noexcept {
        // Use first 8 bytes as hash (already cryptographic quality)
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<pledge::Address> {
    std::size_t operator()(const pledge::Address& addr) const noexcept {
        return std::hash<pledge::hash_t>{}(addr.bytes);
    }
};

// Pool identifiers are caller-chosen and may share prefixes, so fold all bytes
template<>
struct hash<pledge::PoolId> {
    std::size_t operator()(const pledge::PoolId& pool) const noexcept {
        constexpr std::size_t FNV_OFFSET = 14695981039346656037ULL;
        constexpr std::size_t FNV_PRIME = 1099511628211ULL;
        std::size_t h = FNV_OFFSET;
        for (auto b : pool.bytes) {
            h ^= b;
            h *= FNV_PRIME;
        }
        return h;
    }
};

}  // namespace std
