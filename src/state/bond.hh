#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pledge {

// ============================================================================
// Bond Intent - caller supplied, never stored
// ============================================================================

struct BondIntent {
    amount_t amount = 0;
    PoolId pool_id;
    nonce_t nonce = 0;

    bool operator==(const BondIntent&) const = default;
};

// ============================================================================
// Bond State
// ============================================================================

struct BondState {
    bool active = false;
    slash_points_t slashed_at_start = 0;  // always < MAX_SLASH
    unix_time_t will_unlock = 0;          // 0 until unbonding is requested

    [[nodiscard]] bool unbond_requested() const { return will_unlock != 0; }

    // Unlocked strictly after will_unlock
    [[nodiscard]] bool is_unlocked(unix_time_t now) const {
        return will_unlock != 0 && now > will_unlock;
    }

    bool operator==(const BondState&) const = default;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<BondState> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE =
        sizeof(std::uint8_t) +          // active
        sizeof(slash_points_t) +        // slashed_at_start
        sizeof(unix_time_t);            // will_unlock
};

// ============================================================================
// Bond Identity
// ============================================================================

// SHA3-256("pledge.bond.v1" || instance || owner || amount || pool || nonce),
// amount as 32 little-endian bytes and nonce as 8.
// The same owner submitting the same intent always lands on the same id.
[[nodiscard]] bond_id_t derive_bond_id(
    const Address& instance,
    const Address& owner,
    const BondIntent& intent);

[[nodiscard]] std::string bond_id_to_hex(const bond_id_t& id);

}  // namespace pledge
