#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "state/bond.hh"
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace pledge {

// ============================================================================
// Ledger State
// ============================================================================
//
// The whole persisted machine: immutable configuration, pool -> slash points,
// bond id -> bond state. Components receive it by reference; nothing here is
// process-wide, so tests can build as many ledgers as they like.
//
// Not synchronized. Callers serialize access (see Ledger).

class LedgerState {
public:
    // Throws std::invalid_argument when config.validate() is not VALID
    explicit LedgerState(LedgerConfig config);

    [[nodiscard]] const LedgerConfig& config() const { return config_; }

    // Slash points (absent pools read as 0)
    [[nodiscard]] slash_points_t slash_points(const PoolId& pool) const;
    void set_slash_points(const PoolId& pool, slash_points_t points);
    [[nodiscard]] std::size_t pool_count() const { return slash_points_.size(); }

    // Bonds
    [[nodiscard]] std::optional<BondState> bond(const bond_id_t& id) const;
    void put_bond(const bond_id_t& id, const BondState& state);
    void erase_bond(const bond_id_t& id);
    [[nodiscard]] std::size_t bond_count() const { return bonds_.size(); }

    // Canonical snapshot; tables are written in sorted key order
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<LedgerState> deserialize(
        std::span<const std::uint8_t> data);

    // Merkle root over the config leaf, every pool leaf and every bond leaf
    [[nodiscard]] hash_t state_root() const;

    static constexpr std::uint32_t SNAPSHOT_MAGIC = 0x31474C50;  // "PLG1"

private:
    LedgerConfig config_;
    std::unordered_map<PoolId, slash_points_t> slash_points_;
    std::unordered_map<bond_id_t, BondState> bonds_;
};

}  // namespace pledge
