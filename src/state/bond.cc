#include "bond.hh"
#include "crypto/hash.hh"

namespace pledge {

// ============================================================================
// BondState Serialization
// ============================================================================

std::vector<std::uint8_t> BondState::serialize() const {
    std::vector<std::uint8_t> result(SERIALIZED_SIZE);
    std::uint8_t* ptr = result.data();

    *ptr = active ? 1 : 0;
    ptr += sizeof(std::uint8_t);

    encode_u64(ptr, slashed_at_start);
    ptr += sizeof(slash_points_t);

    encode_u64(ptr, will_unlock);

    return result;
}

std::optional<BondState> BondState::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() != SERIALIZED_SIZE) {
        return std::nullopt;
    }

    const std::uint8_t* ptr = data.data();
    if (*ptr > 1) {
        return std::nullopt;
    }

    BondState state;
    state.active = (*ptr == 1);
    ptr += sizeof(std::uint8_t);

    state.slashed_at_start = decode_u64(ptr);
    ptr += sizeof(slash_points_t);

    state.will_unlock = decode_u64(ptr);

    if (state.slashed_at_start >= MAX_SLASH) {
        return std::nullopt;
    }
    return state;
}

// ============================================================================
// Bond Identity
// ============================================================================

bond_id_t derive_bond_id(
    const Address& instance,
    const Address& owner,
    const BondIntent& intent) {

    SHA3Hasher hasher;
    hasher.update(BOND_ID_DOMAIN);
    hasher.update(instance.bytes);
    hasher.update(owner.bytes);
    hasher.update_amount(intent.amount);
    hasher.update(intent.pool_id.bytes);
    hasher.update_u64(intent.nonce);
    return hasher.finalize();
}

std::string bond_id_to_hex(const bond_id_t& id) {
    return "0x" + bytes_to_hex(id);
}

}  // namespace pledge
