#include "ledger_state.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <stdexcept>

namespace pledge {

namespace {

template<typename Map>
std::vector<typename Map::const_iterator> sorted_entries(const Map& map) {
    std::vector<typename Map::const_iterator> entries;
    entries.reserve(map.size());
    for (auto it = map.begin(); it != map.end(); ++it) {
        entries.push_back(it);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a->first < b->first; });
    return entries;
}

}  // namespace

// ============================================================================
// LedgerState Implementation
// ============================================================================

LedgerState::LedgerState(LedgerConfig config)
    : config_(config) {
    auto validation = config_.validate();
    if (validation != LedgerConfig::Validation::VALID) {
        log::state.error() << "Invalid ledger config: " << config_validation_string(validation);
        throw std::invalid_argument("invalid ledger config: " +
                                    std::string(config_validation_string(validation)));
    }
}

slash_points_t LedgerState::slash_points(const PoolId& pool) const {
    auto it = slash_points_.find(pool);
    return it == slash_points_.end() ? 0 : it->second;
}

void LedgerState::set_slash_points(const PoolId& pool, slash_points_t points) {
    slash_points_[pool] = points;
}

std::optional<BondState> LedgerState::bond(const bond_id_t& id) const {
    auto it = bonds_.find(id);
    if (it == bonds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void LedgerState::put_bond(const bond_id_t& id, const BondState& state) {
    bonds_[id] = state;
}

void LedgerState::erase_bond(const bond_id_t& id) {
    bonds_.erase(id);
}

// ============================================================================
// Snapshot
// ============================================================================

std::vector<std::uint8_t> LedgerState::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(4 + ADDRESS_SIZE * 3 + 8 +
                   slash_points_.size() * (POOL_ID_SIZE + 8) +
                   bonds_.size() * (HASH_SIZE + BondState::SERIALIZED_SIZE));

    append_u32(result, SNAPSHOT_MAGIC);
    append_bytes(result, config_.token.bytes);
    append_bytes(result, config_.authority.bytes);
    append_bytes(result, config_.instance.bytes);

    append_u32(result, static_cast<std::uint32_t>(slash_points_.size()));
    for (const auto& it : sorted_entries(slash_points_)) {
        append_bytes(result, it->first.bytes);
        append_u64(result, it->second);
    }

    append_u32(result, static_cast<std::uint32_t>(bonds_.size()));
    for (const auto& it : sorted_entries(bonds_)) {
        append_bytes(result, it->first);
        auto state_bytes = it->second.serialize();
        result.insert(result.end(), state_bytes.begin(), state_bytes.end());
    }

    return result;
}

std::optional<LedgerState> LedgerState::deserialize(std::span<const std::uint8_t> data) {
    const std::uint8_t* ptr = data.data();
    const std::uint8_t* end = data.data() + data.size();

    if (ptr + sizeof(std::uint32_t) + ADDRESS_SIZE * 3 > end) {
        return std::nullopt;
    }
    if (decode_u32(ptr) != SNAPSHOT_MAGIC) {
        log::state.warn("Snapshot has wrong magic");
        return std::nullopt;
    }
    ptr += sizeof(std::uint32_t);

    LedgerConfig config;
    std::copy(ptr, ptr + ADDRESS_SIZE, config.token.bytes.begin());
    ptr += ADDRESS_SIZE;
    std::copy(ptr, ptr + ADDRESS_SIZE, config.authority.bytes.begin());
    ptr += ADDRESS_SIZE;
    std::copy(ptr, ptr + ADDRESS_SIZE, config.instance.bytes.begin());
    ptr += ADDRESS_SIZE;

    if (config.validate() != LedgerConfig::Validation::VALID) {
        log::state.warn("Snapshot carries an invalid config");
        return std::nullopt;
    }
    LedgerState state(config);

    // Pools
    if (ptr + sizeof(std::uint32_t) > end) {
        return std::nullopt;
    }
    std::uint32_t pool_count = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    for (std::uint32_t i = 0; i < pool_count; ++i) {
        if (ptr + POOL_ID_SIZE + sizeof(slash_points_t) > end) {
            return std::nullopt;
        }
        PoolId pool;
        std::copy(ptr, ptr + POOL_ID_SIZE, pool.bytes.begin());
        ptr += POOL_ID_SIZE;
        slash_points_t points = decode_u64(ptr);
        ptr += sizeof(slash_points_t);

        if (points > MAX_SLASH || state.slash_points_.count(pool)) {
            return std::nullopt;
        }
        state.slash_points_[pool] = points;
    }

    // Bonds
    if (ptr + sizeof(std::uint32_t) > end) {
        return std::nullopt;
    }
    std::uint32_t bond_count = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    for (std::uint32_t i = 0; i < bond_count; ++i) {
        if (ptr + HASH_SIZE + BondState::SERIALIZED_SIZE > end) {
            return std::nullopt;
        }
        bond_id_t id;
        std::copy(ptr, ptr + HASH_SIZE, id.begin());
        ptr += HASH_SIZE;

        auto bond = BondState::deserialize({ptr, BondState::SERIALIZED_SIZE});
        if (!bond || state.bonds_.count(id)) {
            return std::nullopt;
        }
        ptr += BondState::SERIALIZED_SIZE;
        state.bonds_[id] = *bond;
    }

    if (ptr != end) {
        log::state.warn("Snapshot has trailing bytes");
        return std::nullopt;
    }

    return state;
}

hash_t LedgerState::state_root() const {
    std::vector<hash_t> leaves;
    leaves.reserve(1 + slash_points_.size() + bonds_.size());

    leaves.push_back(sha3_256_multi(std::string_view("config"),
                                    config_.token.bytes,
                                    config_.authority.bytes,
                                    config_.instance.bytes));

    for (const auto& it : sorted_entries(slash_points_)) {
        SHA3Hasher hasher;
        hasher.update(std::string_view("pool"));
        hasher.update(it->first.bytes);
        hasher.update_u64(it->second);
        leaves.push_back(hasher.finalize());
    }

    for (const auto& it : sorted_entries(bonds_)) {
        leaves.push_back(sha3_256_multi(std::string_view("bond"),
                                        it->first,
                                        it->second.serialize()));
    }

    return compute_merkle_root(leaves);
}

}  // namespace pledge
