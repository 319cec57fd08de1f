#pragma once

#include "state/result.hh"
#include "state/transaction.hh"

namespace pledge {

// ============================================================================
// Slash Registry
// ============================================================================
//
// Sole writer of per-pool slash points. A slash is O(1): it bumps the pool
// total and leaves every bond record alone. Bonds see the loss the next time
// their withdrawal amount is computed.

class SlashRegistry {
public:
    SlashRegistry() = default;

    // Raise `pool` by `points`. Caller must be the configured authority and
    // the new total must stay within MAX_SLASH. Emits SlashApplied.
    LedgerResult slash(
        Transaction& tx,
        const CallContext& ctx,
        const PoolId& pool,
        slash_points_t points) const;

    [[nodiscard]] static slash_points_t slash_points(const LedgerState& state, const PoolId& pool) {
        return state.slash_points(pool);
    }
};

}  // namespace pledge
