#pragma once

#include "state/bond.hh"
#include "state/result.hh"
#include "state/transaction.hh"
#include <optional>

namespace pledge {

// ============================================================================
// Bond Ledger
// ============================================================================
//
// Per-bond lifecycle for one ledger instance:
//
//   (none) --add_bond--> Active(will_unlock=0) --request_unbond--> Active(will_unlock=t)
//   Active(t) --unbond, now > t--> (none)
//   Active(any) --replace_bond--> (none), then add_bond for the new intent
//
// Bonds are addressed by the intent tuple, never by a stored handle, so every
// call for one bond must repeat the exact (amount, pool, nonce) it was added with.

class BondLedger {
public:
    BondLedger() = default;

    // Lock intent.amount into custody (pulled with transfer_from; the caller
    // must have approved the ledger instance). Emits BondAdded.
    LedgerResult add_bond(Transaction& tx, const CallContext& ctx, const BondIntent& intent) const;

    // Start the UNBOND_DELAY timelock. Only once per bond. Emits UnbondRequested.
    LedgerResult request_unbond(Transaction& tx, const CallContext& ctx, const BondIntent& intent) const;

    // Release the slash-adjusted amount after the timelock; the remainder goes
    // to the burn sink. Emits Unbonded.
    LedgerResult unbond(Transaction& tx, const CallContext& ctx, const BondIntent& intent) const;

    // Settle `old_intent` immediately (no timelock) and bond `new_intent` in
    // the same pool. new_intent.amount must cover the old bond's current payout.
    LedgerResult replace_bond(
        Transaction& tx,
        const CallContext& ctx,
        const BondIntent& old_intent,
        const BondIntent& new_intent) const;

    // amount * (MAX_SLASH - points_now) / (MAX_SLASH - slashed_at_start).
    // Empty only when slashed_at_start >= MAX_SLASH or points_now < slashed_at_start,
    // neither of which a bond created by add_bond can reach.
    [[nodiscard]] static std::optional<amount_t> calc_withdraw_amount(
        amount_t amount,
        slash_points_t points_now,
        slash_points_t slashed_at_start);

    // Same, reading the live slash points of `pool`
    [[nodiscard]] static std::optional<amount_t> calc_withdraw_amount(
        const LedgerState& state,
        amount_t amount,
        const PoolId& pool,
        slash_points_t slashed_at_start);

    // Current payout of owner's bond for `intent`; 0 when it is not active
    [[nodiscard]] static amount_t get_withdraw_amount(
        const LedgerState& state,
        const Address& owner,
        const BondIntent& intent);

private:
    // Delete the bond and pay it out. Shared by unbond and replace_bond.
    LedgerResult settle(
        Transaction& tx,
        const CallContext& ctx,
        const bond_id_t& id,
        const BondState& bond,
        const BondIntent& intent) const;
};

}  // namespace pledge
