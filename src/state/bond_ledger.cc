#include "bond_ledger.hh"
#include "core/logging.hh"
#include "core/safe_math.hh"

namespace pledge {

// ============================================================================
// Withdrawal Arithmetic
// ============================================================================

std::optional<amount_t> BondLedger::calc_withdraw_amount(
    amount_t amount,
    slash_points_t points_now,
    slash_points_t slashed_at_start) {

    auto remaining = checked_sub(MAX_SLASH, points_now);
    auto remaining_at_start = checked_sub(MAX_SLASH, slashed_at_start);
    if (!remaining || !remaining_at_start || *remaining > *remaining_at_start) {
        return std::nullopt;
    }

    // Multiply first; the 512-bit product cannot overflow
    return mul_div(amount, *remaining, *remaining_at_start);
}

std::optional<amount_t> BondLedger::calc_withdraw_amount(
    const LedgerState& state,
    amount_t amount,
    const PoolId& pool,
    slash_points_t slashed_at_start) {
    return calc_withdraw_amount(amount, state.slash_points(pool), slashed_at_start);
}

amount_t BondLedger::get_withdraw_amount(
    const LedgerState& state,
    const Address& owner,
    const BondIntent& intent) {

    auto id = derive_bond_id(state.config().instance, owner, intent);
    auto bond = state.bond(id);
    if (!bond || !bond->active) {
        return 0;
    }
    return calc_withdraw_amount(state, intent.amount, intent.pool_id, bond->slashed_at_start)
        .value_or(0);
}

// ============================================================================
// Operations
// ============================================================================

LedgerResult BondLedger::add_bond(
    Transaction& tx,
    const CallContext& ctx,
    const BondIntent& intent) const {

    const auto& config = tx.config();
    auto id = derive_bond_id(config.instance, ctx.caller, intent);

    auto existing = tx.bond(id);
    if (existing && existing->active) {
        PLEDGE_LOG_DEBUG(log::ledger) << "add_bond rejected: " << bond_id_to_hex(id)
                                      << " already active";
        return LedgerResult::BOND_ALREADY_ACTIVE;
    }

    slash_points_t points = tx.slash_points(intent.pool_id);
    if (points >= MAX_SLASH) {
        PLEDGE_LOG_DEBUG(log::ledger) << "add_bond rejected: pool "
                                      << intent.pool_id.to_hex() << " fully slashed";
        return LedgerResult::POOL_FULLY_SLASHED;
    }

    BondState bond;
    bond.active = true;
    bond.slashed_at_start = points;
    bond.will_unlock = 0;
    tx.put_bond(id, bond);

    if (intent.amount > 0 &&
        !safe_transfer_from(tx.tokens(), config.token, config.instance,
                            ctx.caller, config.instance, intent.amount)) {
        return LedgerResult::TRANSFER_FAILED;
    }

    tx.emit(BondAdded{ctx.caller, intent.amount, intent.pool_id, intent.nonce, points, ctx.now});

    PLEDGE_LOG_DEBUG(log::ledger) << "Bond " << bond_id_to_hex(id) << " added: "
                                  << intent.amount << " at " << points << " slash points";
    return LedgerResult::SUCCESS;
}

LedgerResult BondLedger::request_unbond(
    Transaction& tx,
    const CallContext& ctx,
    const BondIntent& intent) const {

    auto id = derive_bond_id(tx.config().instance, ctx.caller, intent);

    auto bond = tx.bond(id);
    if (!bond || !bond->active || bond->unbond_requested()) {
        PLEDGE_LOG_DEBUG(log::ledger) << "request_unbond rejected: " << bond_id_to_hex(id)
                                      << (bond && bond->active ? " already requested" : " not active");
        return LedgerResult::BOND_NOT_ACTIVE;
    }

    auto will_unlock = checked_add(ctx.now, UNBOND_DELAY);
    if (!will_unlock) {
        return LedgerResult::ARITHMETIC_OVERFLOW;
    }

    bond->will_unlock = *will_unlock;
    tx.put_bond(id, *bond);
    tx.emit(UnbondRequested{ctx.caller, id, *will_unlock, ctx.now});

    PLEDGE_LOG_DEBUG(log::ledger) << "Bond " << bond_id_to_hex(id)
                                  << " unlocks after " << *will_unlock;
    return LedgerResult::SUCCESS;
}

LedgerResult BondLedger::unbond(
    Transaction& tx,
    const CallContext& ctx,
    const BondIntent& intent) const {

    auto id = derive_bond_id(tx.config().instance, ctx.caller, intent);

    auto bond = tx.bond(id);
    if (!bond || !bond->active || !bond->is_unlocked(ctx.now)) {
        PLEDGE_LOG_DEBUG(log::ledger) << "unbond rejected: " << bond_id_to_hex(id)
                                      << " not unlocked at " << ctx.now;
        return LedgerResult::BOND_NOT_UNLOCKED;
    }

    return settle(tx, ctx, id, *bond, intent);
}

LedgerResult BondLedger::replace_bond(
    Transaction& tx,
    const CallContext& ctx,
    const BondIntent& old_intent,
    const BondIntent& new_intent) const {

    auto old_id = derive_bond_id(tx.config().instance, ctx.caller, old_intent);

    // A pending unbond request does not block replacement
    auto old_bond = tx.bond(old_id);
    if (!old_bond || !old_bond->active) {
        PLEDGE_LOG_DEBUG(log::ledger) << "replace_bond rejected: " << bond_id_to_hex(old_id)
                                      << " not active";
        return LedgerResult::BOND_NOT_ACTIVE;
    }

    if (new_intent.pool_id != old_intent.pool_id) {
        return LedgerResult::POOL_ID_MISMATCH;
    }

    auto payout = calc_withdraw_amount(old_intent.amount, tx.slash_points(old_intent.pool_id),
                                       old_bond->slashed_at_start);
    if (!payout) {
        return LedgerResult::ARITHMETIC_OVERFLOW;
    }
    if (new_intent.amount < *payout) {
        PLEDGE_LOG_DEBUG(log::ledger) << "replace_bond rejected: new amount " << new_intent.amount
                                      << " below current payout " << *payout;
        return LedgerResult::NEW_BOND_TOO_SMALL;
    }

    auto result = settle(tx, ctx, old_id, *old_bond, old_intent);
    if (result != LedgerResult::SUCCESS) {
        return result;
    }
    return add_bond(tx, ctx, new_intent);
}

LedgerResult BondLedger::settle(
    Transaction& tx,
    const CallContext& ctx,
    const bond_id_t& id,
    const BondState& bond,
    const BondIntent& intent) const {

    const auto& config = tx.config();

    auto payout = calc_withdraw_amount(intent.amount, tx.slash_points(intent.pool_id),
                                       bond.slashed_at_start);
    if (!payout) {
        return LedgerResult::ARITHMETIC_OVERFLOW;
    }
    auto burned = checked_sub(intent.amount, *payout);
    if (!burned) {
        return LedgerResult::ARITHMETIC_OVERFLOW;
    }

    tx.erase_bond(id);

    if (*payout > 0 &&
        !safe_transfer(tx.tokens(), config.token, config.instance, ctx.caller, *payout)) {
        return LedgerResult::TRANSFER_FAILED;
    }
    if (*burned > 0 &&
        !safe_transfer(tx.tokens(), config.token, config.instance, burn_sink_address(), *burned)) {
        return LedgerResult::TRANSFER_FAILED;
    }

    tx.emit(Unbonded{ctx.caller, id, ctx.now});

    PLEDGE_LOG_DEBUG(log::ledger) << "Bond " << bond_id_to_hex(id) << " settled: paid "
                                  << *payout << ", burned " << *burned;
    return LedgerResult::SUCCESS;
}

}  // namespace pledge
