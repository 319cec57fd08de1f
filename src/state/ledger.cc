#include "ledger.hh"
#include "core/logging.hh"

namespace pledge {

Ledger::Ledger(LedgerConfig config, TokenAccounts& tokens)
    : state_(config)
    , tokens_(tokens) {
    PLEDGE_LOG_INFO(log::state) << "Ledger " << config.instance.to_hex()
                                << " created for token " << config.token.to_hex();
}

Ledger::Ledger(LedgerState state, TokenAccounts& tokens)
    : state_(std::move(state))
    , tokens_(tokens) {
    PLEDGE_LOG_INFO(log::state) << "Ledger " << state_.config().instance.to_hex()
                                << " restored with " << state_.pool_count() << " pools, "
                                << state_.bond_count() << " bonds";
}

template<typename Op>
LedgerResult Ledger::run(std::string_view name, const CallContext& ctx, Op&& op) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(state_, events_, tokens_);
    LedgerResult result = op(tx);

    if (result != LedgerResult::SUCCESS) {
        tx.rollback();
        PLEDGE_LOG_DEBUG(log::ledger) << name << " by " << ctx.caller.to_hex()
                                      << " failed: " << ledger_result_string(result);
        return result;
    }

    tx.commit();
    return result;
}

// ============================================================================
// Operations
// ============================================================================

LedgerResult Ledger::slash(const CallContext& ctx, const PoolId& pool, slash_points_t points) {
    return run("slash", ctx, [&](Transaction& tx) {
        return registry_.slash(tx, ctx, pool, points);
    });
}

LedgerResult Ledger::add_bond(const CallContext& ctx, const BondIntent& intent) {
    return run("add_bond", ctx, [&](Transaction& tx) {
        return bonds_.add_bond(tx, ctx, intent);
    });
}

LedgerResult Ledger::request_unbond(const CallContext& ctx, const BondIntent& intent) {
    return run("request_unbond", ctx, [&](Transaction& tx) {
        return bonds_.request_unbond(tx, ctx, intent);
    });
}

LedgerResult Ledger::unbond(const CallContext& ctx, const BondIntent& intent) {
    return run("unbond", ctx, [&](Transaction& tx) {
        return bonds_.unbond(tx, ctx, intent);
    });
}

LedgerResult Ledger::replace_bond(const CallContext& ctx,
                                  const BondIntent& old_intent,
                                  const BondIntent& new_intent) {
    return run("replace_bond", ctx, [&](Transaction& tx) {
        return bonds_.replace_bond(tx, ctx, old_intent, new_intent);
    });
}

// ============================================================================
// Queries
// ============================================================================

slash_points_t Ledger::get_slash_points(const PoolId& pool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SlashRegistry::slash_points(state_, pool);
}

amount_t Ledger::get_withdraw_amount(const Address& owner, const BondIntent& intent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BondLedger::get_withdraw_amount(state_, owner, intent);
}

bond_id_t Ledger::bond_id(const Address& owner, const BondIntent& intent) const {
    return derive_bond_id(state_.config().instance, owner, intent);
}

std::optional<BondState> Ledger::get_bond(const bond_id_t& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.bond(id);
}

bool Ledger::is_active(const bond_id_t& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bond = state_.bond(id);
    return bond && bond->active;
}

std::size_t Ledger::bond_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.bond_count();
}

std::vector<std::uint8_t> Ledger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.serialize();
}

hash_t Ledger::state_root() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.state_root();
}

std::vector<LedgerEvent> Ledger::events_since(std::uint64_t from) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.since(from);
}

std::vector<LedgerEvent> Ledger::events_of_type(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.of_type(type);
}

std::size_t Ledger::event_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t Ledger::subscribe(EventLog::Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.subscribe(std::move(listener));
}

void Ledger::unsubscribe(std::size_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.unsubscribe(handle);
}

}  // namespace pledge
