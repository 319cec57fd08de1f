#include "transaction.hh"
#include "core/logging.hh"
#include <stdexcept>

namespace pledge {

Transaction::Transaction(LedgerState& state, EventLog& events, TokenAccounts& tokens)
    : state_(state)
    , events_(events)
    , tokens_(tokens) {
    tokens_.begin_scope();
}

Transaction::~Transaction() {
    if (is_open()) {
        rollback();
    }
}

slash_points_t Transaction::slash_points(const PoolId& pool) const {
    auto it = pool_writes_.find(pool);
    if (it != pool_writes_.end()) {
        return it->second;
    }
    return state_.slash_points(pool);
}

std::optional<BondState> Transaction::bond(const bond_id_t& id) const {
    auto it = bond_writes_.find(id);
    if (it != bond_writes_.end()) {
        return it->second;
    }
    return state_.bond(id);
}

void Transaction::set_slash_points(const PoolId& pool, slash_points_t points) {
    pool_writes_[pool] = points;
}

void Transaction::put_bond(const bond_id_t& id, const BondState& state) {
    bond_writes_[id] = state;
}

void Transaction::erase_bond(const bond_id_t& id) {
    bond_writes_[id] = std::nullopt;
}

void Transaction::emit(EventPayload payload) {
    pending_events_.push_back(std::move(payload));
}

void Transaction::commit() {
    if (!is_open()) {
        throw std::logic_error("transaction already closed");
    }

    for (const auto& [pool, points] : pool_writes_) {
        state_.set_slash_points(pool, points);
    }
    for (const auto& [id, bond] : bond_writes_) {
        if (bond) {
            state_.put_bond(id, *bond);
        } else {
            state_.erase_bond(id);
        }
    }

    tokens_.commit_scope();
    committed_ = true;

    // Listeners observe the post-commit state
    events_.append_all(std::move(pending_events_));
    pending_events_.clear();

    PLEDGE_LOG_TRACE(log::state) << "Committed " << staged_write_count()
                                 << " table writes";
}

void Transaction::rollback() {
    if (!is_open()) {
        return;
    }

    tokens_.revert_scope();
    pool_writes_.clear();
    bond_writes_.clear();
    pending_events_.clear();
    rolled_back_ = true;

    PLEDGE_LOG_TRACE(log::state) << "Rolled back transaction";
}

}  // namespace pledge
