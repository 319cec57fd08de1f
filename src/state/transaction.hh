#pragma once

#include "state/events.hh"
#include "state/ledger_state.hh"
#include "token/token.hh"
#include <optional>
#include <unordered_map>
#include <vector>

namespace pledge {

// ============================================================================
// Transaction - validate-then-commit wrapper around one ledger operation
// ============================================================================
//
// Table writes and events are staged and only reach LedgerState / EventLog on
// commit(). Reads go through the stage first. Token movements happen
// immediately inside a token scope opened at construction; the scope keeps
// other threads off the accounts and is reverted unless the transaction
// commits.

class Transaction {
public:
    Transaction(LedgerState& state, EventLog& events, TokenAccounts& tokens);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] const LedgerConfig& config() const { return state_.config(); }
    [[nodiscard]] TokenAccounts& tokens() { return tokens_; }

    // Reads (staged writes win)
    [[nodiscard]] slash_points_t slash_points(const PoolId& pool) const;
    [[nodiscard]] std::optional<BondState> bond(const bond_id_t& id) const;

    // Staged writes
    void set_slash_points(const PoolId& pool, slash_points_t points);
    void put_bond(const bond_id_t& id, const BondState& state);
    void erase_bond(const bond_id_t& id);
    void emit(EventPayload payload);

    // Apply everything; a transaction commits at most once
    void commit();

    // Drop the stage and undo token movements now instead of at destruction
    void rollback();

    [[nodiscard]] bool is_open() const { return !committed_ && !rolled_back_; }
    [[nodiscard]] std::size_t staged_write_count() const {
        return pool_writes_.size() + bond_writes_.size();
    }

private:
    LedgerState& state_;
    EventLog& events_;
    TokenAccounts& tokens_;

    std::unordered_map<PoolId, slash_points_t> pool_writes_;
    std::unordered_map<bond_id_t, std::optional<BondState>> bond_writes_;  // nullopt = erase
    std::vector<EventPayload> pending_events_;

    bool committed_ = false;
    bool rolled_back_ = false;
};

}  // namespace pledge
