#pragma once

#include "state/bond_ledger.hh"
#include "state/events.hh"
#include "state/ledger_state.hh"
#include "state/result.hh"
#include "state/slash_registry.hh"
#include "token/token.hh"
#include <mutex>
#include <optional>

namespace pledge {

// ============================================================================
// Ledger - one bonding ledger instance
// ============================================================================
//
// Owns the state tables and the event log, borrows the token accounts. Every
// public operation takes the instance mutex, runs in its own Transaction and
// commits only on SUCCESS, so callers never observe a partial operation.

class Ledger {
public:
    // Throws std::invalid_argument when config is invalid
    Ledger(LedgerConfig config, TokenAccounts& tokens);

    // Resume from a snapshot; the event log starts empty
    Ledger(LedgerState state, TokenAccounts& tokens);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // Slash Registry
    LedgerResult slash(const CallContext& ctx, const PoolId& pool, slash_points_t points);

    // Bond Ledger
    LedgerResult add_bond(const CallContext& ctx, const BondIntent& intent);
    LedgerResult request_unbond(const CallContext& ctx, const BondIntent& intent);
    LedgerResult unbond(const CallContext& ctx, const BondIntent& intent);
    LedgerResult replace_bond(const CallContext& ctx,
                              const BondIntent& old_intent,
                              const BondIntent& new_intent);

    // Queries
    [[nodiscard]] slash_points_t get_slash_points(const PoolId& pool) const;
    [[nodiscard]] amount_t get_withdraw_amount(const Address& owner, const BondIntent& intent) const;
    [[nodiscard]] bond_id_t bond_id(const Address& owner, const BondIntent& intent) const;
    [[nodiscard]] std::optional<BondState> get_bond(const bond_id_t& id) const;
    [[nodiscard]] bool is_active(const bond_id_t& id) const;
    [[nodiscard]] std::size_t bond_count() const;

    [[nodiscard]] const LedgerConfig& config() const { return state_.config(); }

    // Persistence
    [[nodiscard]] std::vector<std::uint8_t> snapshot() const;
    [[nodiscard]] hash_t state_root() const;

    // The log is append-only. Reads return copies taken under the ledger lock.
    [[nodiscard]] std::vector<LedgerEvent> events_since(std::uint64_t from) const;
    [[nodiscard]] std::vector<LedgerEvent> events_of_type(EventType type) const;
    [[nodiscard]] std::size_t event_count() const;

    // Listeners run after each commit, under the ledger lock, and must not
    // call back into the Ledger.
    std::size_t subscribe(EventLog::Listener listener);
    void unsubscribe(std::size_t handle);

private:
    LedgerState state_;
    EventLog events_;
    TokenAccounts& tokens_;
    SlashRegistry registry_;
    BondLedger bonds_;
    mutable std::mutex mutex_;

    template<typename Op>
    LedgerResult run(std::string_view name, const CallContext& ctx, Op&& op);
};

}  // namespace pledge
