#pragma once

#include "core/types.hh"
#include <limits>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pledge {

// ============================================================================
// Transfer Outcome
// ============================================================================
//
// What the underlying token reported for a single call. Tokens differ in how
// they signal success: most return true, some return nothing at all, and some
// return false instead of reverting.

enum class TransferOutcome : std::uint8_t {
    REVERTED = 0,
    RETURNED_FALSE = 1,
    RETURNED_TRUE = 2,
    NO_RETURN = 3,
};

[[nodiscard]] inline std::string_view transfer_outcome_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::REVERTED: return "reverted";
        case TransferOutcome::RETURNED_FALSE: return "returned_false";
        case TransferOutcome::RETURNED_TRUE: return "returned_true";
        case TransferOutcome::NO_RETURN: return "no_return";
    }
    return "unknown";
}

// Success is either an explicit true or an empty return
[[nodiscard]] constexpr bool transfer_succeeded(TransferOutcome outcome) {
    return outcome == TransferOutcome::RETURNED_TRUE || outcome == TransferOutcome::NO_RETURN;
}

// ============================================================================
// Token Accounts Interface
// ============================================================================

class TokenAccounts {
public:
    virtual ~TokenAccounts() = default;

    // Move `amount` of `token` from `from` to `to` using the allowance `from`
    // granted to `spender`.
    virtual TransferOutcome transfer_from(
        const Address& token,
        const Address& spender,
        const Address& from,
        const Address& to,
        amount_t amount) = 0;

    // Move `amount` of `token` held by `sender` to `to`.
    virtual TransferOutcome transfer(
        const Address& token,
        const Address& sender,
        const Address& to,
        amount_t amount) = 0;

    // Undo scope owned by the calling thread. Other threads wait on the
    // accounts until the scope is committed or reverted. Scopes nest; only
    // the outermost commit makes movements permanent.
    virtual void begin_scope() = 0;
    virtual void commit_scope() = 0;
    virtual void revert_scope() = 0;
};

// Wrappers that accept both success conventions and log every failure
[[nodiscard]] bool safe_transfer_from(
    TokenAccounts& accounts,
    const Address& token,
    const Address& spender,
    const Address& from,
    const Address& to,
    amount_t amount);

[[nodiscard]] bool safe_transfer(
    TokenAccounts& accounts,
    const Address& token,
    const Address& sender,
    const Address& to,
    amount_t amount);

// ============================================================================
// Token Book - in-memory journaled balances for any number of tokens
// ============================================================================

class TokenBook : public TokenAccounts {
public:
    // How a token reports results
    enum class Signaling : std::uint8_t {
        STANDARD,          // true on success, reverts on failure
        NO_RETURN,         // nothing on success, reverts on failure
        FALSE_ON_FAILURE,  // true on success, false on failure
    };

    static inline const amount_t UNLIMITED_ALLOWANCE = std::numeric_limits<amount_t>::max();

    TokenBook() = default;

    TransferOutcome transfer_from(
        const Address& token,
        const Address& spender,
        const Address& from,
        const Address& to,
        amount_t amount) override;

    TransferOutcome transfer(
        const Address& token,
        const Address& sender,
        const Address& to,
        amount_t amount) override;

    void begin_scope() override;
    void commit_scope() override;
    void revert_scope() override;

    // Setup
    enum class MintResult {
        SUCCESS,
        ZERO_RECIPIENT,
        SUPPLY_OVERFLOW,
    };
    MintResult mint(const Address& token, const Address& to, amount_t amount);
    void approve(const Address& token, const Address& owner, const Address& spender, amount_t amount);

    // Token behaviour
    void set_signaling(const Address& token, Signaling signaling);
    void set_refuse_zero_recipient(const Address& token, bool refuse);
    void freeze_account(const Address& token, const Address& account);

    // Queries
    [[nodiscard]] amount_t balance_of(const Address& token, const Address& account) const;
    [[nodiscard]] amount_t allowance(const Address& token, const Address& owner, const Address& spender) const;
    [[nodiscard]] amount_t total_supply(const Address& token) const;
    // Undo entries held by open scopes; zero when no scope is open
    [[nodiscard]] std::size_t journal_size() const;
    [[nodiscard]] std::size_t scope_depth() const;

private:
    // Balances, allowances and supply share one journaled table
    enum class Kind : std::uint8_t { BALANCE, ALLOWANCE, SUPPLY };

    struct HoldingKey {
        Kind kind;
        Address token;
        Address account;
        Address spender;

        auto operator<=>(const HoldingKey&) const = default;

        struct Hash {
            std::size_t operator()(const HoldingKey& k) const {
                std::size_t h = std::hash<Address>{}(k.token) + static_cast<std::size_t>(k.kind);
                h ^= std::hash<Address>{}(k.account) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
                h ^= std::hash<Address>{}(k.spender) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
                return h;
            }
        };
    };

    struct JournalEntry {
        HoldingKey key;
        amount_t previous;
    };

    struct TokenRules {
        Signaling signaling = Signaling::STANDARD;
        bool refuse_zero_recipient = false;
        std::unordered_set<Address> frozen;
    };

    std::unordered_map<HoldingKey, amount_t, HoldingKey::Hash> holdings_;
    std::unordered_map<Address, TokenRules> rules_;
    std::vector<JournalEntry> journal_;
    std::vector<std::size_t> scope_marks_;  // journal position at each begin_scope

    // Held for the whole lifetime of an open scope
    mutable std::recursive_mutex mutex_;

    [[nodiscard]] amount_t get(const HoldingKey& key) const;
    void set(const HoldingKey& key, amount_t value);
    [[nodiscard]] TransferOutcome failure(const Address& token) const;
    [[nodiscard]] TransferOutcome success(const Address& token) const;

    // Called with mutex_ held
    TransferOutcome move(const Address& token, const Address& from, const Address& to, amount_t amount);
};

}  // namespace pledge
