#include "token.hh"
#include "core/logging.hh"
#include "core/safe_math.hh"
#include <stdexcept>

namespace pledge {

// ============================================================================
// Safe Transfer Wrappers
// ============================================================================

bool safe_transfer_from(
    TokenAccounts& accounts,
    const Address& token,
    const Address& spender,
    const Address& from,
    const Address& to,
    amount_t amount) {

    auto outcome = accounts.transfer_from(token, spender, from, to, amount);
    if (!transfer_succeeded(outcome)) {
        PLEDGE_LOG_WARN(log::token) << "transfer_from of " << amount << " from "
                                    << from.to_hex() << " failed: "
                                    << transfer_outcome_string(outcome);
        return false;
    }
    return true;
}

bool safe_transfer(
    TokenAccounts& accounts,
    const Address& token,
    const Address& sender,
    const Address& to,
    amount_t amount) {

    auto outcome = accounts.transfer(token, sender, to, amount);
    if (!transfer_succeeded(outcome)) {
        PLEDGE_LOG_WARN(log::token) << "transfer of " << amount << " to "
                                    << to.to_hex() << " failed: "
                                    << transfer_outcome_string(outcome);
        return false;
    }
    return true;
}

// ============================================================================
// TokenBook Implementation
// ============================================================================

amount_t TokenBook::get(const HoldingKey& key) const {
    auto it = holdings_.find(key);
    return it == holdings_.end() ? 0 : it->second;
}

void TokenBook::set(const HoldingKey& key, amount_t value) {
    if (!scope_marks_.empty()) {
        journal_.push_back(JournalEntry{key, get(key)});
    }
    if (value == 0) {
        holdings_.erase(key);
    } else {
        holdings_[key] = value;
    }
}

TransferOutcome TokenBook::failure(const Address& token) const {
    auto it = rules_.find(token);
    if (it != rules_.end() && it->second.signaling == Signaling::FALSE_ON_FAILURE) {
        return TransferOutcome::RETURNED_FALSE;
    }
    return TransferOutcome::REVERTED;
}

TransferOutcome TokenBook::success(const Address& token) const {
    auto it = rules_.find(token);
    if (it != rules_.end() && it->second.signaling == Signaling::NO_RETURN) {
        return TransferOutcome::NO_RETURN;
    }
    return TransferOutcome::RETURNED_TRUE;
}

TransferOutcome TokenBook::move(
    const Address& token,
    const Address& from,
    const Address& to,
    amount_t amount) {

    auto rules_it = rules_.find(token);
    if (rules_it != rules_.end()) {
        const auto& rules = rules_it->second;
        if (rules.refuse_zero_recipient && to.is_zero()) {
            return failure(token);
        }
        if (rules.frozen.count(from) || rules.frozen.count(to)) {
            return failure(token);
        }
    }

    HoldingKey from_key{Kind::BALANCE, token, from, {}};
    HoldingKey to_key{Kind::BALANCE, token, to, {}};

    auto from_balance = checked_sub(get(from_key), amount);
    if (!from_balance) {
        return failure(token);
    }

    if (from == to) {
        return success(token);
    }

    auto to_balance = checked_add(get(to_key), amount);
    if (!to_balance) {
        return failure(token);
    }

    set(from_key, *from_balance);
    set(to_key, *to_balance);
    return success(token);
}

TransferOutcome TokenBook::transfer_from(
    const Address& token,
    const Address& spender,
    const Address& from,
    const Address& to,
    amount_t amount) {

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    HoldingKey allowance_key{Kind::ALLOWANCE, token, from, spender};
    amount_t allowed = get(allowance_key);
    if (allowed < amount) {
        return failure(token);
    }

    auto outcome = move(token, from, to, amount);
    if (!transfer_succeeded(outcome)) {
        return outcome;
    }

    if (allowed != UNLIMITED_ALLOWANCE) {
        set(allowance_key, allowed - amount);
    }

    PLEDGE_LOG_TRACE(log::token) << "transfer_from " << amount << " by "
                                 << spender.to_hex();
    return outcome;
}

TransferOutcome TokenBook::transfer(
    const Address& token,
    const Address& sender,
    const Address& to,
    amount_t amount) {

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return move(token, sender, to, amount);
}

void TokenBook::begin_scope() {
    mutex_.lock();
    scope_marks_.push_back(journal_.size());
}

void TokenBook::commit_scope() {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (scope_marks_.empty()) {
            throw std::logic_error("commit_scope without begin_scope");
        }
        scope_marks_.pop_back();
        if (scope_marks_.empty()) {
            journal_.clear();
        }
    }
    mutex_.unlock();
}

void TokenBook::revert_scope() {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (scope_marks_.empty()) {
            throw std::logic_error("revert_scope without begin_scope");
        }

        std::size_t mark = scope_marks_.back();
        scope_marks_.pop_back();

        std::size_t undone = 0;
        while (journal_.size() > mark) {
            const auto& entry = journal_.back();
            if (entry.previous == 0) {
                holdings_.erase(entry.key);
            } else {
                holdings_[entry.key] = entry.previous;
            }
            journal_.pop_back();
            ++undone;
        }

        if (undone > 0) {
            PLEDGE_LOG_DEBUG(log::token) << "Reverted " << undone << " token journal entries";
        }
    }
    mutex_.unlock();
}

TokenBook::MintResult TokenBook::mint(const Address& token, const Address& to, amount_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (to.is_zero()) {
        return MintResult::ZERO_RECIPIENT;
    }

    HoldingKey key{Kind::BALANCE, token, to, {}};
    HoldingKey supply_key{Kind::SUPPLY, token, {}, {}};
    auto supply = checked_add(get(supply_key), amount);
    auto balance = checked_add(get(key), amount);
    if (!supply || !balance) {
        return MintResult::SUPPLY_OVERFLOW;
    }

    set(supply_key, *supply);
    set(key, *balance);
    return MintResult::SUCCESS;
}

void TokenBook::approve(const Address& token, const Address& owner, const Address& spender, amount_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    set(HoldingKey{Kind::ALLOWANCE, token, owner, spender}, amount);
}

void TokenBook::set_signaling(const Address& token, Signaling signaling) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    rules_[token].signaling = signaling;
}

void TokenBook::set_refuse_zero_recipient(const Address& token, bool refuse) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    rules_[token].refuse_zero_recipient = refuse;
}

void TokenBook::freeze_account(const Address& token, const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    rules_[token].frozen.insert(account);
}

amount_t TokenBook::balance_of(const Address& token, const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return get(HoldingKey{Kind::BALANCE, token, account, {}});
}

amount_t TokenBook::allowance(const Address& token, const Address& owner, const Address& spender) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return get(HoldingKey{Kind::ALLOWANCE, token, owner, spender});
}

amount_t TokenBook::total_supply(const Address& token) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return get(HoldingKey{Kind::SUPPLY, token, {}, {}});
}

std::size_t TokenBook::journal_size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return journal_.size();
}

std::size_t TokenBook::scope_depth() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return scope_marks_.size();
}

}  // namespace pledge
