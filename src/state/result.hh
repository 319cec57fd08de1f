#pragma once

#include "core/types.hh"
#include <string_view>

namespace pledge {

// ============================================================================
// Ledger Result Codes
// ============================================================================
//
// Every rejection is a precondition failure detected before anything is
// applied; the operation leaves no trace in ledger state, event log or token
// balances.

enum class LedgerResult : std::uint8_t {
    SUCCESS = 0x00,
    NOT_AUTHORIZED = 0x01,         // slash by someone other than the authority
    POINTS_TOO_HIGH = 0x02,        // slash would push the pool past MAX_SLASH
    BOND_ALREADY_ACTIVE = 0x03,    // add onto an id that is still active
    POOL_FULLY_SLASHED = 0x04,     // add into a pool at MAX_SLASH
    BOND_NOT_ACTIVE = 0x05,        // no such bond, or unbond already requested
    BOND_NOT_UNLOCKED = 0x06,      // unbond before request or before unlock time
    POOL_ID_MISMATCH = 0x07,       // replacement moves to another pool
    NEW_BOND_TOO_SMALL = 0x08,     // replacement smaller than the current payout
    TRANSFER_FAILED = 0x09,        // token reverted or returned false
    ARITHMETIC_OVERFLOW = 0x0A,
};

[[nodiscard]] inline std::string_view ledger_result_string(LedgerResult result) {
    switch (result) {
        case LedgerResult::SUCCESS: return "success";
        case LedgerResult::NOT_AUTHORIZED: return "not_authorized";
        case LedgerResult::POINTS_TOO_HIGH: return "points_too_high";
        case LedgerResult::BOND_ALREADY_ACTIVE: return "bond_already_active";
        case LedgerResult::POOL_FULLY_SLASHED: return "pool_fully_slashed";
        case LedgerResult::BOND_NOT_ACTIVE: return "bond_not_active";
        case LedgerResult::BOND_NOT_UNLOCKED: return "bond_not_unlocked";
        case LedgerResult::POOL_ID_MISMATCH: return "pool_id_mismatch";
        case LedgerResult::NEW_BOND_TOO_SMALL: return "new_bond_too_small";
        case LedgerResult::TRANSFER_FAILED: return "transfer_failed";
        case LedgerResult::ARITHMETIC_OVERFLOW: return "arithmetic_overflow";
    }
    return "unknown";
}

// ============================================================================
// Call Context - supplied by the execution environment for every operation
// ============================================================================

struct CallContext {
    Address caller;
    unix_time_t now = 0;
};

}  // namespace pledge
