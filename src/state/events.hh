#pragma once

#include "core/types.hh"
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace pledge {

// ============================================================================
// Notification Records
// ============================================================================

enum class EventType : std::uint8_t {
    SLASH_APPLIED = 0x01,
    BOND_ADDED = 0x02,
    UNBOND_REQUESTED = 0x03,
    UNBONDED = 0x04,
};

[[nodiscard]] inline std::string_view event_type_string(EventType type) {
    switch (type) {
        case EventType::SLASH_APPLIED: return "SlashApplied";
        case EventType::BOND_ADDED: return "BondAdded";
        case EventType::UNBOND_REQUESTED: return "UnbondRequested";
        case EventType::UNBONDED: return "Unbonded";
    }
    return "Unknown";
}

struct SlashApplied {
    PoolId pool_id;
    slash_points_t new_total = 0;
    unix_time_t time = 0;

    bool operator==(const SlashApplied&) const = default;
};

struct BondAdded {
    Address owner;
    amount_t amount = 0;
    PoolId pool_id;
    nonce_t nonce = 0;
    slash_points_t slashed_at_start = 0;
    unix_time_t time = 0;

    bool operator==(const BondAdded&) const = default;
};

struct UnbondRequested {
    Address owner;
    bond_id_t bond_id{};
    unix_time_t will_unlock = 0;
    unix_time_t time = 0;

    bool operator==(const UnbondRequested&) const = default;
};

struct Unbonded {
    Address owner;
    bond_id_t bond_id{};
    unix_time_t time = 0;

    bool operator==(const Unbonded&) const = default;
};

using EventPayload = std::variant<SlashApplied, BondAdded, UnbondRequested, Unbonded>;

struct LedgerEvent {
    std::uint64_t sequence = 0;   // position in the log, assigned on commit
    EventPayload payload;

    [[nodiscard]] EventType type() const;
    [[nodiscard]] std::string to_string() const;

    // type(u8) || sequence(u64) || payload fields in declaration order,
    // amounts as 32 bytes. Trailing bytes are rejected.
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<LedgerEvent> deserialize(
        std::span<const std::uint8_t> data);
};

// ============================================================================
// Event Log - append-only, ordered
// ============================================================================

class EventLog {
public:
    using Listener = std::function<void(const LedgerEvent&)>;

    EventLog() = default;

    // Assigns the next sequence number and notifies listeners
    const LedgerEvent& append(EventPayload payload);

    // Appends the whole batch, then notifies listeners for each new event.
    // A listener that throws is logged and skipped; the log is unaffected.
    void append_all(std::vector<EventPayload> payloads);

    // Listeners run synchronously, in subscription order, after each append
    std::size_t subscribe(Listener listener);
    void unsubscribe(std::size_t handle);

    [[nodiscard]] const std::vector<LedgerEvent>& events() const { return events_; }
    [[nodiscard]] std::size_t size() const { return events_.size(); }
    [[nodiscard]] bool empty() const { return events_.empty(); }

    // Events with sequence >= from
    [[nodiscard]] std::vector<LedgerEvent> since(std::uint64_t from) const;

    // Events of one type, in log order
    [[nodiscard]] std::vector<LedgerEvent> of_type(EventType type) const;

private:
    std::vector<LedgerEvent> events_;
    std::vector<std::pair<std::size_t, Listener>> listeners_;
    std::size_t next_handle_ = 1;
};

}  // namespace pledge
