#include "events.hh"
#include "core/logging.hh"
#include <algorithm>
#include <exception>
#include <sstream>
#include <type_traits>

namespace pledge {

namespace {

// Bounds-checked cursor over an encoded record
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data)
        : ptr_(data.data()), end_(data.data() + data.size()) {}

    bool u8(std::uint8_t& out) {
        if (ptr_ + 1 > end_) return false;
        out = *ptr_++;
        return true;
    }

    bool u64(std::uint64_t& out) {
        if (ptr_ + sizeof(std::uint64_t) > end_) return false;
        out = decode_u64(ptr_);
        ptr_ += sizeof(std::uint64_t);
        return true;
    }

    bool amount(amount_t& out) {
        if (ptr_ + AMOUNT_SIZE > end_) return false;
        out = decode_amount(ptr_);
        ptr_ += AMOUNT_SIZE;
        return true;
    }

    bool bytes(hash_t& out) {
        if (ptr_ + HASH_SIZE > end_) return false;
        std::copy(ptr_, ptr_ + HASH_SIZE, out.begin());
        ptr_ += HASH_SIZE;
        return true;
    }

    [[nodiscard]] bool at_end() const { return ptr_ == end_; }

private:
    const std::uint8_t* ptr_;
    const std::uint8_t* end_;
};

std::string short_hex(const hash_t& bytes) {
    return "0x" + bytes_to_hex(std::span<const std::uint8_t>(bytes.data(), 4));
}

}  // namespace

// ============================================================================
// LedgerEvent Implementation
// ============================================================================

EventType LedgerEvent::type() const {
    return std::visit([](const auto& e) -> EventType {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SlashApplied>) {
            return EventType::SLASH_APPLIED;
        } else if constexpr (std::is_same_v<T, BondAdded>) {
            return EventType::BOND_ADDED;
        } else if constexpr (std::is_same_v<T, UnbondRequested>) {
            return EventType::UNBOND_REQUESTED;
        } else {
            return EventType::UNBONDED;
        }
    }, payload);
}

std::string LedgerEvent::to_string() const {
    std::ostringstream oss;
    oss << "#" << sequence << " " << event_type_string(type()) << "{";

    std::visit([&oss](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SlashApplied>) {
            oss << "pool=" << short_hex(e.pool_id.bytes)
                << " new_total=" << e.new_total;
        } else if constexpr (std::is_same_v<T, BondAdded>) {
            oss << "owner=" << short_hex(e.owner.bytes)
                << " amount=" << e.amount
                << " pool=" << short_hex(e.pool_id.bytes)
                << " nonce=" << e.nonce
                << " slashed_at_start=" << e.slashed_at_start;
        } else if constexpr (std::is_same_v<T, UnbondRequested>) {
            oss << "owner=" << short_hex(e.owner.bytes)
                << " bond=" << short_hex(e.bond_id)
                << " will_unlock=" << e.will_unlock;
        } else {
            oss << "owner=" << short_hex(e.owner.bytes)
                << " bond=" << short_hex(e.bond_id);
        }
        oss << " time=" << e.time;
    }, payload);

    oss << "}";
    return oss.str();
}

std::vector<std::uint8_t> LedgerEvent::serialize() const {
    std::vector<std::uint8_t> result;
    result.push_back(static_cast<std::uint8_t>(type()));
    append_u64(result, sequence);

    std::visit([&result](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SlashApplied>) {
            append_bytes(result, e.pool_id.bytes);
            append_u64(result, e.new_total);
        } else if constexpr (std::is_same_v<T, BondAdded>) {
            append_bytes(result, e.owner.bytes);
            append_amount(result, e.amount);
            append_bytes(result, e.pool_id.bytes);
            append_u64(result, e.nonce);
            append_u64(result, e.slashed_at_start);
        } else if constexpr (std::is_same_v<T, UnbondRequested>) {
            append_bytes(result, e.owner.bytes);
            append_bytes(result, e.bond_id);
            append_u64(result, e.will_unlock);
        } else {
            append_bytes(result, e.owner.bytes);
            append_bytes(result, e.bond_id);
        }
        append_u64(result, e.time);
    }, payload);

    return result;
}

std::optional<LedgerEvent> LedgerEvent::deserialize(std::span<const std::uint8_t> data) {
    Reader in(data);
    LedgerEvent event;

    std::uint8_t tag = 0;
    if (!in.u8(tag) || !in.u64(event.sequence)) {
        return std::nullopt;
    }

    switch (static_cast<EventType>(tag)) {
        case EventType::SLASH_APPLIED: {
            SlashApplied e;
            if (!in.bytes(e.pool_id.bytes) || !in.u64(e.new_total) || !in.u64(e.time)) {
                return std::nullopt;
            }
            event.payload = e;
            break;
        }
        case EventType::BOND_ADDED: {
            BondAdded e;
            if (!in.bytes(e.owner.bytes) || !in.amount(e.amount) || !in.bytes(e.pool_id.bytes) ||
                !in.u64(e.nonce) || !in.u64(e.slashed_at_start) || !in.u64(e.time)) {
                return std::nullopt;
            }
            event.payload = e;
            break;
        }
        case EventType::UNBOND_REQUESTED: {
            UnbondRequested e;
            if (!in.bytes(e.owner.bytes) || !in.bytes(e.bond_id) ||
                !in.u64(e.will_unlock) || !in.u64(e.time)) {
                return std::nullopt;
            }
            event.payload = e;
            break;
        }
        case EventType::UNBONDED: {
            Unbonded e;
            if (!in.bytes(e.owner.bytes) || !in.bytes(e.bond_id) || !in.u64(e.time)) {
                return std::nullopt;
            }
            event.payload = e;
            break;
        }
        default:
            return std::nullopt;
    }

    if (!in.at_end()) {
        return std::nullopt;
    }
    return event;
}

// ============================================================================
// EventLog Implementation
// ============================================================================

const LedgerEvent& EventLog::append(EventPayload payload) {
    std::vector<EventPayload> batch;
    batch.push_back(std::move(payload));
    append_all(std::move(batch));
    return events_.back();
}

void EventLog::append_all(std::vector<EventPayload> payloads) {
    std::size_t first = events_.size();
    events_.reserve(first + payloads.size());

    for (auto& payload : payloads) {
        LedgerEvent event;
        event.sequence = events_.size();
        event.payload = std::move(payload);
        events_.push_back(std::move(event));
        PLEDGE_LOG_DEBUG(log::events) << events_.back().to_string();
    }

    // Notify outside the append loop so a failing listener cannot truncate the batch
    for (std::size_t i = first; i < events_.size(); ++i) {
        for (const auto& [handle, listener] : listeners_) {
            try {
                listener(events_[i]);
            } catch (const std::exception& e) {
                log::events.warn() << "Listener " << handle << " failed on event #"
                                   << events_[i].sequence << ": " << e.what();
            }
        }
    }
}

std::size_t EventLog::subscribe(Listener listener) {
    std::size_t handle = next_handle_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

void EventLog::unsubscribe(std::size_t handle) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [handle](const auto& entry) { return entry.first == handle; }),
        listeners_.end());
}

std::vector<LedgerEvent> EventLog::since(std::uint64_t from) const {
    if (from >= events_.size()) {
        return {};
    }
    return std::vector<LedgerEvent>(events_.begin() + static_cast<std::ptrdiff_t>(from), events_.end());
}

std::vector<LedgerEvent> EventLog::of_type(EventType type) const {
    std::vector<LedgerEvent> result;
    for (const auto& event : events_) {
        if (event.type() == type) {
            result.push_back(event);
        }
    }
    return result;
}

}  // namespace pledge
