#include "slash_registry.hh"
#include "core/logging.hh"
#include "core/safe_math.hh"

namespace pledge {

LedgerResult SlashRegistry::slash(
    Transaction& tx,
    const CallContext& ctx,
    const PoolId& pool,
    slash_points_t points) const {

    if (ctx.caller != tx.config().authority) {
        PLEDGE_LOG_WARN(log::registry) << "Slash rejected: caller " << ctx.caller.to_hex()
                                       << " is not the authority";
        return LedgerResult::NOT_AUTHORIZED;
    }

    slash_points_t current = tx.slash_points(pool);

    // An overflowing sum is necessarily past the cap
    auto new_total = checked_add(current, points);
    if (!new_total || *new_total > MAX_SLASH) {
        PLEDGE_LOG_DEBUG(log::registry) << "Slash rejected: " << current << " + " << points
                                        << " exceeds " << MAX_SLASH;
        return LedgerResult::POINTS_TOO_HIGH;
    }

    tx.set_slash_points(pool, *new_total);
    tx.emit(SlashApplied{pool, *new_total, ctx.now});

    PLEDGE_LOG_INFO(log::registry) << "Pool " << pool.to_hex() << " slashed by " << points
                                   << ", total " << *new_total;
    return LedgerResult::SUCCESS;
}

}  // namespace pledge
