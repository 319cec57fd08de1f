#include <gtest/gtest.h>
#include "state/slash_registry.hh"

namespace pledge {
namespace {

class SlashRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        LedgerConfig config;
        config.token.bytes[0] = 0x70;
        config.authority.bytes[0] = 0xAA;
        config.instance.bytes[0] = 0x1A;
        state_.emplace(config);

        authority_ = {config.authority, 1000};
        pool_.bytes[0] = 0x90;
    }

    LedgerResult slash(const CallContext& ctx, const PoolId& pool, slash_points_t points) {
        Transaction tx(*state_, events_, tokens_);
        auto result = registry_.slash(tx, ctx, pool, points);
        if (result == LedgerResult::SUCCESS) {
            tx.commit();
        }
        return result;
    }

    std::optional<LedgerState> state_;
    EventLog events_;
    TokenBook tokens_;
    SlashRegistry registry_;
    CallContext authority_;
    PoolId pool_;
};

TEST_F(SlashRegistryTest, AccumulatesPoints) {
    EXPECT_EQ(slash(authority_, pool_, 100), LedgerResult::SUCCESS);
    EXPECT_EQ(slash(authority_, pool_, 250), LedgerResult::SUCCESS);
    EXPECT_EQ(SlashRegistry::slash_points(*state_, pool_), 350u);

    auto applied = events_.of_type(EventType::SLASH_APPLIED);
    ASSERT_EQ(applied.size(), 2u);
    const auto& last = std::get<SlashApplied>(applied[1].payload);
    EXPECT_EQ(last.pool_id, pool_);
    EXPECT_EQ(last.new_total, 350u);
    EXPECT_EQ(last.time, 1000u);
}

TEST_F(SlashRegistryTest, PoolsAreIndependent) {
    PoolId other = pool_;
    other.bytes[1] = 1;

    EXPECT_EQ(slash(authority_, pool_, 5), LedgerResult::SUCCESS);
    EXPECT_EQ(SlashRegistry::slash_points(*state_, other), 0u);
}

TEST_F(SlashRegistryTest, OnlyAuthorityMaySlash) {
    CallContext stranger{Address{}, 1000};
    stranger.caller.bytes[0] = 0x55;

    EXPECT_EQ(slash(stranger, pool_, 1), LedgerResult::NOT_AUTHORIZED);
    EXPECT_EQ(SlashRegistry::slash_points(*state_, pool_), 0u);
    EXPECT_TRUE(events_.empty());
}

TEST_F(SlashRegistryTest, CapIsInclusive) {
    EXPECT_EQ(slash(authority_, pool_, MAX_SLASH), LedgerResult::SUCCESS);
    EXPECT_EQ(slash(authority_, pool_, 1), LedgerResult::POINTS_TOO_HIGH);
    EXPECT_EQ(SlashRegistry::slash_points(*state_, pool_), MAX_SLASH);
}

TEST_F(SlashRegistryTest, RejectsPastCapAndOverflow) {
    EXPECT_EQ(slash(authority_, pool_, MAX_SLASH + 1), LedgerResult::POINTS_TOO_HIGH);

    EXPECT_EQ(slash(authority_, pool_, 10), LedgerResult::SUCCESS);
    EXPECT_EQ(slash(authority_, pool_, ~slash_points_t{0}), LedgerResult::POINTS_TOO_HIGH);
    EXPECT_EQ(SlashRegistry::slash_points(*state_, pool_), 10u);
}

TEST_F(SlashRegistryTest, ZeroSlashStillRecorded) {
    EXPECT_EQ(slash(authority_, pool_, 0), LedgerResult::SUCCESS);
    EXPECT_EQ(events_.size(), 1u);
}

}  // namespace
}  // namespace pledge
