#include <gtest/gtest.h>
#include "state/transaction.hh"
#include <stdexcept>

namespace pledge {
namespace {

class TransactionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.token.bytes[0] = 0x70;
        config_.authority.bytes[0] = 0xAA;
        config_.instance.bytes[0] = 0x1A;
        state_.emplace(config_);

        alice_.bytes[0] = 0xA1;
        pool_.bytes[0] = 0x90;
        id_.fill(0x44);
        ASSERT_EQ(tokens_.mint(config_.token, alice_, 100), TokenBook::MintResult::SUCCESS);
    }

    LedgerConfig config_;
    std::optional<LedgerState> state_;
    EventLog events_;
    TokenBook tokens_;
    Address alice_;
    PoolId pool_;
    bond_id_t id_{};
};

TEST_F(TransactionTest, ReadsSeeStagedWrites) {
    Transaction tx(*state_, events_, tokens_);

    tx.set_slash_points(pool_, 50);
    EXPECT_EQ(tx.slash_points(pool_), 50u);
    EXPECT_EQ(state_->slash_points(pool_), 0u);

    BondState bond;
    bond.active = true;
    tx.put_bond(id_, bond);
    EXPECT_TRUE(tx.bond(id_).has_value());
    EXPECT_FALSE(state_->bond(id_).has_value());

    tx.erase_bond(id_);
    EXPECT_FALSE(tx.bond(id_).has_value());
    EXPECT_EQ(tx.staged_write_count(), 2u);
}

TEST_F(TransactionTest, CommitAppliesWritesAndEvents) {
    BondState stale;
    stale.active = true;
    state_->put_bond(id_, stale);

    {
        Transaction tx(*state_, events_, tokens_);
        tx.set_slash_points(pool_, 75);
        tx.erase_bond(id_);
        tx.emit(SlashApplied{pool_, 75, 9});
        EXPECT_TRUE(events_.empty());

        tx.commit();
        EXPECT_FALSE(tx.is_open());
    }

    EXPECT_EQ(state_->slash_points(pool_), 75u);
    EXPECT_FALSE(state_->bond(id_).has_value());
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_.events()[0].type(), EventType::SLASH_APPLIED);
}

TEST_F(TransactionTest, ListenersObserveCommittedState) {
    slash_points_t observed = 0;
    events_.subscribe([&](const LedgerEvent&) { observed = state_->slash_points(pool_); });

    Transaction tx(*state_, events_, tokens_);
    tx.set_slash_points(pool_, 33);
    tx.emit(SlashApplied{pool_, 33, 1});
    tx.commit();

    EXPECT_EQ(observed, 33u);
}

TEST_F(TransactionTest, RollbackUndoesTokenMovements) {
    {
        Transaction tx(*state_, events_, tokens_);
        ASSERT_TRUE(safe_transfer(tx.tokens(), config_.token, alice_, config_.instance, 60));
        EXPECT_EQ(tokens_.balance_of(config_.token, config_.instance), 60u);

        tx.set_slash_points(pool_, 1);
        tx.emit(SlashApplied{pool_, 1, 1});
        tx.rollback();
        EXPECT_FALSE(tx.is_open());
    }

    EXPECT_EQ(tokens_.balance_of(config_.token, alice_), 100u);
    EXPECT_EQ(tokens_.balance_of(config_.token, config_.instance), 0u);
    EXPECT_EQ(state_->slash_points(pool_), 0u);
    EXPECT_TRUE(events_.empty());
}

TEST_F(TransactionTest, DestructorRollsBackOpenTransaction) {
    {
        Transaction tx(*state_, events_, tokens_);
        ASSERT_TRUE(safe_transfer(tx.tokens(), config_.token, alice_, config_.instance, 40));
        tx.set_slash_points(pool_, 2);
    }

    EXPECT_EQ(tokens_.balance_of(config_.token, alice_), 100u);
    EXPECT_EQ(state_->slash_points(pool_), 0u);
}

TEST_F(TransactionTest, CommitKeepsTokenMovements) {
    {
        Transaction tx(*state_, events_, tokens_);
        ASSERT_TRUE(safe_transfer(tx.tokens(), config_.token, alice_, config_.instance, 40));
        tx.commit();
    }
    EXPECT_EQ(tokens_.balance_of(config_.token, config_.instance), 40u);
    EXPECT_EQ(tokens_.journal_size(), 0u);
    EXPECT_EQ(tokens_.scope_depth(), 0u);
}

TEST_F(TransactionTest, ThrowingListenerDoesNotSplitCommit) {
    std::size_t seen = 0;
    events_.subscribe([](const LedgerEvent&) { throw std::runtime_error("listener failed"); });
    events_.subscribe([&seen](const LedgerEvent&) { ++seen; });

    {
        Transaction tx(*state_, events_, tokens_);
        ASSERT_TRUE(safe_transfer(tx.tokens(), config_.token, alice_, config_.instance, 10));
        tx.set_slash_points(pool_, 20);
        tx.emit(SlashApplied{pool_, 10, 1});
        tx.emit(SlashApplied{pool_, 20, 1});
        EXPECT_NO_THROW(tx.commit());
    }

    EXPECT_EQ(state_->slash_points(pool_), 20u);
    EXPECT_EQ(events_.size(), 2u);
    EXPECT_EQ(seen, 2u);
    EXPECT_EQ(tokens_.balance_of(config_.token, config_.instance), 10u);
}

TEST_F(TransactionTest, CommitTwiceThrows) {
    Transaction tx(*state_, events_, tokens_);
    tx.commit();
    EXPECT_THROW(tx.commit(), std::logic_error);

    Transaction rolled(*state_, events_, tokens_);
    rolled.rollback();
    EXPECT_THROW(rolled.commit(), std::logic_error);
}

}  // namespace
}  // namespace pledge
