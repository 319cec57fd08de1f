#include <gtest/gtest.h>
#include "state/bond.hh"
#include "crypto/hash.hh"

namespace pledge {
namespace {

class BondIdTest : public ::testing::Test {
protected:
    void SetUp() override {
        instance_.bytes[0] = 0x1A;
        owner_.bytes[0] = 0x0B;
        intent_.amount = 1000;
        intent_.pool_id.bytes[0] = 0x90;
        intent_.nonce = 7;
    }

    Address instance_;
    Address owner_;
    BondIntent intent_;
};

TEST_F(BondIdTest, Deterministic) {
    EXPECT_EQ(derive_bond_id(instance_, owner_, intent_),
              derive_bond_id(instance_, owner_, intent_));
}

TEST_F(BondIdTest, EveryFieldChangesId) {
    auto base = derive_bond_id(instance_, owner_, intent_);

    Address other_instance = instance_;
    other_instance.bytes[1] = 1;
    EXPECT_NE(derive_bond_id(other_instance, owner_, intent_), base);

    Address other_owner = owner_;
    other_owner.bytes[1] = 1;
    EXPECT_NE(derive_bond_id(instance_, other_owner, intent_), base);

    BondIntent changed = intent_;
    changed.amount += 1;
    EXPECT_NE(derive_bond_id(instance_, owner_, changed), base);

    changed = intent_;
    changed.pool_id.bytes[31] = 1;
    EXPECT_NE(derive_bond_id(instance_, owner_, changed), base);

    changed = intent_;
    changed.nonce += 1;
    EXPECT_NE(derive_bond_id(instance_, owner_, changed), base);
}

TEST_F(BondIdTest, MatchesDocumentedPreimage) {
    SHA3Hasher hasher;
    hasher.update(std::string_view("pledge.bond.v1"));
    hasher.update(instance_.bytes);
    hasher.update(owner_.bytes);
    hasher.update_amount(intent_.amount);
    hasher.update(intent_.pool_id.bytes);
    hasher.update_u64(intent_.nonce);

    EXPECT_EQ(derive_bond_id(instance_, owner_, intent_), hasher.finalize());
}

TEST_F(BondIdTest, HexForm) {
    auto hex = bond_id_to_hex(derive_bond_id(instance_, owner_, intent_));
    EXPECT_EQ(hex.size(), 66u);
    EXPECT_TRUE(hex.starts_with("0x"));
}

// ============================================================================
// BondState
// ============================================================================

TEST(BondStateTest, Defaults) {
    BondState state;
    EXPECT_FALSE(state.active);
    EXPECT_FALSE(state.unbond_requested());
    EXPECT_FALSE(state.is_unlocked(~unix_time_t{0}));
}

TEST(BondStateTest, UnlockIsStrictlyAfter) {
    BondState state;
    state.active = true;
    state.will_unlock = 5000;

    EXPECT_TRUE(state.unbond_requested());
    EXPECT_FALSE(state.is_unlocked(4999));
    EXPECT_FALSE(state.is_unlocked(5000));
    EXPECT_TRUE(state.is_unlocked(5001));
}

TEST(BondStateTest, SerializeLayout) {
    BondState state;
    state.active = true;
    state.slashed_at_start = 0x0102;
    state.will_unlock = 0x0304;

    auto bytes = state.serialize();
    ASSERT_EQ(bytes.size(), BondState::SERIALIZED_SIZE);
    EXPECT_EQ(bytes.size(), 17u);
    EXPECT_EQ(bytes[0], 1);
    EXPECT_EQ(decode_u64(bytes.data() + 1), 0x0102u);
    EXPECT_EQ(decode_u64(bytes.data() + 9), 0x0304u);

    auto restored = BondState::deserialize(bytes);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, state);
}

TEST(BondStateTest, DeserializeRejectsMalformed) {
    BondState state;
    state.active = true;
    auto bytes = state.serialize();

    EXPECT_FALSE(BondState::deserialize(std::span<const std::uint8_t>(bytes.data(), 16)).has_value());

    auto bad_flag = bytes;
    bad_flag[0] = 2;
    EXPECT_FALSE(BondState::deserialize(bad_flag).has_value());

    auto fully_slashed = bytes;
    encode_u64(fully_slashed.data() + 1, MAX_SLASH);
    EXPECT_FALSE(BondState::deserialize(fully_slashed).has_value());

    auto trailing = bytes;
    trailing.push_back(0);
    EXPECT_FALSE(BondState::deserialize(trailing).has_value());
}

}  // namespace
}  // namespace pledge
