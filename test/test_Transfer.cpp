#include <gtest/gtest.h>
#include "Transfer.hpp"
#include "CryptoBase.hpp"

using namespace gavel;

class TransferTest : public ::testing::Test {
protected:
    Identity escrow, alice;

    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize()) << "Failed to initialize crypto libraries";
        escrow = Identity::fromLabel("escrow");
        alice = Identity::fromLabel("alice");
    }
};

// ------------------- Creación -------------------
TEST_F(TransferTest, ConstructorSetsFieldsAndHash) {
    Transfer t(escrow, alice, 98 * COIN, "refund", 100);

    EXPECT_EQ(t.getFrom(), escrow);
    EXPECT_EQ(t.getTo(), alice);
    EXPECT_EQ(t.getAmount(), 98 * COIN);
    EXPECT_EQ(t.getMemo(), "refund");
    EXPECT_EQ(t.getTimestamp(), 100u);
    EXPECT_EQ(t.getHash().size(), SHA256_HASH_SIZE);
    EXPECT_EQ(t.getHashHex(), CryptoBase::sha256(t.stringForHash()));
    EXPECT_TRUE(t.isValid());
    EXPECT_TRUE(t.involves(alice));
    EXPECT_FALSE(t.involves(Identity::fromLabel("bob")));
}

TEST_F(TransferTest, ConstructorRejectsInvalidInput) {
    EXPECT_THROW(Transfer(Identity(), alice, 1, "refund", 0), std::invalid_argument);
    EXPECT_THROW(Transfer(escrow, Identity(), 1, "refund", 0), std::invalid_argument);
    EXPECT_THROW(Transfer(escrow, alice, 0, "refund", 0), std::invalid_argument);
}

TEST_F(TransferTest, HashDependsOnEveryField) {
    Transfer base(escrow, alice, 5, "refund", 10);

    EXPECT_NE(base.getHash(), Transfer(escrow, alice, 6, "refund", 10).getHash());
    EXPECT_NE(base.getHash(), Transfer(escrow, alice, 5, "proceeds", 10).getHash());
    EXPECT_NE(base.getHash(), Transfer(escrow, alice, 5, "refund", 11).getHash());
    EXPECT_NE(base.getHash(), Transfer(alice, escrow, 5, "refund", 10).getHash());
    EXPECT_EQ(base.getHash(), Transfer(escrow, alice, 5, "refund", 10).getHash());
}

TEST_F(TransferTest, DefaultIsInvalid) {
    Transfer empty;
    EXPECT_FALSE(empty.isValid());
}

TEST_F(TransferTest, ToStringShowsCoins) {
    Transfer t(escrow, alice, 10290000000u, "proceeds", 200);
    EXPECT_NE(t.toString().find("amount=102.9"), std::string::npos);
}
