#include <gtest/gtest.h>
#include "InMemoryLedger.hpp"
#include "CryptoBase.hpp"
#include <memory>

using namespace gavel;

class InMemoryLedgerTest : public ::testing::Test {
protected:
    Identity escrow, alice, bob;
    std::unique_ptr<InMemoryLedger> ledger;

    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
        escrow = Identity::fromLabel("escrow");
        alice = Identity::fromLabel("alice");
        bob = Identity::fromLabel("bob");
        ledger = std::make_unique<InMemoryLedger>(escrow, 50);
    }
};

TEST_F(InMemoryLedgerTest, RequiresEscrowAccount) {
    EXPECT_THROW({ InMemoryLedger noEscrow{Identity()}; }, std::invalid_argument);
}

// ------------------- Depósitos -------------------
TEST_F(InMemoryLedgerTest, DepositMovesValueIntoEscrow) {
    ledger->fund(alice, 100);
    EXPECT_TRUE(ledger->deposit(alice, 60));
    EXPECT_EQ(ledger->balanceOf(alice), 40u);
    EXPECT_EQ(ledger->escrowBalance(), 60u);

    EXPECT_FALSE(ledger->deposit(alice, 41));
    EXPECT_FALSE(ledger->deposit(alice, 0));
    EXPECT_FALSE(ledger->deposit(bob, 1));

    EXPECT_TRUE(ledger->returnDeposit(alice, 60));
    EXPECT_EQ(ledger->balanceOf(alice), 100u);
    EXPECT_EQ(ledger->escrowBalance(), 0u);
}

// ------------------- Pagos -------------------
TEST_F(InMemoryLedgerTest, TransferPaysOutOfEscrow) {
    ledger->fund(alice, 100);
    ASSERT_TRUE(ledger->deposit(alice, 100));

    EXPECT_TRUE(ledger->transfer(bob, 30, "refund"));
    EXPECT_EQ(ledger->balanceOf(bob), 30u);
    EXPECT_EQ(ledger->escrowBalance(), 70u);
    EXPECT_EQ(ledger->totalPaidTo(bob, "refund"), 30u);
    EXPECT_EQ(ledger->totalPaidTo(bob, "proceeds"), 0u);

    std::vector<Transfer> forBob = ledger->getTransfersFor(bob);
    ASSERT_EQ(forBob.size(), 1u);
    EXPECT_EQ(forBob[0].getFrom(), escrow);
    EXPECT_EQ(forBob[0].getTimestamp(), 50u);
    EXPECT_EQ(ledger->getTransfers().size(), 2u);
}

TEST_F(InMemoryLedgerTest, TransferFailsWhenEscrowShort) {
    EXPECT_FALSE(ledger->transfer(bob, 1, "refund"));
    EXPECT_EQ(ledger->balanceOf(bob), 0u);
    EXPECT_TRUE(ledger->getTransfers().empty());
}

TEST_F(InMemoryLedgerTest, RejectingRecipientBlocksTransfer) {
    ledger->fund(escrow, 100);
    ledger->rejectTransfersTo(bob);

    EXPECT_FALSE(ledger->transfer(bob, 10, "refund"));
    EXPECT_EQ(ledger->escrowBalance(), 100u);

    ledger->acceptTransfersTo(bob);
    EXPECT_TRUE(ledger->transfer(bob, 10, "refund"));
}

TEST_F(InMemoryLedgerTest, InvalidTransferRejected) {
    ledger->fund(escrow, 100);
    EXPECT_FALSE(ledger->transfer(Identity(), 10, "refund"));
    EXPECT_FALSE(ledger->transfer(bob, 0, "refund"));
}

TEST_F(InMemoryLedgerTest, HookSeesCompletedTransfer) {
    ledger->fund(escrow, 100);

    Quantity seenBalance = 0;
    ledger->setTransferHook([&](const Transfer& t) {
        EXPECT_EQ(t.getTo(), bob);
        seenBalance = ledger->balanceOf(bob);
    });

    EXPECT_TRUE(ledger->transfer(bob, 25, "proceeds"));
    EXPECT_EQ(seenBalance, 25u);
}

// ------------------- Reloj -------------------
TEST_F(InMemoryLedgerTest, ClockOnlyMovesForward) {
    EXPECT_EQ(ledger->now(), 50u);
    ledger->advance(10);
    EXPECT_EQ(ledger->now(), 60u);
    EXPECT_TRUE(ledger->setTime(60));
    EXPECT_FALSE(ledger->setTime(59));
    EXPECT_EQ(ledger->now(), 60u);
}
