#include <gtest/gtest.h>
#include "BiddingEngine.hpp"
#include "InMemoryLedger.hpp"
#include "CryptoBase.hpp"
#include <limits>
#include <memory>

using namespace gavel;

class BiddingEngineTest : public ::testing::Test {
protected:
    Identity owner, alice, bob;
    std::unique_ptr<InMemoryLedger> ledger;
    AuctionState state;
    HistoryTracker history;
    EventLog events;
    std::unique_ptr<BiddingEngine> engine;

    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
        owner = Identity::fromLabel("owner");
        alice = Identity::fromLabel("alice");
        bob = Identity::fromLabel("bob");

        ledger = std::make_unique<InMemoryLedger>(Identity::fromLabel("escrow"), 0);
        state = AuctionState(owner, owner, owner, 0, 120, 30);
        engine = std::make_unique<BiddingEngine>(state, history, events, *ledger);
    }

    // El valor de la puja entra en escrow antes de la llamada
    AuctionError bid(const Identity& who, Quantity amount, Timestamp now) {
        ledger->fund(who, amount);
        EXPECT_TRUE(ledger->deposit(who, amount));
        return engine->placeBid(who, amount, now);
    }
};

// ------------------- Validación -------------------
TEST_F(BiddingEngineTest, FirstBidAnyPositiveAmount) {
    EXPECT_EQ(bid(alice, 1, 0), AuctionError::NONE);
    EXPECT_EQ(state.highestBidder, alice);
    EXPECT_EQ(state.highestBid, 1u);
    EXPECT_EQ(ledger->getTransfersFor(alice).size(), 1u); // solo el depósito
}

TEST_F(BiddingEngineTest, RejectsInvalidAmounts) {
    EXPECT_EQ(engine->placeBid(alice, 0, 0), AuctionError::INVALID_AMOUNT);
    EXPECT_EQ(engine->placeBid(Identity(), 100, 0), AuctionError::INVALID_AMOUNT);
    EXPECT_EQ(engine->placeBid(alice, MAX_BID_AMOUNT + 1, 0), AuctionError::INVALID_AMOUNT);
    EXPECT_FALSE(history.hasBids());
    EXPECT_EQ(events.size(), 0u);
}

TEST_F(BiddingEngineTest, IncrementBoundary) {
    ASSERT_EQ(bid(alice, 100 * COIN, 0), AuctionError::NONE);
    EXPECT_EQ(engine->minimumBid(), 105 * COIN);

    EXPECT_EQ(engine->validateBid(bob, 105 * COIN - 1, 10), AuctionError::INSUFFICIENT_INCREMENT);
    EXPECT_EQ(engine->validateBid(bob, 105 * COIN, 10), AuctionError::NONE);
    EXPECT_EQ(engine->placeBid(bob, 104 * COIN, 10), AuctionError::INSUFFICIENT_INCREMENT);
    EXPECT_EQ(state.highestBidder, alice);
}

TEST_F(BiddingEngineTest, ClosedAtDeadline) {
    EXPECT_EQ(engine->placeBid(alice, 100, 120), AuctionError::AUCTION_CLOSED);
    EXPECT_EQ(engine->validateBid(alice, 100, 119), AuctionError::NONE);
    // cerrada tiene prioridad sobre el importe
    EXPECT_EQ(engine->placeBid(alice, 0, 500), AuctionError::AUCTION_CLOSED);
}

// ------------------- Reembolso y comisión -------------------
TEST_F(BiddingEngineTest, OutbidRefundsPreviousLeaderMinusCommission) {
    ASSERT_EQ(bid(alice, 100 * COIN, 0), AuctionError::NONE);
    ASSERT_EQ(bid(bob, 105 * COIN, 10), AuctionError::NONE);

    EXPECT_EQ(state.highestBidder, bob);
    EXPECT_EQ(state.commissionTotal, 2 * COIN);
    EXPECT_EQ(history.refundsOf(alice), std::vector<Quantity>({98 * COIN}));
    EXPECT_EQ(history.commissionsOf(alice), std::vector<Quantity>({2 * COIN}));
    EXPECT_EQ(ledger->balanceOf(alice), 98 * COIN);
    EXPECT_EQ(ledger->escrowBalance(), 107 * COIN);
    EXPECT_TRUE(state.checkInvariants(history));

    std::vector<AuctionEvent> log = events.events();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[1].type, EventType::REFUNDED);
    EXPECT_EQ(log[1].subject, alice);
    EXPECT_EQ(log[1].amount, 98 * COIN);
    EXPECT_EQ(log[2].type, EventType::NEW_BID);
    EXPECT_EQ(log[2].subject, bob);
}

TEST_F(BiddingEngineTest, SelfOutbidRefundsAndChargesSameBidder) {
    ASSERT_EQ(bid(alice, 100 * COIN, 0), AuctionError::NONE);
    ASSERT_EQ(bid(alice, 105 * COIN, 10), AuctionError::NONE);

    EXPECT_EQ(state.highestBidder, alice);
    EXPECT_EQ(history.bidsOf(alice).size(), 2u);
    EXPECT_EQ(history.refundsOf(alice), std::vector<Quantity>({98 * COIN}));
    EXPECT_EQ(history.commissionsOf(alice), std::vector<Quantity>({2 * COIN}));
    EXPECT_EQ(ledger->balanceOf(alice), 98 * COIN);
}

// ------------------- Anti-sniping -------------------
TEST_F(BiddingEngineTest, EarlyBidKeepsDeadline) {
    ASSERT_EQ(bid(alice, 100, 60), AuctionError::NONE); // quedan exactamente 60 s
    EXPECT_EQ(state.auctionEndTime, 120u);
}

TEST_F(BiddingEngineTest, LateBidExtendsDeadline) {
    ASSERT_EQ(bid(alice, 100, 100), AuctionError::NONE);
    EXPECT_EQ(state.auctionEndTime, 130u);

    ASSERT_EQ(bid(bob, 200, 125), AuctionError::NONE);
    EXPECT_EQ(state.auctionEndTime, 155u);

    ASSERT_EQ(bid(alice, 300, 154), AuctionError::NONE);
    EXPECT_EQ(state.auctionEndTime, 184u);
    EXPECT_EQ(state.initialEndTime, 120u);
}

TEST_F(BiddingEngineTest, ExtensionNeverShortensDeadline) {
    state.auctionEndTime = 150; // ya extendida

    ASSERT_EQ(bid(alice, 100, 100), AuctionError::NONE); // 100 + 30 < 150
    EXPECT_EQ(state.auctionEndTime, 150u);
}

TEST_F(BiddingEngineTest, HugeExtensionSaturatesInsteadOfWrapping) {
    state.extensionTime = std::numeric_limits<uint64_t>::max() - 50;

    ASSERT_EQ(bid(alice, 100, 100), AuctionError::NONE); // quedan 20 s
    EXPECT_EQ(state.auctionEndTime, std::numeric_limits<Timestamp>::max());
    EXPECT_FALSE(state.isEnded(1000000));
}

// ------------------- Fallo de transferencia -------------------
TEST_F(BiddingEngineTest, RefusedRefundRevertsEverything) {
    ASSERT_EQ(bid(alice, 100 * COIN, 0), AuctionError::NONE);
    const AuctionState before = state;
    const size_t eventsBefore = events.size();

    ledger->rejectTransfersTo(alice);
    EXPECT_EQ(bid(bob, 105 * COIN, 100), AuctionError::TRANSFER_FAILED);

    EXPECT_EQ(state.highestBidder, alice);
    EXPECT_EQ(state.highestBid, before.highestBid);
    EXPECT_EQ(state.auctionEndTime, before.auctionEndTime);
    EXPECT_EQ(state.commissionTotal, 0u);
    EXPECT_EQ(history.bidCount(), 1u);
    EXPECT_TRUE(history.bidsOf(bob).empty());
    EXPECT_TRUE(history.refundsOf(alice).empty());
    EXPECT_TRUE(history.commissionsOf(alice).empty());
    EXPECT_EQ(events.size(), eventsBefore);
    EXPECT_EQ(events.pendingCount(), 0u);
    EXPECT_TRUE(state.checkInvariants(history));

    ledger->acceptTransfersTo(alice);
    EXPECT_EQ(engine->placeBid(bob, 105 * COIN, 100), AuctionError::NONE);
    EXPECT_EQ(state.auctionEndTime, 130u);
}

TEST_F(BiddingEngineTest, SubscribersSeeOnlyCommittedBids) {
    std::vector<EventType> seen;
    events.subscribe([&](const AuctionEvent& e) { seen.push_back(e.type); });

    ASSERT_EQ(bid(alice, 100, 0), AuctionError::NONE);
    ledger->rejectTransfersTo(alice);
    EXPECT_EQ(bid(bob, 200, 10), AuctionError::TRANSFER_FAILED);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], EventType::NEW_BID);
}
