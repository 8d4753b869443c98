#ifndef GAVEL_AUCTION_H
#define GAVEL_AUCTION_H

#include "AuctionConfig.hpp"
#include "AuctionError.hpp"
#include "AuctionState.hpp"
#include "BiddingEngine.hpp"
#include "ClaimsManager.hpp"
#include "EventLog.hpp"
#include "HistoryTracker.hpp"
#include "ValueLedger.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace gavel {

    /**
     * @class Auction
     * @brief One auction bound to a ledger. Owns the state, the history and
     * the notification log, and routes calls to the bidding and claims
     * components with the ledger's current time.
     *
     * Calls are serialized. A mutating call issued while another one is still
     * running (for example from inside a ledger transfer) is rejected with
     * REENTRANT_CALL; read queries stay available and see the state as already
     * updated by the running call.
     */
    class Auction {
    public:
        /**
         * The Auction constructor validates the configuration and opens the
         * bidding window at config.startTime, or at ledger.now() when unset.
         *
         * @param config Owner, recipients, duration and extension of the auction
         * @param ledger Ledger that holds the auction's value; must outlive the
         * Auction
         * @throws InvalidConfigurationError if duration or extension is out of
         * bounds, start + duration overflows, or any of owner/recipients is null
         */
        Auction(const AuctionConfig& config, ValueLedger& ledger);

        Auction(const Auction&) = delete;
        Auction& operator=(const Auction&) = delete;

        // ==== OPERACIONES ====
        AuctionError placeBid(const Identity& sender, Quantity amount);
        AuctionError finalize();
        AuctionError claimCommission(const Identity& caller);
        AuctionError claimProceeds(const Identity& caller);

        // ==== CONSULTAS ====
        std::vector<Bid> allBids() const;
        std::vector<Bid> bidHistory(const Identity& participant) const;
        std::vector<Quantity> refundHistory(const Identity& participant) const;
        std::vector<Quantity> commissionHistory(const Identity& participant) const;

        uint64_t timeLeft() const;
        AuctionStatus auctionState() const;
        bool isEnded() const;

        Identity getHighestBidder() const;
        Quantity getHighestBid() const;
        Quantity getMinimumBid() const;
        Timestamp getAuctionEndTime() const;
        Timestamp getInitialEndTime() const;
        Quantity getCommissionTotal() const;
        Quantity getOwnerProceedsPending() const;
        bool isFinalized() const;

        /** Copy of the whole state. */
        AuctionState snapshot() const;

        // ==== NOTIFICACIONES ====
        size_t subscribe(EventLog::Subscriber subscriber);
        void unsubscribe(size_t id);
        std::vector<AuctionEvent> events() const;
        bool verifyEvents() const;

        bool checkInvariants() const;

    private:
        static AuctionState initialState(const AuctionConfig& config, const ValueLedger& ledger);

        AuctionError runExclusive(const std::function<AuctionError(Timestamp)>& operation);

        ValueLedger& ledger;
        AuctionState state;
        HistoryTracker history;
        EventLog eventLog;
        BiddingEngine bidding;
        ClaimsManager claims;

        mutable std::recursive_mutex mtx;
        bool callInProgress = false;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_H
