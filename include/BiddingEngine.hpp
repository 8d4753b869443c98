#ifndef GAVEL_BIDDING_ENGINE_H
#define GAVEL_BIDDING_ENGINE_H

#include "AuctionError.hpp"
#include "AuctionState.hpp"
#include "EventLog.hpp"
#include "HistoryTracker.hpp"
#include "ValueLedger.hpp"

namespace gavel {

    /**
     * @class BiddingEngine
     * @brief Accepts bids while the auction is open: increment rule, refund
     * of the previous leader (minus commission) and anti-sniping extension.
     */
    class BiddingEngine {
    public:
        BiddingEngine(AuctionState& state, HistoryTracker& history, EventLog& events, ValueLedger& ledger);

        /**
         * Places a bid of `amount` for `sender` at time `now`.
         *
         * The new leader, the previous leader's commission and refund, the
         * deadline extension and the notifications are all recorded before
         * the refund is sent. If the ledger refuses the refund every one of
         * those changes is undone.
         *
         * @return AuctionError::NONE on success; AUCTION_CLOSED when
         * now >= auctionEndTime; INVALID_AMOUNT for a null sender, a zero
         * amount or an amount above MAX_BID_AMOUNT; INSUFFICIENT_INCREMENT
         * below 1.05x the current highest bid; TRANSFER_FAILED if the refund
         * was refused.
         */
        AuctionError placeBid(const Identity& sender, Quantity amount, Timestamp now);

        /**
         * Checks a bid without applying it.
         */
        AuctionError validateBid(const Identity& sender, Quantity amount, Timestamp now) const;

        /** Smallest amount the next bid must reach. */
        Quantity minimumBid() const;

    private:
        // Anti-sniping: moves the deadline when less than 60 s remain
        bool extendDeadline(Timestamp now);

        AuctionState& state;
        HistoryTracker& history;
        EventLog& events;
        ValueLedger& ledger;
    };

} // namespace gavel

#endif // GAVEL_BIDDING_ENGINE_H
