#ifndef GAVEL_AUCTION_STATE_H
#define GAVEL_AUCTION_STATE_H

#include "HistoryTracker.hpp"
#include "Identity.hpp"
#include "Types.hpp"

namespace gavel {

    /**
     * (ended, seconds left) as reported by auctionState().
     */
    struct AuctionStatus {
        bool ended = false;
        uint64_t timeLeft = 0;
    };

    /**
     * @struct AuctionState
     * @brief Canonical data of one auction. Owned by the Auction and handed
     * by reference to the bidding and claims components.
     *
     * Invariants:
     *  - highestBid is the amount of the last accepted bid (0 before any bid)
     *  - auctionEndTime >= initialEndTime, and it never decreases
     *  - ownerProceedsPending is set only by finalization
     */
    struct AuctionState {
        // Fijados en la creación
        Identity owner;
        Identity commissionRecipient;
        Identity proceedsRecipient;
        Timestamp startTime = 0;
        Timestamp initialEndTime = 0;
        uint64_t extensionTime = 0;

        // Líder actual
        Identity highestBidder;
        Quantity highestBid = 0;

        Timestamp auctionEndTime = 0;

        // Saldos pendientes
        Quantity commissionTotal = 0;
        Quantity ownerProceedsPending = 0;
        Quantity commissionClaimed = 0;
        Quantity proceedsClaimed = 0;
        bool finalized = false;

        AuctionState() = default;
        AuctionState(const Identity& owner, const Identity& commissionRecipient,
                     const Identity& proceedsRecipient, Timestamp startTime,
                     uint64_t durationSeconds, uint64_t extensionSeconds);

        bool isEnded(Timestamp now) const { return now >= auctionEndTime; }

        /** 0 once ended, else auctionEndTime - now. */
        uint64_t timeLeft(Timestamp now) const;

        AuctionStatus state(Timestamp now) const;

        bool hasBids() const { return !highestBidder.isNull(); }

        /**
         * Checks the leader and deadline invariants against the bid history.
         */
        bool checkInvariants(const HistoryTracker& history) const;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_STATE_H
