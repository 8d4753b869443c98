#include "AuctionState.hpp"
#include <iostream>

namespace gavel {

    AuctionState::AuctionState(const Identity& owner, const Identity& commissionRecipient,
                               const Identity& proceedsRecipient, Timestamp startTime,
                               uint64_t durationSeconds, uint64_t extensionSeconds)
        : owner(owner),
          commissionRecipient(commissionRecipient),
          proceedsRecipient(proceedsRecipient),
          startTime(startTime),
          initialEndTime(startTime + durationSeconds),
          extensionTime(extensionSeconds),
          auctionEndTime(startTime + durationSeconds) {}

    uint64_t AuctionState::timeLeft(Timestamp now) const {
        if (isEnded(now)) return 0;
        return auctionEndTime - now;
    }

    AuctionStatus AuctionState::state(Timestamp now) const {
        AuctionStatus status;
        status.ended = isEnded(now);
        status.timeLeft = timeLeft(now);
        return status;
    }

    bool AuctionState::checkInvariants(const HistoryTracker& history) const {
        if (history.hasBids()) {
            const Bid last = history.lastBid();
            if (last.amount != highestBid || last.bidder != highestBidder) {
                std::cerr << "Error: Leader does not match the last recorded bid" << std::endl;
                return false;
            }
        } else if (highestBid != 0 || !highestBidder.isNull()) {
            std::cerr << "Error: Leader set without any recorded bid" << std::endl;
            return false;
        }

        if (auctionEndTime < initialEndTime) {
            std::cerr << "Error: Deadline moved before the initial deadline" << std::endl;
            return false;
        }

        if (commissionTotal + commissionClaimed != history.totalCommission()) {
            std::cerr << "Error: Commission balance does not match the commission log" << std::endl;
            return false;
        }

        return true;
    }

} // namespace gavel
