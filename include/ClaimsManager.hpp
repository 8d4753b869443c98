#ifndef GAVEL_CLAIMS_MANAGER_H
#define GAVEL_CLAIMS_MANAGER_H

#include "AuctionError.hpp"
#include "AuctionState.hpp"
#include "EventLog.hpp"
#include "HistoryTracker.hpp"
#include "ValueLedger.hpp"

namespace gavel {

    class StateTransaction;

    /**
     * @class ClaimsManager
     * @brief Settlement after the deadline: finalization of the winning bid,
     * then one commission payout and one proceeds payout, both owner-only.
     */
    class ClaimsManager {
    public:
        ClaimsManager(AuctionState& state, HistoryTracker& history, EventLog& events, ValueLedger& ledger);

        /**
         * Closes the auction once the deadline has passed: charges the
         * winner's commission, fixes the owner's proceeds and emits
         * AuctionEnded. Callable by anyone; later calls do nothing.
         *
         * @return AUCTION_STILL_OPEN before the deadline, NONE otherwise
         */
        AuctionError finalize(Timestamp now);

        /**
         * Pays the accumulated commission to the commission recipient. The
         * balance is zeroed before the transfer.
         *
         * @return UNAUTHORIZED, AUCTION_STILL_OPEN, NOTHING_TO_CLAIM,
         * TRANSFER_FAILED or NONE
         */
        AuctionError claimCommission(const Identity& caller, Timestamp now);

        /**
         * Pays highestBid minus its commission to the proceeds recipient.
         * Same gating and ordering as claimCommission.
         */
        AuctionError claimProceeds(const Identity& caller, Timestamp now);

    private:
        AuctionError checkClaim(const Identity& caller, Timestamp now) const;
        void applyFinalization(Timestamp now);

        AuctionError payOut(StateTransaction& tx, Quantity& pending, Quantity& claimed,
                            const Identity& recipient, EventType notification,
                            const std::string& memo, Timestamp now);

        AuctionState& state;
        HistoryTracker& history;
        EventLog& events;
        ValueLedger& ledger;
    };

} // namespace gavel

#endif // GAVEL_CLAIMS_MANAGER_H
