#include "ClaimsManager.hpp"
#include "Amount.hpp"
#include "StateTransaction.hpp"

namespace gavel {

    ClaimsManager::ClaimsManager(AuctionState& state, HistoryTracker& history, EventLog& events, ValueLedger& ledger)
        : state(state), history(history), events(events), ledger(ledger) {}

    AuctionError ClaimsManager::finalize(Timestamp now) {
        if (!state.isEnded(now)) {
            return AuctionError::AUCTION_STILL_OPEN;
        }

        if (state.finalized) {
            return AuctionError::NONE;
        }

        StateTransaction tx(state, history, events);
        applyFinalization(now);
        tx.commit();

        return AuctionError::NONE;
    }

    AuctionError ClaimsManager::claimCommission(const Identity& caller, Timestamp now) {
        AuctionError error = checkClaim(caller, now);
        if (error != AuctionError::NONE) {
            return error;
        }

        StateTransaction tx(state, history, events);
        applyFinalization(now);

        return payOut(tx, state.commissionTotal, state.commissionClaimed, state.commissionRecipient,
                      EventType::COMMISSION_CLAIMED, "commission", now);
    }

    AuctionError ClaimsManager::claimProceeds(const Identity& caller, Timestamp now) {
        AuctionError error = checkClaim(caller, now);
        if (error != AuctionError::NONE) {
            return error;
        }

        StateTransaction tx(state, history, events);
        applyFinalization(now);

        return payOut(tx, state.ownerProceedsPending, state.proceedsClaimed, state.proceedsRecipient,
                      EventType::PROCEEDS_TRANSFERRED, "proceeds", now);
    }

    AuctionError ClaimsManager::checkClaim(const Identity& caller, Timestamp now) const {
        if (caller != state.owner) {
            return AuctionError::UNAUTHORIZED;
        }

        if (!state.isEnded(now)) {
            return AuctionError::AUCTION_STILL_OPEN;
        }

        return AuctionError::NONE;
    }

    void ClaimsManager::applyFinalization(Timestamp now) {
        if (state.finalized) return;
        state.finalized = true;

        if (!state.hasBids()) {
            events.emit(EventType::AUCTION_ENDED, Identity(), 0, now);
            return;
        }

        // El ganador también paga comisión
        Quantity commission = 0;
        Quantity proceeds = 0;
        splitCommission(state.highestBid, commission, proceeds);

        state.commissionTotal += commission;
        history.recordCommission(state.highestBidder, commission);
        state.ownerProceedsPending = proceeds;

        events.emit(EventType::AUCTION_ENDED, state.highestBidder, state.highestBid, now);
    }

    AuctionError ClaimsManager::payOut(StateTransaction& tx, Quantity& pending, Quantity& claimed,
                                       const Identity& recipient, EventType notification,
                                       const std::string& memo, Timestamp now) {
        const Quantity amount = pending;
        if (amount == 0) {
            tx.rollback();
            return AuctionError::NOTHING_TO_CLAIM;
        }

        // Saldo a cero antes de transferir
        pending = 0;
        claimed += amount;
        events.emit(notification, recipient, amount, now);

        if (!ledger.transfer(recipient, amount, memo)) {
            tx.rollback();
            return AuctionError::TRANSFER_FAILED;
        }

        tx.commit();
        return AuctionError::NONE;
    }

} // namespace gavel
