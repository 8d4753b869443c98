#include "BiddingEngine.hpp"
#include "Amount.hpp"
#include "StateTransaction.hpp"
#include <limits>

namespace gavel {

    BiddingEngine::BiddingEngine(AuctionState& state, HistoryTracker& history, EventLog& events, ValueLedger& ledger)
        : state(state), history(history), events(events), ledger(ledger) {}

    AuctionError BiddingEngine::validateBid(const Identity& sender, Quantity amount, Timestamp now) const {
        if (state.isEnded(now)) {
            return AuctionError::AUCTION_CLOSED;
        }

        if (sender.isNull() || amount == 0 || amount > MAX_BID_AMOUNT) {
            return AuctionError::INVALID_AMOUNT;
        }

        if (!meetsIncrement(amount, state.highestBid)) {
            return AuctionError::INSUFFICIENT_INCREMENT;
        }

        return AuctionError::NONE;
    }

    AuctionError BiddingEngine::placeBid(const Identity& sender, Quantity amount, Timestamp now) {
        AuctionError error = validateBid(sender, amount, now);
        if (error != AuctionError::NONE) {
            return error;
        }

        StateTransaction tx(state, history, events);

        const Identity previousBidder = state.highestBidder;
        const Quantity previousAmount = state.highestBid;

        // 1. Registrar la puja antes de cualquier transferencia
        history.recordBid(Bid{sender, amount, now});
        state.highestBidder = sender;
        state.highestBid = amount;

        // 2. Comisión y reembolso del líder anterior (puede ser el mismo pujador)
        Quantity refund = 0;
        if (!previousBidder.isNull()) {
            Quantity commission = 0;
            splitCommission(previousAmount, commission, refund);

            state.commissionTotal += commission;
            history.recordCommission(previousBidder, commission);
            history.recordRefund(previousBidder, refund);
            events.emit(EventType::REFUNDED, previousBidder, refund, now);
        }

        // 3. Anti-sniping
        extendDeadline(now);

        // 4. Notificación
        events.emit(EventType::NEW_BID, sender, amount, now);

        // La transferencia externa va siempre al final
        if (refund > 0 && !ledger.transfer(previousBidder, refund, "refund")) {
            tx.rollback();
            return AuctionError::TRANSFER_FAILED;
        }

        tx.commit();
        return AuctionError::NONE;
    }

    Quantity BiddingEngine::minimumBid() const {
        return minimumNextBid(state.highestBid);
    }

    bool BiddingEngine::extendDeadline(Timestamp now) {
        if (state.auctionEndTime - now >= SNIPING_WINDOW_SECONDS) {
            return false;
        }

        // Saturar en lugar de desbordar
        const Timestamp latest = std::numeric_limits<Timestamp>::max();
        const Timestamp extended = state.extensionTime > latest - now ? latest : now + state.extensionTime;
        if (extended <= state.auctionEndTime) {
            return false;
        }

        state.auctionEndTime = extended;
        return true;
    }

} // namespace gavel
