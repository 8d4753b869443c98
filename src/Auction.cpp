#include "Auction.hpp"
#include <limits>
#include <string>

namespace gavel {

    namespace {
        // Marca la llamada en curso y la libera al salir, también con excepciones
        class CallScope {
        public:
            explicit CallScope(bool& flag) : flag(flag) { flag = true; }
            ~CallScope() { flag = false; }
        private:
            bool& flag;
        };
    }

    Auction::Auction(const AuctionConfig& config, ValueLedger& ledger)
        : ledger(ledger),
          state(initialState(config, ledger)),
          bidding(state, history, eventLog, ledger),
          claims(state, history, eventLog, ledger) {}

    AuctionState Auction::initialState(const AuctionConfig& config, const ValueLedger& ledger) {
        config.validate();

        const Timestamp start = config.startTime ? *config.startTime : ledger.now();
        if (start > std::numeric_limits<Timestamp>::max() - config.durationSeconds) {
            throw InvalidConfigurationError("deadline overflows for start time " + std::to_string(start));
        }

        return AuctionState(config.owner, config.commissionRecipient, config.proceedsRecipient,
                            start, config.durationSeconds, config.extensionSeconds);
    }

    AuctionError Auction::runExclusive(const std::function<AuctionError(Timestamp)>& operation) {
        std::lock_guard<std::recursive_mutex> lock(mtx);

        if (callInProgress) {
            return AuctionError::REENTRANT_CALL;
        }

        CallScope scope(callInProgress);
        return operation(ledger.now());
    }

    // ==== OPERACIONES ====

    AuctionError Auction::placeBid(const Identity& sender, Quantity amount) {
        return runExclusive([&](Timestamp now) { return bidding.placeBid(sender, amount, now); });
    }

    AuctionError Auction::finalize() {
        return runExclusive([&](Timestamp now) { return claims.finalize(now); });
    }

    AuctionError Auction::claimCommission(const Identity& caller) {
        return runExclusive([&](Timestamp now) { return claims.claimCommission(caller, now); });
    }

    AuctionError Auction::claimProceeds(const Identity& caller) {
        return runExclusive([&](Timestamp now) { return claims.claimProceeds(caller, now); });
    }

    // ==== CONSULTAS ====

    std::vector<Bid> Auction::allBids() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return history.allBids();
    }

    std::vector<Bid> Auction::bidHistory(const Identity& participant) const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return history.bidsOf(participant);
    }

    std::vector<Quantity> Auction::refundHistory(const Identity& participant) const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return history.refundsOf(participant);
    }

    std::vector<Quantity> Auction::commissionHistory(const Identity& participant) const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return history.commissionsOf(participant);
    }

    uint64_t Auction::timeLeft() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.timeLeft(ledger.now());
    }

    AuctionStatus Auction::auctionState() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.state(ledger.now());
    }

    bool Auction::isEnded() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.isEnded(ledger.now());
    }

    Identity Auction::getHighestBidder() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.highestBidder;
    }

    Quantity Auction::getHighestBid() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.highestBid;
    }

    Quantity Auction::getMinimumBid() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return bidding.minimumBid();
    }

    Timestamp Auction::getAuctionEndTime() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.auctionEndTime;
    }

    Timestamp Auction::getInitialEndTime() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.initialEndTime;
    }

    Quantity Auction::getCommissionTotal() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.commissionTotal;
    }

    Quantity Auction::getOwnerProceedsPending() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.ownerProceedsPending;
    }

    bool Auction::isFinalized() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.finalized;
    }

    AuctionState Auction::snapshot() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state;
    }

    // ==== NOTIFICACIONES ====

    size_t Auction::subscribe(EventLog::Subscriber subscriber) {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return eventLog.subscribe(std::move(subscriber));
    }

    void Auction::unsubscribe(size_t id) {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        eventLog.unsubscribe(id);
    }

    std::vector<AuctionEvent> Auction::events() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return eventLog.events();
    }

    bool Auction::verifyEvents() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return eventLog.verifyChain();
    }

    bool Auction::checkInvariants() const {
        std::lock_guard<std::recursive_mutex> lock(mtx);
        return state.checkInvariants(history);
    }

} // namespace gavel
