#ifndef GAVEL_EVENT_LOG_H
#define GAVEL_EVENT_LOG_H

#include "AuctionEvent.hpp"
#include <functional>
#include <map>
#include <vector>

namespace gavel {

    /**
     * @class EventLog
     * @brief Append-only notification log. Events raised during a call stay
     * pending until publish(); publishing chains each event to its
     * predecessor with SHA-256 and hands it to every subscriber in order.
     */
    class EventLog {
    public:
        using Subscriber = std::function<void(const AuctionEvent&)>;

        EventLog() = default;

        /**
         * Queues a notification for the current call.
         */
        void emit(EventType type, const Identity& subject, Quantity amount, Timestamp timestamp);

        /**
         * Commits every pending event to the chain and notifies subscribers.
         * An exception thrown by a subscriber is logged and does not reach
         * the caller; the remaining subscribers are still notified.
         */
        void publish();

        /**
         * Drops the pending events of a failed call.
         */
        void discardPending();

        size_t subscribe(Subscriber subscriber);
        void unsubscribe(size_t id);

        std::vector<AuctionEvent> events() const;
        std::vector<AuctionEvent> eventsOfType(EventType type) const;
        size_t size() const { return entries.size(); }
        size_t pendingCount() const { return pending.size(); }

        /**
         * Recomputes every hash and link of the chain.
         * @return false at the first broken link
         */
        bool verifyChain() const;
        static bool verifyChain(const std::vector<AuctionEvent>& chain);

        static std::vector<uint8_t> computeHash(const AuctionEvent& event);

    private:
        std::vector<AuctionEvent> entries;
        std::vector<AuctionEvent> pending;
        std::map<size_t, Subscriber> subscribers;
        size_t nextSubscriberId = 1;
    };

} // namespace gavel

#endif // GAVEL_EVENT_LOG_H
