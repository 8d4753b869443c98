#ifndef GAVEL_STATE_TRANSACTION_H
#define GAVEL_STATE_TRANSACTION_H

#include "AuctionState.hpp"
#include "EventLog.hpp"
#include "HistoryTracker.hpp"

namespace gavel {

    /**
     * @class StateTransaction
     * @brief Call boundary of a mutating operation. Snapshots the state and
     * checkpoints the history when constructed; unless commit() is called,
     * the destructor restores both and drops the call's pending events.
     */
    class StateTransaction {
    public:
        StateTransaction(AuctionState& state, HistoryTracker& history, EventLog& events);
        ~StateTransaction();

        StateTransaction(const StateTransaction&) = delete;
        StateTransaction& operator=(const StateTransaction&) = delete;

        /** Keeps every mutation and publishes the pending events. */
        void commit();

        /** Restores the state as it was at construction. */
        void rollback();

    private:
        AuctionState& state;
        HistoryTracker& history;
        EventLog& events;

        AuctionState saved;
        size_t historyCheckpoint;
        bool done = false;
    };

} // namespace gavel

#endif // GAVEL_STATE_TRANSACTION_H
