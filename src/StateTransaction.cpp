#include "StateTransaction.hpp"

namespace gavel {

    StateTransaction::StateTransaction(AuctionState& state, HistoryTracker& history, EventLog& events)
        : state(state), history(history), events(events),
          saved(state), historyCheckpoint(history.checkpoint()) {}

    StateTransaction::~StateTransaction() {
        if (!done) rollback();
    }

    void StateTransaction::commit() {
        if (done) return;
        done = true;

        history.commit();
        events.publish();
    }

    void StateTransaction::rollback() {
        if (done) return;
        done = true;

        state = saved;
        history.rollback(historyCheckpoint);
        events.discardPending();
    }

} // namespace gavel
