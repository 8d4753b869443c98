#ifndef GAVEL_HISTORY_TRACKER_H
#define GAVEL_HISTORY_TRACKER_H

#include "Bid.hpp"
#include "Identity.hpp"
#include "Types.hpp"
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace gavel {

    /**
     * @class HistoryTracker
     * @brief Append-only logs of accepted bids, refunds and commissions, kept
     * globally and per participant in insertion order.
     *
     * Queries return copies. Unknown participants yield empty sequences.
     *
     * Appends made by a call that later fails are undone through the journal:
     * take a checkpoint() before mutating, then either commit() or
     * rollback(checkpoint). Committed entries are never removed.
     */
    class HistoryTracker {
    public:
        HistoryTracker() = default;

        // ==== REGISTRO ====
        void recordBid(const Bid& bid);
        void recordRefund(const Identity& participant, Quantity amount);
        void recordCommission(const Identity& participant, Quantity amount);

        // ==== CONSULTAS ====
        std::vector<Bid> allBids() const;
        std::vector<Bid> bidsOf(const Identity& participant) const;
        std::vector<Quantity> refundsOf(const Identity& participant) const;
        std::vector<Quantity> commissionsOf(const Identity& participant) const;

        size_t bidCount() const { return bids.size(); }
        bool hasBids() const { return !bids.empty(); }
        Bid lastBid() const;

        // ==== TOTALES ====
        Quantity totalBidValue() const;
        Quantity totalRefunded() const;
        Quantity totalCommission() const;

        // ==== JOURNAL ====
        size_t checkpoint() const { return journal.size(); }
        void rollback(size_t checkpoint);
        void commit();

    private:
        enum class EntryKind : uint8_t { BID, REFUND, COMMISSION };

        struct JournalEntry {
            EntryKind kind;
            Identity participant;
        };

        std::vector<Bid> bids;
        std::unordered_map<Identity, std::vector<Bid>> bidsByParticipant;
        std::unordered_map<Identity, std::vector<Quantity>> refundsByParticipant;
        std::unordered_map<Identity, std::vector<Quantity>> commissionsByParticipant;

        std::vector<JournalEntry> journal;
    };

} // namespace gavel

#endif // GAVEL_HISTORY_TRACKER_H
