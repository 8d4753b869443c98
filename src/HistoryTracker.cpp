#include "HistoryTracker.hpp"
#include <stdexcept>

namespace gavel {

    namespace {
        template <typename T>
        std::vector<T> lookup(const std::unordered_map<Identity, std::vector<T>>& table, const Identity& key) {
            auto it = table.find(key);
            if (it == table.end()) return {};
            return it->second;
        }

        template <typename T>
        void popLast(std::unordered_map<Identity, std::vector<T>>& table, const Identity& key) {
            auto it = table.find(key);
            if (it == table.end() || it->second.empty()) {
                throw std::logic_error("History journal out of sync for " + key.toString());
            }
            it->second.pop_back();
            if (it->second.empty()) table.erase(it);
        }
    }

    void HistoryTracker::recordBid(const Bid& bid) {
        bids.push_back(bid);
        bidsByParticipant[bid.bidder].push_back(bid);
        journal.push_back({EntryKind::BID, bid.bidder});
    }

    void HistoryTracker::recordRefund(const Identity& participant, Quantity amount) {
        refundsByParticipant[participant].push_back(amount);
        journal.push_back({EntryKind::REFUND, participant});
    }

    void HistoryTracker::recordCommission(const Identity& participant, Quantity amount) {
        commissionsByParticipant[participant].push_back(amount);
        journal.push_back({EntryKind::COMMISSION, participant});
    }

    std::vector<Bid> HistoryTracker::allBids() const {
        return bids;
    }

    std::vector<Bid> HistoryTracker::bidsOf(const Identity& participant) const {
        return lookup(bidsByParticipant, participant);
    }

    std::vector<Quantity> HistoryTracker::refundsOf(const Identity& participant) const {
        return lookup(refundsByParticipant, participant);
    }

    std::vector<Quantity> HistoryTracker::commissionsOf(const Identity& participant) const {
        return lookup(commissionsByParticipant, participant);
    }

    Bid HistoryTracker::lastBid() const {
        if (bids.empty()) return Bid{};
        return bids.back();
    }

    Quantity HistoryTracker::totalBidValue() const {
        Quantity total = 0;
        for (const auto& bid : bids) total += bid.amount;
        return total;
    }

    Quantity HistoryTracker::totalRefunded() const {
        Quantity total = 0;
        for (const auto& kv : refundsByParticipant) {
            for (Quantity amount : kv.second) total += amount;
        }
        return total;
    }

    Quantity HistoryTracker::totalCommission() const {
        Quantity total = 0;
        for (const auto& kv : commissionsByParticipant) {
            for (Quantity amount : kv.second) total += amount;
        }
        return total;
    }

    void HistoryTracker::rollback(size_t checkpoint) {
        if (checkpoint > journal.size()) {
            throw std::out_of_range("History checkpoint beyond journal end");
        }

        // Deshacer en orden inverso
        while (journal.size() > checkpoint) {
            const JournalEntry entry = journal.back();
            journal.pop_back();

            switch (entry.kind) {
                case EntryKind::BID:
                    bids.pop_back();
                    popLast(bidsByParticipant, entry.participant);
                    break;
                case EntryKind::REFUND:
                    popLast(refundsByParticipant, entry.participant);
                    break;
                case EntryKind::COMMISSION:
                    popLast(commissionsByParticipant, entry.participant);
                    break;
            }
        }
    }

    void HistoryTracker::commit() {
        journal.clear();
    }

} // namespace gavel
