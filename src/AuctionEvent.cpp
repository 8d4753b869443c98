#include "AuctionEvent.hpp"

namespace gavel {

    namespace {
        void appendUint64(std::vector<uint8_t>& out, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }
    }

    std::vector<uint8_t> AuctionEvent::bytesForHash() const {
        std::vector<uint8_t> out;
        out.reserve(1 + 8 + 8 + 8 + ADDRESS_SIZE + previousHash.size());

        out.push_back(static_cast<uint8_t>(type));
        appendUint64(out, sequence);
        appendUint64(out, timestamp);
        appendUint64(out, amount);

        std::vector<uint8_t> subjectBytes = subject.toBytes();
        out.insert(out.end(), subjectBytes.begin(), subjectBytes.end());
        out.insert(out.end(), previousHash.begin(), previousHash.end());

        return out;
    }

    std::string eventTypeToString(EventType type) {
        switch (type) {
            case EventType::NEW_BID:              return "NewBid";
            case EventType::AUCTION_ENDED:        return "AuctionEnded";
            case EventType::REFUNDED:             return "Refunded";
            case EventType::COMMISSION_CLAIMED:   return "CommissionClaimed";
            case EventType::PROCEEDS_TRANSFERRED: return "ProceedsTransferred";
            default:                              return "Unknown";
        }
    }

    bool isKnownEventType(uint8_t raw) {
        return raw >= static_cast<uint8_t>(EventType::NEW_BID) &&
               raw <= static_cast<uint8_t>(EventType::PROCEEDS_TRANSFERRED);
    }

} // namespace gavel
