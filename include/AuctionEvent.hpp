#pragma once
#ifndef GAVEL_AUCTION_EVENT_HPP
#define GAVEL_AUCTION_EVENT_HPP

#include "Identity.hpp"
#include "Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gavel {

    // ============================================================
    //  TIPOS DE NOTIFICACION
    // ============================================================
    enum class EventType : uint8_t {
        NEW_BID              = 1,
        AUCTION_ENDED        = 2,
        REFUNDED             = 3,
        COMMISSION_CLAIMED   = 4,
        PROCEEDS_TRANSFERRED = 5
    };

    /**
     * One notification. `subject` is the bidder, winner or recipient the
     * event is about. `sequence`, `previousHash` and `hash` are assigned when
     * the event is committed to the log.
     */
    struct AuctionEvent {
        EventType type = EventType::NEW_BID;
        Identity subject;
        Quantity amount = 0;
        Timestamp timestamp = 0;
        uint64_t sequence = 0;
        std::vector<uint8_t> previousHash;
        std::vector<uint8_t> hash;

        /** Bytes covered by `hash`: every field except the hash itself. */
        std::vector<uint8_t> bytesForHash() const;
    };

    /** Converts an EventType to its notification name, e.g. "NewBid" */
    std::string eventTypeToString(EventType type);

    bool isKnownEventType(uint8_t raw);

} // namespace gavel

#endif // GAVEL_AUCTION_EVENT_HPP
