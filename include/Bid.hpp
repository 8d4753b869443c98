#ifndef GAVEL_BID_H
#define GAVEL_BID_H

#include "Identity.hpp"
#include "Types.hpp"

namespace gavel {

    struct Bid {
        Identity bidder;
        Quantity amount = 0;
        Timestamp timestamp = 0;

        bool operator==(const Bid& other) const {
            return bidder == other.bidder && amount == other.amount && timestamp == other.timestamp;
        }
        bool operator!=(const Bid& other) const { return !(*this == other); }
    };

} // namespace gavel

#endif // GAVEL_BID_H
