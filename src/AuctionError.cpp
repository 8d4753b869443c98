#include "AuctionError.hpp"

namespace gavel {

    std::string auctionErrorToString(AuctionError error) {
        switch (error) {
            case AuctionError::NONE:                   return "NONE";
            case AuctionError::INVALID_CONFIGURATION:  return "INVALID_CONFIGURATION";
            case AuctionError::AUCTION_CLOSED:         return "AUCTION_CLOSED";
            case AuctionError::AUCTION_STILL_OPEN:     return "AUCTION_STILL_OPEN";
            case AuctionError::INSUFFICIENT_INCREMENT: return "INSUFFICIENT_INCREMENT";
            case AuctionError::INVALID_AMOUNT:         return "INVALID_AMOUNT";
            case AuctionError::UNAUTHORIZED:           return "UNAUTHORIZED";
            case AuctionError::TRANSFER_FAILED:        return "TRANSFER_FAILED";
            case AuctionError::NOTHING_TO_CLAIM:       return "NOTHING_TO_CLAIM";
            case AuctionError::REENTRANT_CALL:         return "REENTRANT_CALL";
            default:                                   return "UNKNOWN";
        }
    }

} // namespace gavel
