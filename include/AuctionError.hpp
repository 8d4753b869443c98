#pragma once
#ifndef GAVEL_AUCTION_ERROR_HPP
#define GAVEL_AUCTION_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace gavel {

    // ============================================================
    //  RESULTADO DE LAS OPERACIONES
    // ============================================================
    enum class AuctionError : uint8_t {
        NONE                   = 0,
        INVALID_CONFIGURATION  = 1,
        AUCTION_CLOSED         = 2,  // bid at or after the deadline
        AUCTION_STILL_OPEN     = 3,  // claim or finalize before the deadline
        INSUFFICIENT_INCREMENT = 4,
        INVALID_AMOUNT         = 5,
        UNAUTHORIZED           = 6,
        TRANSFER_FAILED        = 7,
        NOTHING_TO_CLAIM       = 8,
        REENTRANT_CALL         = 9
    };

    /** Converts an AuctionError into its name (useful for logs) */
    std::string auctionErrorToString(AuctionError error);

    /**
     * Thrown when an auction is created with parameters outside the allowed
     * bounds. No auction exists afterwards.
     */
    class InvalidConfigurationError : public std::invalid_argument {
    public:
        explicit InvalidConfigurationError(const std::string& what)
            : std::invalid_argument("Invalid auction configuration: " + what) {}
    };

} // namespace gavel

#endif // GAVEL_AUCTION_ERROR_HPP
