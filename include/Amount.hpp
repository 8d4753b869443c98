#ifndef GAVEL_AMOUNT_H
#define GAVEL_AMOUNT_H

#include <string>
#include "Types.hpp"

namespace gavel {

    /**
     * Commission skimmed from an amount (2%, rounded down).
     */
    Quantity commissionOf(Quantity amount);

    /**
     * Splits an amount into the commission skimmed and the remainder paid out.
     * commission + remainder == amount always holds.
     */
    void splitCommission(Quantity amount, Quantity& commission, Quantity& remainder);

    /**
     * True when `amount` satisfies the increment rule against the current
     * highest bid: amount >= highestBid * 1.05, compared exactly in integers.
     * Any positive amount qualifies against a zero highest bid.
     */
    bool meetsIncrement(Quantity amount, Quantity highestBid);

    /**
     * Smallest amount that satisfies the increment rule (rounded up).
     */
    Quantity minimumNextBid(Quantity highestBid);

    /** Formats base units as a decimal coin string, e.g. 10250000000 -> "102.5". */
    std::string formatCoins(Quantity amount);

    /**
     * Parses a decimal coin string with at most COIN_DECIMALS fractional digits.
     * Returns false on malformed input or overflow.
     */
    bool parseCoins(const std::string& text, Quantity& out);

} // namespace gavel

#endif // GAVEL_AMOUNT_H
