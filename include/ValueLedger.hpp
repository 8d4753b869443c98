#pragma once
#ifndef GAVEL_VALUE_LEDGER_HPP
#define GAVEL_VALUE_LEDGER_HPP

#include <string>
#include "Identity.hpp"
#include "Types.hpp"

namespace gavel {

    /**
     * Runtime that holds the auction's value and supplies the time. Every
     * transfer either completes or fails without partial effect.
     */
    class ValueLedger {
    public:
        virtual ~ValueLedger() = default;

        /**
         * Pays `amount` out of the auction's holdings to `to`.
         * @return false if the ledger refused the transfer
         */
        virtual bool transfer(const Identity& to, Quantity amount, const std::string& memo) = 0;

        /** Current time; never decreases between calls. */
        virtual Timestamp now() const = 0;
    };

} // namespace gavel

#endif // GAVEL_VALUE_LEDGER_HPP
