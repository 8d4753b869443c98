#ifndef GAVEL_TRANSFER_H
#define GAVEL_TRANSFER_H

#include <string>
#include <vector>
#include <cstdint>
#include "Identity.hpp"
#include "Types.hpp"

namespace gavel {

    /**
     * @class Transfer
     * @brief Record of one movement of value on a ledger, identified by the
     * SHA-256 of its fields.
     */
    class Transfer {
    private:
        std::vector<uint8_t> hash;
        Identity from;
        Identity to;
        Quantity amount;
        std::string memo;
        Timestamp timestamp;

        void calculateHash();

    public:
        Transfer();

        /**
         * @param from Account debited
         * @param to Account credited
         * @param amount Value moved, in base units (must be positive)
         * @param memo Free text describing the movement ("refund", "proceeds", ...)
         * @param timestamp Ledger time of the movement
         * @throws std::invalid_argument on null accounts or a zero amount
         */
        Transfer(const Identity& from, const Identity& to, Quantity amount,
                 const std::string& memo, Timestamp timestamp);

        // Getters
        std::vector<uint8_t> getHash() const;
        std::string getHashHex() const;
        Identity getFrom() const;
        Identity getTo() const;
        Quantity getAmount() const;
        std::string getMemo() const;
        Timestamp getTimestamp() const;

        bool isValid() const;
        bool involves(const Identity& account) const;

        std::string stringForHash() const;
        std::string toString() const;
    };

} // namespace gavel

#endif // GAVEL_TRANSFER_H
