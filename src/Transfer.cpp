#include "Transfer.hpp"
#include "CryptoBase.hpp"
#include "Amount.hpp"
#include <sstream>
#include <stdexcept>

namespace gavel {

    Transfer::Transfer() : hash(), from(), to(), amount(0), memo(""), timestamp(0) {}

    Transfer::Transfer(const Identity& from, const Identity& to, Quantity amount,
                       const std::string& memo, Timestamp timestamp)
        : from(from), to(to), amount(amount), memo(memo), timestamp(timestamp) {

        if (from.isNull() || to.isNull()) {
            throw std::invalid_argument("From and to accounts cannot be null");
        }

        if (amount == 0) {
            throw std::invalid_argument("Amount must be positive");
        }

        calculateHash();
    }

    // Getters
    std::vector<uint8_t> Transfer::getHash() const { return hash; }
    std::string Transfer::getHashHex() const { return CryptoBase::hexEncode(hash); }
    Identity Transfer::getFrom() const { return from; }
    Identity Transfer::getTo() const { return to; }
    Quantity Transfer::getAmount() const { return amount; }
    std::string Transfer::getMemo() const { return memo; }
    Timestamp Transfer::getTimestamp() const { return timestamp; }

    void Transfer::calculateHash() {
        hash = CryptoBase::sha256Bytes(stringForHash());
    }

    std::string Transfer::stringForHash() const {
        std::stringstream ss;
        ss << from.toString() << "|" << to.toString() << "|" << amount << "|" << memo << "|" << timestamp;
        return ss.str();
    }

    bool Transfer::isValid() const {
        if (from.isNull() || to.isNull() || amount == 0) return false;
        return CryptoBase::sha256Bytes(stringForHash()) == hash;
    }

    bool Transfer::involves(const Identity& account) const {
        return from == account || to == account;
    }

    std::string Transfer::toString() const {
        std::stringstream ss;
        ss << "Transfer{" << from.toString() << " -> " << to.toString()
           << ", amount=" << formatCoins(amount)
           << ", memo=" << memo
           << ", t=" << timestamp << "}";
        return ss.str();
    }

} // namespace gavel
