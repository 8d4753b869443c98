#include "Amount.hpp"
#include <cctype>
#include <limits>

namespace gavel {

    Quantity commissionOf(Quantity amount) {
        // amount / 100 * 2 + resto, sin desbordar
        return (amount / PERCENT_BASE) * COMMISSION_PERCENT +
               ((amount % PERCENT_BASE) * COMMISSION_PERCENT) / PERCENT_BASE;
    }

    void splitCommission(Quantity amount, Quantity& commission, Quantity& remainder) {
        commission = commissionOf(amount);
        remainder = amount - commission;
    }

    bool meetsIncrement(Quantity amount, Quantity highestBid) {
        if (highestBid == 0) return amount > 0;
        if (highestBid > MAX_BID_AMOUNT) return false;
        // amount * 100 ya supera cualquier highestBid * 105 representable
        if (amount > std::numeric_limits<Quantity>::max() / PERCENT_BASE) return true;
        return amount * PERCENT_BASE >= highestBid * BID_INCREMENT_PERCENT;
    }

    Quantity minimumNextBid(Quantity highestBid) {
        if (highestBid == 0) return 1;
        const Quantity scaled = highestBid * BID_INCREMENT_PERCENT;
        return scaled / PERCENT_BASE + (scaled % PERCENT_BASE != 0 ? 1 : 0);
    }

    std::string formatCoins(Quantity amount) {
        std::string out = std::to_string(amount / COIN);
        Quantity fraction = amount % COIN;
        if (fraction == 0) return out;

        std::string digits = std::to_string(fraction);
        digits.insert(0, COIN_DECIMALS - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();

        return out + "." + digits;
    }

    bool parseCoins(const std::string& text, Quantity& out) {
        if (text.empty()) return false;

        const size_t dot = text.find('.');
        const std::string whole = text.substr(0, dot);
        std::string fraction = dot == std::string::npos ? "" : text.substr(dot + 1);

        if (whole.empty() && fraction.empty()) return false;
        if (fraction.size() > COIN_DECIMALS) return false;

        for (char c : whole) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        for (char c : fraction) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }

        const Quantity maxValue = std::numeric_limits<Quantity>::max();
        Quantity units = 0;
        for (char c : whole) {
            const Quantity digit = static_cast<Quantity>(c - '0');
            if (units > (maxValue - digit) / 10) return false;
            units = units * 10 + digit;
        }
        if (units > maxValue / COIN) return false;
        units *= COIN;

        fraction.append(COIN_DECIMALS - fraction.size(), '0');
        const Quantity fractionUnits = fraction.empty() ? 0 : std::stoull(fraction);
        if (units > maxValue - fractionUnits) return false;

        out = units + fractionUnits;
        return true;
    }

} // namespace gavel
