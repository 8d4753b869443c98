#ifndef GAVEL_AUCTION_CONFIG_H
#define GAVEL_AUCTION_CONFIG_H

#include "Identity.hpp"
#include "Types.hpp"
#include <optional>
#include <string>

namespace gavel {

    struct AuctionConfig {
        Identity owner;
        Identity commissionRecipient;
        Identity proceedsRecipient;
        uint64_t durationSeconds = MIN_DURATION_SECONDS;
        uint64_t extensionSeconds = MIN_EXTENSION_SECONDS;
        std::optional<Timestamp> startTime; // defaults to the ledger's clock

        /**
         * Checks the creation bounds: 120 s <= duration <= MAX_DURATION_SECONDS,
         * 30 s <= extension <= MAX_EXTENSION_SECONDS, owner and both
         * recipients non-null.
         * @throws InvalidConfigurationError naming the first violated bound
         */
        void validate() const;

        /**
         * Loads `key = value` lines from a file. Recognized keys: owner,
         * commission_recipient, proceeds_recipient, duration_seconds,
         * extension_seconds, start_time. Blank lines and `#` comments are
         * skipped; malformed lines are reported and skipped.
         *
         * Identities may be 40-hex addresses, 64-hex public keys or labels.
         *
         * @return false if the file cannot be opened
         */
        static bool loadFromFile(const std::string& filename, AuctionConfig& out);
    };

} // namespace gavel

#endif // GAVEL_AUCTION_CONFIG_H
