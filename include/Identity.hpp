#ifndef GAVEL_IDENTITY_H
#define GAVEL_IDENTITY_H

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include "Types.hpp"

namespace gavel {

    /**
     * @class Identity
     * @brief Opaque participant identifier: a 20-byte address kept as 40
     * lower-case hexadecimal characters. A default-constructed Identity is the
     * null identity.
     */
    class Identity {
    public:
        Identity() = default;

        /**
         * @brief Builds an identity from a 40-character hex address.
         * @param address Address in hex, any case
         * @return Normalized identity
         * @throws std::invalid_argument if the address is malformed
         */
        static Identity fromAddress(const std::string& address);

        /**
         * @brief Derives an identity from an Ed25519 public key (last 20 bytes
         * of its SHA-256).
         * @throws std::invalid_argument if the key is not 32 bytes
         */
        static Identity fromPublicKey(const std::vector<uint8_t>& publicKey);

        /**
         * @brief Derives an identity from a free-form label (last 20 bytes of
         * the SHA-256 of the label). Used for named accounts in configs and
         * scripts.
         * @throws std::invalid_argument if the label is empty
         */
        static Identity fromLabel(const std::string& label);

        /**
         * @brief Accepts a 40-hex address, a 64-hex Ed25519 public key or a label.
         */
        static Identity parse(const std::string& text);

        static bool isValidAddress(const std::string& address);

        bool isNull() const { return address.empty(); }
        const std::string& toString() const { return address; }
        std::vector<uint8_t> toBytes() const;

        bool operator==(const Identity& other) const { return address == other.address; }
        bool operator!=(const Identity& other) const { return address != other.address; }
        bool operator<(const Identity& other) const { return address < other.address; }

    private:
        explicit Identity(const std::string& normalized) : address(normalized) {}

        static Identity fromDigest(const std::vector<uint8_t>& digest);

        std::string address;
    };

} // namespace gavel

namespace std {
    template <>
    struct hash<gavel::Identity> {
        size_t operator()(const gavel::Identity& id) const {
            return hash<string>()(id.toString());
        }
    };
}

#endif // GAVEL_IDENTITY_H
