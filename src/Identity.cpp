#include "Identity.hpp"
#include "CryptoBase.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gavel {

    Identity Identity::fromAddress(const std::string& address) {
        if (!isValidAddress(address)) {
            throw std::invalid_argument("Invalid address format: " + address);
        }

        // Normalizar a minúsculas
        std::string normalized = address;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return Identity(normalized);
    }

    Identity Identity::fromPublicKey(const std::vector<uint8_t>& publicKey) {
        if (publicKey.size() != PUBLIC_KEY_SIZE) {
            throw std::invalid_argument("Invalid public key size: " + std::to_string(publicKey.size()));
        }

        return fromDigest(CryptoBase::sha256Bytes(publicKey));
    }

    Identity Identity::fromLabel(const std::string& label) {
        if (label.empty()) {
            throw std::invalid_argument("Empty label provided");
        }

        return fromDigest(CryptoBase::sha256Bytes(label));
    }

    Identity Identity::parse(const std::string& text) {
        if (isValidAddress(text)) return fromAddress(text);
        if (text.length() == PUBLIC_KEY_HEX_LENGTH && CryptoBase::isHexString(text)) {
            return fromPublicKey(CryptoBase::hexDecode(text));
        }
        return fromLabel(text);
    }

    bool Identity::isValidAddress(const std::string& address) {
        if (address.length() != ADDRESS_HEX_LENGTH) {
            return false;
        }

        return CryptoBase::isHexString(address);
    }

    std::vector<uint8_t> Identity::toBytes() const {
        if (isNull()) return std::vector<uint8_t>(ADDRESS_SIZE, 0);
        return CryptoBase::hexDecode(address);
    }

    Identity Identity::fromDigest(const std::vector<uint8_t>& digest) {
        if (digest.size() < ADDRESS_SIZE) {
            throw std::runtime_error("SHA-256 hash too short for address derivation");
        }

        // Últimos 20 bytes del hash
        std::vector<uint8_t> addressBytes(digest.end() - ADDRESS_SIZE, digest.end());
        return Identity(CryptoBase::hexEncode(addressBytes));
    }

} // namespace gavel
