#ifndef GAVEL_CRYPTO_BASE_H
#define GAVEL_CRYPTO_BASE_H

#include <vector>
#include <string>
#include <cstdint>
#include <sodium.h>
#include "Types.hpp"

namespace gavel {

    /**
     * @class CryptoBase
     * @brief Thin wrapper over libsodium for the hashing and encoding helpers
     * used by identities, transfer records and the event chain.
     */
    class CryptoBase {
    public:
        /**
         * @brief Initializes libsodium. Must succeed once before any hashing.
         * @return true if libsodium is ready, false otherwise
         */
        static bool initialize();

        // Hashing SHA-256
        static std::vector<uint8_t> sha256Bytes(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> sha256Bytes(const std::string& data);
        static std::string sha256(const std::string& data);

        // Codificación hexadecimal
        static std::string hexEncode(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> hexDecode(const std::string& hexStr);
        static bool isHexString(const std::string& str);
    };

} // namespace gavel

#endif // GAVEL_CRYPTO_BASE_H
