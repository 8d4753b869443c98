#ifndef GAVEL_TYPES_H
#define GAVEL_TYPES_H

#include <cstdint>
#include <cstddef>
#include <limits>

namespace gavel {

    // Base units. 1 coin = 10^8 base units.
    using Quantity = uint64_t;

    // Seconds, supplied by the ledger.
    using Timestamp = uint64_t;

    // ==== UNIDADES ====
    inline constexpr Quantity COIN = 100000000;
    inline constexpr size_t COIN_DECIMALS = 8;

    // ==== REGLAS DE LA SUBASTA ====
    inline constexpr uint64_t MIN_DURATION_SECONDS = 120;
    inline constexpr uint64_t MIN_EXTENSION_SECONDS = 30;
    inline constexpr uint64_t SNIPING_WINDOW_SECONDS = 60;
    inline constexpr uint64_t MAX_DURATION_SECONDS = 10ULL * 365 * 24 * 3600; // 10 años
    inline constexpr uint64_t MAX_EXTENSION_SECONDS = 24 * 3600;

    inline constexpr uint64_t PERCENT_BASE = 100;
    inline constexpr uint64_t BID_INCREMENT_PERCENT = 105; // nueva puja >= 105% de la anterior
    inline constexpr uint64_t COMMISSION_PERCENT = 2;

    // Largest bid whose increment product still fits in 64 bits.
    inline constexpr Quantity MAX_BID_AMOUNT = std::numeric_limits<Quantity>::max() / BID_INCREMENT_PERCENT;

    // ==== CONSTANTES DE DIRECCIONES ====
    inline constexpr size_t ADDRESS_SIZE = 20;       // 20 bytes = 160 bits
    inline constexpr size_t ADDRESS_HEX_LENGTH = 40;
    inline constexpr size_t PUBLIC_KEY_SIZE = 32;    // Ed25519
    inline constexpr size_t PUBLIC_KEY_HEX_LENGTH = 64;
    inline constexpr size_t SHA256_HASH_SIZE = 32;

    // ==== FORMATO DE EVENTOS ====
    inline constexpr uint32_t EVENT_MAGIC = 0x6A7E1B1D;
    inline constexpr uint8_t  EVENT_FORMAT_VERSION = 1;
    inline constexpr size_t   EVENT_HEADER_SIZE = 4 + 1 + 1 + 8; // magic + version + type + payload_len
    inline constexpr size_t   EVENT_PAYLOAD_SIZE = 8 + 8 + 8 + ADDRESS_SIZE + SHA256_HASH_SIZE;
    inline constexpr size_t   EVENT_CHECKSUM_SIZE = 4; // CRC32
    inline constexpr size_t   MAX_EVENT_PAYLOAD_SIZE = 4 * 1024;

} // namespace gavel

#endif // GAVEL_TYPES_H
