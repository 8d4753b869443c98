#include "EventCodec.hpp"
#include "CryptoBase.hpp"
#include <zlib.h>
#include <algorithm>

namespace gavel {

    // ------------------------------------------------------------
    // Big-endian helpers
    // ------------------------------------------------------------
    namespace {
        void putUint32(std::vector<uint8_t>& out, uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        void putUint64(std::vector<uint8_t>& out, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        uint32_t getUint32(const std::vector<uint8_t>& in, size_t position) {
            uint32_t value = 0;
            for (size_t i = 0; i < 4; ++i) value = (value << 8) | in[position + i];
            return value;
        }

        uint64_t getUint64(const std::vector<uint8_t>& in, size_t position) {
            uint64_t value = 0;
            for (size_t i = 0; i < 8; ++i) value = (value << 8) | in[position + i];
            return value;
        }
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32Buffer(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // SERIALIZACIÓN
    // ------------------------------------------------------------
    std::vector<uint8_t> encodeEvent(const AuctionEvent& event) {
        std::vector<uint8_t> buffer;
        buffer.reserve(EVENT_HEADER_SIZE + EVENT_PAYLOAD_SIZE + EVENT_CHECKSUM_SIZE);

        putUint32(buffer, EVENT_MAGIC);
        buffer.push_back(EVENT_FORMAT_VERSION);
        buffer.push_back(static_cast<uint8_t>(event.type));
        putUint64(buffer, EVENT_PAYLOAD_SIZE);

        putUint64(buffer, event.sequence);
        putUint64(buffer, event.timestamp);
        putUint64(buffer, event.amount);

        std::vector<uint8_t> subject = event.subject.toBytes();
        buffer.insert(buffer.end(), subject.begin(), subject.end());

        std::vector<uint8_t> hash = event.hash;
        hash.resize(SHA256_HASH_SIZE, 0);
        buffer.insert(buffer.end(), hash.begin(), hash.end());

        // checksum CRC32 sobre todo lo anterior
        putUint32(buffer, crc32Buffer(buffer.data(), buffer.size()));

        return buffer;
    }

    // ------------------------------------------------------------
    // PARSEO SOLO DE CABECERA
    // ------------------------------------------------------------
    bool parseEventHeader(const std::vector<uint8_t>& buffer, EventFrameHeader& header) {
        if (buffer.size() < EVENT_HEADER_SIZE) return false;

        header.magic = getUint32(buffer, 0);
        header.version = buffer[4];
        const uint8_t rawType = buffer[5];
        header.payloadLength = getUint64(buffer, 6);

        if (header.magic != EVENT_MAGIC) return false;
        if (header.version != EVENT_FORMAT_VERSION) return false;
        if (!isKnownEventType(rawType)) return false;
        if (header.payloadLength > MAX_EVENT_PAYLOAD_SIZE) return false;

        header.type = static_cast<EventType>(rawType);
        return true;
    }

    // ------------------------------------------------------------
    // PARSEO COMPLETO (cabecera + payload + checksum)
    // ------------------------------------------------------------
    bool decodeEvent(const std::vector<uint8_t>& buffer, AuctionEvent& event) {
        EventFrameHeader header;
        if (!parseEventHeader(buffer, header)) return false;
        if (header.payloadLength != EVENT_PAYLOAD_SIZE) return false;

        const size_t totalLength = EVENT_HEADER_SIZE + EVENT_PAYLOAD_SIZE + EVENT_CHECKSUM_SIZE;
        if (buffer.size() < totalLength) return false; // datos incompletos

        const uint32_t received = getUint32(buffer, EVENT_HEADER_SIZE + EVENT_PAYLOAD_SIZE);
        const uint32_t calculated = crc32Buffer(buffer.data(), EVENT_HEADER_SIZE + EVENT_PAYLOAD_SIZE);
        if (received != calculated) return false; // corrupción

        size_t position = EVENT_HEADER_SIZE;
        AuctionEvent decoded;
        decoded.type = header.type;
        decoded.sequence = getUint64(buffer, position);
        position += 8;
        decoded.timestamp = getUint64(buffer, position);
        position += 8;
        decoded.amount = getUint64(buffer, position);
        position += 8;

        std::vector<uint8_t> subject(buffer.begin() + position, buffer.begin() + position + ADDRESS_SIZE);
        position += ADDRESS_SIZE;
        const bool nullSubject = std::all_of(subject.begin(), subject.end(), [](uint8_t b) { return b == 0; });
        if (!nullSubject) {
            decoded.subject = Identity::fromAddress(CryptoBase::hexEncode(subject));
        }

        decoded.hash.assign(buffer.begin() + position, buffer.begin() + position + SHA256_HASH_SIZE);

        event = decoded;
        return true;
    }

} // namespace gavel
