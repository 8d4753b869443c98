#pragma once
#ifndef GAVEL_EVENT_CODEC_HPP
#define GAVEL_EVENT_CODEC_HPP

#include "AuctionEvent.hpp"
#include <cstdint>
#include <vector>

namespace gavel {

    /**
     * Frame header of an encoded notification.
     */
    struct EventFrameHeader {
        uint32_t magic = EVENT_MAGIC;
        uint8_t version = EVENT_FORMAT_VERSION;
        EventType type = EventType::NEW_BID;
        uint64_t payloadLength = 0;
    };

    /** Serializes a committed event for subscribers outside the process:
     * [magic(4) big-endian] [version(1)] [type(1)] [payload_len(8) big-endian]
     * [sequence(8)] [timestamp(8)] [amount(8)] [subject(20)] [hash(32)]
     * [crc32(4)]
     */
    std::vector<uint8_t> encodeEvent(const AuctionEvent& event);

    /** Parses ONLY the header. Returns false if the buffer is too short or a
     * field is invalid (magic, version, type, size).
     */
    bool parseEventHeader(const std::vector<uint8_t>& buffer, EventFrameHeader& header);

    /** Parses a full frame and validates its CRC32.
     * The decoded event carries no previousHash; the hash is the one that
     * was encoded.
     */
    bool decodeEvent(const std::vector<uint8_t>& buffer, AuctionEvent& event);

    /** CRC32 of a buffer */
    uint32_t crc32Buffer(const void* data, size_t length);

} // namespace gavel

#endif // GAVEL_EVENT_CODEC_HPP
