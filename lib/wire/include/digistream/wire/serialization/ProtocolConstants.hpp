#pragma once

#include <cstdint>
#include <cstddef>

/**
 * @file ProtocolConstants.hpp
 * @brief Protocol constants and header structures for the digitizer wire format
 *
 * Defines identifier tags, sizes and packed layouts shared by the event-list
 * and analog-trace codecs.
 */

namespace DIGISTREAM::Wire {

// Compile-time endianness check - MUST be little-endian
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__,
              "DIGISTREAM wire library requires little-endian platform");

//=============================================================================
// Protocol Constants
//=============================================================================

/// Size of the ASCII identifier tag at offset 0 of every buffer
constexpr size_t IDENTIFIER_SIZE = 4;

/// Identifier of DigitizerEventListMessage buffers
constexpr char EVENT_LIST_IDENTIFIER[IDENTIFIER_SIZE + 1] = "dev2";

/// Identifier of DigitizerAnalogTraceMessage buffers
constexpr char ANALOG_TRACE_IDENTIFIER[IDENTIFIER_SIZE + 1] = "dat2";

/**
 * @brief Current wire format version
 *
 * Incremented when the layout behind an identifier changes in an
 * incompatible way.
 */
constexpr uint16_t WIRE_FORMAT_VERSION = 1;

/**
 * @brief Default upper bound on a single encoded message (64 MiB)
 *
 * Prevents excessive allocation on corrupted length prefixes.
 */
constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 64 * 1024 * 1024;

/// Value of SerializedFrameMetadata::has_timestamp when the GpsTime is present
constexpr uint8_t FIELD_PRESENT = 1;

//=============================================================================
// Binary Header Structures
//=============================================================================

/**
 * @brief Message header (packed, 16 bytes)
 *
 * All multi-byte integers use little-endian byte order.
 * Offsets are measured from the start of the buffer.
 */
struct __attribute__((packed)) MessageHeader {
    char identifier[IDENTIFIER_SIZE]; ///< "dev2" or "dat2"
    uint16_t format_version;          ///< WIRE_FORMAT_VERSION
    uint16_t header_size;             ///< sizeof(MessageHeader)
    uint32_t metadata_offset;         ///< FrameMetadata block, 0 = absent
    uint32_t body_offset;             ///< Message body
}; // Total: 16 bytes

static_assert(sizeof(MessageHeader) == 16, "MessageHeader must be exactly 16 bytes");

constexpr uint16_t MESSAGE_HEADER_SIZE = sizeof(MessageHeader);

/**
 * @brief Serialized GpsTime (packed, 12 bytes, declared field order)
 */
struct __attribute__((packed)) SerializedGpsTime {
    uint8_t year;
    uint16_t day;
    uint8_t hour;
    uint8_t minute;
    uint8_t second;
    uint16_t millisecond;
    uint16_t microsecond;
    uint16_t nanosecond;
}; // Total: 12 bytes

static_assert(sizeof(SerializedGpsTime) == 12, "SerializedGpsTime must be exactly 12 bytes");

constexpr size_t GPS_TIME_SIZE = sizeof(SerializedGpsTime);

/**
 * @brief Serialized FrameMetadata (packed, 29 bytes)
 */
struct __attribute__((packed)) SerializedFrameMetadata {
    uint8_t has_timestamp;       ///< FIELD_PRESENT or 0
    SerializedGpsTime timestamp; ///< Undefined unless has_timestamp
    uint64_t period_number;
    uint8_t protons_per_pulse;
    uint8_t running;             ///< 0 or 1
    uint32_t frame_number;
    uint16_t veto_flags;
}; // Total: 29 bytes

static_assert(sizeof(SerializedFrameMetadata) == 29, "SerializedFrameMetadata must be exactly 29 bytes");

constexpr size_t FRAME_METADATA_SIZE = sizeof(SerializedFrameMetadata);

/// Offset of the FrameMetadata block written by the encoders
constexpr uint32_t CANONICAL_METADATA_OFFSET = MESSAGE_HEADER_SIZE;

/// Offset of the message body written by the encoders
constexpr uint32_t CANONICAL_BODY_OFFSET = MESSAGE_HEADER_SIZE + FRAME_METADATA_SIZE;

//=============================================================================
// Body Layouts (follow the FrameMetadata block)
//=============================================================================

/**
 * @brief Size of an event-list body
 *
 * 1. digitizer_id: 1 byte
 * 2. time:    4-byte count + n * 4 bytes
 * 3. voltage: 4-byte count + n * 2 bytes
 * 4. channel: 4-byte count + n * 4 bytes
 */
constexpr size_t calculateEventListBodySize(size_t eventCount) {
    return sizeof(uint8_t)
         + sizeof(uint32_t) + eventCount * sizeof(uint32_t)
         + sizeof(uint32_t) + eventCount * sizeof(uint16_t)
         + sizeof(uint32_t) + eventCount * sizeof(uint32_t);
}

/// Complete encoded event-list message
constexpr size_t calculateEventListSize(size_t eventCount) {
    return CANONICAL_BODY_OFFSET + calculateEventListBodySize(eventCount);
}

/// Fixed part of an analog-trace body: digitizer_id, sample_rate, channel count
constexpr size_t ANALOG_TRACE_BODY_FIXED_SIZE =
    sizeof(uint8_t) + sizeof(uint64_t) + sizeof(uint32_t);

/// One channel entry: channel number, sample count, samples
constexpr size_t calculateChannelTraceSize(size_t sampleCount) {
    return sizeof(uint32_t) + sizeof(uint32_t) + sampleCount * sizeof(uint16_t);
}

/**
 * @brief Complete encoded analog-trace message
 * @param channelCount Number of channel entries
 * @param totalSamples Sum of samples over all channels
 */
constexpr size_t calculateAnalogTraceSize(size_t channelCount, size_t totalSamples) {
    return CANONICAL_BODY_OFFSET + ANALOG_TRACE_BODY_FIXED_SIZE
         + channelCount * calculateChannelTraceSize(0)
         + totalSamples * sizeof(uint16_t);
}

} // namespace DIGISTREAM::Wire
