/**
 * @file MessageIdentifier.hpp
 * @brief Identifier tag inspection for routing heterogeneous buffers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace DIGISTREAM::Wire {

/**
 * @brief Kind of message carried by a buffer
 */
enum class MessageKind : uint8_t {
    EventList = 0,    ///< "dev2" DigitizerEventListMessage
    AnalogTrace = 1,  ///< "dat2" DigitizerAnalogTraceMessage
    Unknown = 2       ///< Any other tag, or a buffer too short to hold one
};

/**
 * @brief Peek at the identifier tag without parsing the rest of the buffer
 */
MessageKind identify(const uint8_t* data, size_t size);

/**
 * @brief True if the buffer starts with the given 4-character tag
 */
bool bufferHasIdentifier(const uint8_t* data, size_t size, const char* identifier);

/**
 * @brief Tag written for a message kind, nullptr for Unknown
 */
const char* identifierFor(MessageKind kind);

/**
 * @brief Convert MessageKind to string for logging
 */
std::string messageKindToString(MessageKind kind);

/**
 * @brief Printable rendering of the first bytes of a buffer, e.g. "dev2" or "\x00\x01.."
 */
std::string describeIdentifier(const uint8_t* data, size_t size);

} // namespace DIGISTREAM::Wire
