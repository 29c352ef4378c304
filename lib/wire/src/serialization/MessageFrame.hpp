/**
 * @file MessageFrame.hpp
 * @brief Header and FrameMetadata handling common to both message codecs
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "digistream/core/FrameMetadata.hpp"
#include "digistream/wire/serialization/BufferIO.hpp"
#include "digistream/wire/utils/Error.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief Parsed message header plus its FrameMetadata
 */
struct MessageFrame {
    Core::FrameMetadata metadata;
    size_t body_offset;
};

/**
 * @brief Write the header and FrameMetadata block at the start of an empty buffer
 */
void writeMessageFrame(ByteWriter& writer, const char* identifier,
                       const Core::FrameMetadata& metadata);

/**
 * @brief Validate the header of a buffer and decode its FrameMetadata
 *
 * Checks, in order: identifier tag, size limit, header completeness,
 * format version, header size, metadata presence and placement, body offset.
 */
Result<MessageFrame> readMessageFrame(const uint8_t* data, size_t size,
                                      const char* identifier, size_t max_message_size);

} // namespace DIGISTREAM::Wire
