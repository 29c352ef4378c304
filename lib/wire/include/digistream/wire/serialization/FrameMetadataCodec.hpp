/**
 * @file FrameMetadataCodec.hpp
 * @brief Encoding of GpsTime and FrameMetadata, shared by both message codecs
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "digistream/core/FrameMetadata.hpp"
#include "digistream/core/GpsTime.hpp"
#include "digistream/wire/serialization/BufferIO.hpp"
#include "digistream/wire/serialization/ProtocolConstants.hpp"
#include "digistream/wire/utils/Error.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief Encode a GpsTime as its fixed GPS_TIME_SIZE-byte layout
 */
std::vector<uint8_t> encodeGpsTime(const Core::GpsTime& time);

/**
 * @brief Decode a GpsTime from the start of a buffer
 * @return TRUNCATED_BUFFER if fewer than GPS_TIME_SIZE bytes are available
 */
Result<Core::GpsTime> decodeGpsTime(const uint8_t* data, size_t size);

/**
 * @brief Encode a FrameMetadata block (FRAME_METADATA_SIZE bytes)
 */
std::vector<uint8_t> encodeFrameMetadata(const Core::FrameMetadata& metadata);

/**
 * @brief Decode a FrameMetadata block from the start of a buffer
 * @return TRUNCATED_BUFFER for short input, MISSING_REQUIRED_FIELD if the
 *         embedded GpsTime is flagged absent
 */
Result<Core::FrameMetadata> decodeFrameMetadata(const uint8_t* data, size_t size);

/// Append a FrameMetadata block to a writer
void writeFrameMetadata(ByteWriter& writer, const Core::FrameMetadata& metadata);

/// Read a FrameMetadata block at the reader's position
Result<Core::FrameMetadata> readFrameMetadata(ByteReader& reader);

/**
 * @brief Range violations of the GpsTime fields, empty if valid
 * @param context Prefix for the messages, e.g. "metadata.timestamp"
 */
std::vector<Error> validateGpsTime(const Core::GpsTime& time, const char* context);

} // namespace DIGISTREAM::Wire
