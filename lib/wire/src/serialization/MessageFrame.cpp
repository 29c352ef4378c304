#include "MessageFrame.hpp"

#include <cstring>
#include <string>

#include "digistream/wire/serialization/FrameMetadataCodec.hpp"
#include "digistream/wire/serialization/MessageIdentifier.hpp"
#include "digistream/wire/serialization/ProtocolConstants.hpp"

namespace DIGISTREAM::Wire {

void writeMessageFrame(ByteWriter& writer, const char* identifier,
                       const Core::FrameMetadata& metadata)
{
    MessageHeader header{};
    std::memcpy(header.identifier, identifier, IDENTIFIER_SIZE);
    header.format_version = WIRE_FORMAT_VERSION;
    header.header_size = MESSAGE_HEADER_SIZE;
    header.metadata_offset = CANONICAL_METADATA_OFFSET;
    header.body_offset = CANONICAL_BODY_OFFSET;

    writer.writeBytes(&header, sizeof(header));
    writeFrameMetadata(writer, metadata);
}

Result<MessageFrame> readMessageFrame(const uint8_t* data, size_t size,
                                      const char* identifier, size_t max_message_size)
{
    if (!data || size < IDENTIFIER_SIZE) {
        return Error{Error::TRUNCATED_BUFFER,
                     "Buffer of " + std::to_string(data ? size : 0) +
                     " bytes cannot hold an identifier"};
    }

    if (!bufferHasIdentifier(data, size, identifier)) {
        return Error{Error::BAD_IDENTIFIER,
                     std::string("Expected identifier \"") + identifier + "\", found \"" +
                     describeIdentifier(data, size) + "\""};
    }

    if (size > max_message_size) {
        return Error{Error::MESSAGE_TOO_LARGE,
                     "Message of " + std::to_string(size) + " bytes exceeds limit of " +
                     std::to_string(max_message_size)};
    }

    if (size < sizeof(MessageHeader)) {
        return Error{Error::TRUNCATED_BUFFER,
                     "Buffer of " + std::to_string(size) + " bytes is shorter than the " +
                     std::to_string(sizeof(MessageHeader)) + "-byte message header"};
    }

    MessageHeader header;
    std::memcpy(&header, data, sizeof(header));

    if (header.format_version != WIRE_FORMAT_VERSION) {
        return Error{Error::VERSION_MISMATCH,
                     "Unsupported wire format version " + std::to_string(header.format_version)};
    }

    if (header.header_size != MESSAGE_HEADER_SIZE) {
        return Error{Error::INVALID_HEADER,
                     "Unexpected header size " + std::to_string(header.header_size)};
    }

    if (header.metadata_offset == 0) {
        return Error{Error::MISSING_REQUIRED_FIELD, "FrameMetadata is absent"};
    }

    if (header.metadata_offset < MESSAGE_HEADER_SIZE) {
        return Error{Error::INVALID_HEADER,
                     "FrameMetadata offset " + std::to_string(header.metadata_offset) +
                     " points inside the message header"};
    }

    ByteReader reader(data, size);
    auto seek_status = reader.seek(header.metadata_offset);
    if (!isOk(seek_status)) {
        return getError(seek_status);
    }

    auto metadata = readFrameMetadata(reader);
    if (!isOk(metadata)) {
        return getError(metadata);
    }

    uint32_t metadata_end = header.metadata_offset + static_cast<uint32_t>(FRAME_METADATA_SIZE);
    bool body_overlaps_metadata =
        header.body_offset >= header.metadata_offset && header.body_offset < metadata_end;
    if (header.body_offset < MESSAGE_HEADER_SIZE || body_overlaps_metadata) {
        return Error{Error::INVALID_HEADER,
                     "Body offset " + std::to_string(header.body_offset) +
                     " overlaps the header or FrameMetadata"};
    }

    if (header.body_offset > size) {
        return Error{Error::TRUNCATED_BUFFER,
                     "Body offset " + std::to_string(header.body_offset) +
                     " is beyond the end of a " + std::to_string(size) + "-byte buffer"};
    }

    MessageFrame frame;
    frame.metadata = getValue(metadata);
    frame.body_offset = header.body_offset;
    return frame;
}

} // namespace DIGISTREAM::Wire
