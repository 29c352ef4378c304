/**
 * @file EventListCodec.cpp
 * @brief Implementation of EventListCodec
 */

#include "digistream/wire/serialization/EventListCodec.hpp"

#include <limits>
#include <new>
#include <string>

#include "MessageFrame.hpp"
#include "digistream/wire/serialization/FrameMetadataCodec.hpp"
#include "digistream/wire/serialization/ProtocolConstants.hpp"

namespace DIGISTREAM::Wire {

namespace {

std::string describeLengths(size_t time, size_t voltage, size_t channel) {
    return "time=" + std::to_string(time) + ", voltage=" + std::to_string(voltage) +
           ", channel=" + std::to_string(channel);
}

} // namespace

Core::EventListMessage EventListView::toOwned() const {
    Core::EventListMessage message;
    message.digitizer_id = digitizer_id;
    message.metadata = metadata;
    message.time = time.toVector();
    message.voltage = voltage.toVector();
    message.channel = channel.toVector();
    return message;
}

EventListCodec::EventListCodec()
    : EventListCodec(CodecConfig{})
{
}

EventListCodec::EventListCodec(const CodecConfig& config)
    : config_(config)
    , logger_(Logger::getLogger("EventListCodec"))
{
}

Result<std::vector<uint8_t>> EventListCodec::encode(uint8_t digitizer_id,
                                                    const Core::FrameMetadata& metadata,
                                                    const std::vector<uint32_t>& time,
                                                    const std::vector<uint16_t>& voltage,
                                                    const std::vector<uint32_t>& channel) const {
    if (time.size() != voltage.size() || time.size() != channel.size()) {
        return Error{Error::LENGTH_MISMATCH,
                     "Event arrays differ in length (" +
                     describeLengths(time.size(), voltage.size(), channel.size()) + ")"};
    }

    size_t total_size = calculateEventListSize(time.size());
    if (time.size() > std::numeric_limits<uint32_t>::max() || total_size > config_.max_message_size) {
        return Error{Error::MESSAGE_TOO_LARGE,
                     "Event list of " + std::to_string(time.size()) + " events (" +
                     std::to_string(total_size) + " bytes) exceeds limit of " +
                     std::to_string(config_.max_message_size)};
    }

    try {
        std::vector<uint8_t> buffer;
        buffer.reserve(total_size);
        ByteWriter writer(buffer);

        writeMessageFrame(writer, EVENT_LIST_IDENTIFIER, metadata);
        writer.write<uint8_t>(digitizer_id);
        writer.writeSequence(time);
        writer.writeSequence(voltage);
        writer.writeSequence(channel);

        return buffer;
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate buffer for event list encoding"};
    }
}

Result<std::vector<uint8_t>> EventListCodec::encode(const Core::EventListMessage& message) const {
    return encode(message.digitizer_id, message.metadata, message.time, message.voltage,
                  message.channel);
}

Result<EventListView> EventListCodec::decode(const uint8_t* data, size_t size) const {
    auto frame = readMessageFrame(data, size, EVENT_LIST_IDENTIFIER, config_.max_message_size);
    if (!isOk(frame)) {
        logger_->debug("Rejected event list buffer: %s", getError(frame).message.c_str());
        return getError(frame);
    }

    ByteReader reader(data, size, getValue(frame).body_offset);

    auto digitizer_id = reader.read<uint8_t>("digitizer_id");
    if (!isOk(digitizer_id)) {
        return getError(digitizer_id);
    }
    auto time = reader.readSequence<uint32_t>("time");
    if (!isOk(time)) {
        return getError(time);
    }
    auto voltage = reader.readSequence<uint16_t>("voltage");
    if (!isOk(voltage)) {
        return getError(voltage);
    }
    auto channel = reader.readSequence<uint32_t>("channel");
    if (!isOk(channel)) {
        return getError(channel);
    }

    EventListView view;
    view.digitizer_id = getValue(digitizer_id);
    view.metadata = getValue(frame).metadata;
    view.time = getValue(time);
    view.voltage = getValue(voltage);
    view.channel = getValue(channel);

    if (view.time.size() != view.voltage.size() || view.time.size() != view.channel.size()) {
        Error error{Error::LENGTH_MISMATCH,
                    "Decoded event arrays differ in length (" +
                    describeLengths(view.time.size(), view.voltage.size(), view.channel.size()) + ")"};
        logger_->debug("Rejected event list buffer: %s", error.message.c_str());
        return error;
    }

    if (!reader.atEnd()) {
        return Error{Error::INVALID_FORMAT,
                     std::to_string(reader.remaining()) + " trailing bytes after event list body"};
    }

    return view;
}

Result<EventListView> EventListCodec::decode(const std::vector<uint8_t>& buffer) const {
    return decode(buffer.data(), buffer.size());
}

Result<Core::EventListMessage> EventListCodec::decodeCopy(const uint8_t* data, size_t size) const {
    auto view = decode(data, size);
    if (!isOk(view)) {
        return getError(view);
    }
    try {
        return getValue(view).toOwned();
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate event list copy"};
    }
}

Result<Core::EventListMessage> EventListCodec::decodeCopy(const std::vector<uint8_t>& buffer) const {
    return decodeCopy(buffer.data(), buffer.size());
}

std::vector<Error> EventListCodec::validate(const Core::EventListMessage& message) {
    std::vector<Error> violations;

    if (!message.hasAlignedArrays()) {
        violations.emplace_back(Error::LENGTH_MISMATCH,
                                "Event arrays differ in length (" +
                                describeLengths(message.time.size(), message.voltage.size(),
                                                message.channel.size()) + ")");
    }

    auto time_violations = validateGpsTime(message.metadata.timestamp, "metadata.timestamp");
    violations.insert(violations.end(), time_violations.begin(), time_violations.end());

    return violations;
}

} // namespace DIGISTREAM::Wire
