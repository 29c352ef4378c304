/**
 * @file AnalogTraceCodec.cpp
 * @brief Implementation of AnalogTraceCodec
 */

#include "digistream/wire/serialization/AnalogTraceCodec.hpp"

#include <algorithm>
#include <limits>
#include <new>
#include <string>

#include "MessageFrame.hpp"
#include "digistream/wire/serialization/FrameMetadataCodec.hpp"
#include "digistream/wire/serialization/ProtocolConstants.hpp"

namespace DIGISTREAM::Wire {

namespace {

/// Channel numbers occurring more than once, ascending, each listed once
std::vector<uint32_t> findDuplicateChannels(std::vector<uint32_t> numbers) {
    std::sort(numbers.begin(), numbers.end());
    std::vector<uint32_t> duplicates;
    for (size_t i = 1; i < numbers.size(); ++i) {
        if (numbers[i] == numbers[i - 1] &&
            (duplicates.empty() || duplicates.back() != numbers[i])) {
            duplicates.push_back(numbers[i]);
        }
    }
    return duplicates;
}

std::string joinChannels(const std::vector<uint32_t>& channels) {
    std::string text;
    for (size_t i = 0; i < channels.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += std::to_string(channels[i]);
    }
    return text;
}

std::vector<uint32_t> channelNumbers(const std::vector<Core::ChannelTrace>& channels) {
    std::vector<uint32_t> numbers;
    numbers.reserve(channels.size());
    for (const auto& trace : channels) {
        numbers.push_back(trace.channel);
    }
    return numbers;
}

Error zeroSampleRate() {
    return Error{Error::ZERO_SAMPLE_RATE, "Analog trace sample_rate is 0"};
}

} // namespace

Core::ChannelTrace ChannelTraceView::toOwned() const {
    return Core::ChannelTrace(channel, voltage.toVector());
}

const ChannelTraceView* AnalogTraceView::findChannel(uint32_t channel) const {
    for (const auto& trace : channels) {
        if (trace.channel == channel) {
            return &trace;
        }
    }
    return nullptr;
}

size_t AnalogTraceView::totalSamples() const {
    size_t total = 0;
    for (const auto& trace : channels) {
        total += trace.voltage.size();
    }
    return total;
}

Core::AnalogTraceMessage AnalogTraceView::toOwned() const {
    Core::AnalogTraceMessage message;
    message.digitizer_id = digitizer_id;
    message.metadata = metadata;
    message.sample_rate = sample_rate;
    message.channels.reserve(channels.size());
    for (const auto& trace : channels) {
        message.channels.push_back(trace.toOwned());
    }
    return message;
}

AnalogTraceCodec::AnalogTraceCodec()
    : AnalogTraceCodec(CodecConfig{})
{
}

AnalogTraceCodec::AnalogTraceCodec(const CodecConfig& config)
    : config_(config)
    , logger_(Logger::getLogger("AnalogTraceCodec"))
{
}

Status AnalogTraceCodec::checkChannels(const std::vector<uint32_t>& numbers, uint8_t digitizer_id,
                                       uint32_t frame_number) const {
    auto duplicates = findDuplicateChannels(numbers);
    if (duplicates.empty()) {
        return std::monostate{};
    }

    std::string description = "Duplicate channel numbers in digitizer " +
                              std::to_string(digitizer_id) + " frame " +
                              std::to_string(frame_number) + ": " + joinChannels(duplicates);
    if (config_.strict_channels) {
        return Error{Error::DUPLICATE_CHANNEL, description};
    }
    logger_->warning(description);
    return std::monostate{};
}

Result<std::vector<uint8_t>> AnalogTraceCodec::encode(uint8_t digitizer_id,
                                                      const Core::FrameMetadata& metadata,
                                                      uint64_t sample_rate,
                                                      const std::vector<Core::ChannelTrace>& channels) const {
    if (sample_rate == 0) {
        return zeroSampleRate();
    }

    auto channel_status = checkChannels(channelNumbers(channels), digitizer_id, metadata.frame_number);
    if (!isOk(channel_status)) {
        return getError(channel_status);
    }

    constexpr size_t MAX_COUNT = std::numeric_limits<uint32_t>::max();
    size_t total_samples = 0;
    for (const auto& trace : channels) {
        if (trace.voltage.size() > MAX_COUNT) {
            return Error{Error::MESSAGE_TOO_LARGE,
                         "Channel " + std::to_string(trace.channel) + " has " +
                         std::to_string(trace.voltage.size()) + " samples"};
        }
        total_samples += trace.voltage.size();
    }

    size_t total_size = calculateAnalogTraceSize(channels.size(), total_samples);
    if (channels.size() > MAX_COUNT || total_size > config_.max_message_size) {
        return Error{Error::MESSAGE_TOO_LARGE,
                     "Analog trace of " + std::to_string(channels.size()) + " channels (" +
                     std::to_string(total_size) + " bytes) exceeds limit of " +
                     std::to_string(config_.max_message_size)};
    }

    try {
        std::vector<uint8_t> buffer;
        buffer.reserve(total_size);
        ByteWriter writer(buffer);

        writeMessageFrame(writer, ANALOG_TRACE_IDENTIFIER, metadata);
        writer.write<uint8_t>(digitizer_id);
        writer.write<uint64_t>(sample_rate);
        writer.write<uint32_t>(static_cast<uint32_t>(channels.size()));
        for (const auto& trace : channels) {
            writer.write<uint32_t>(trace.channel);
            writer.writeSequence(trace.voltage);
        }

        return buffer;
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate buffer for analog trace encoding"};
    }
}

Result<std::vector<uint8_t>> AnalogTraceCodec::encode(const Core::AnalogTraceMessage& message) const {
    return encode(message.digitizer_id, message.metadata, message.sample_rate, message.channels);
}

Result<AnalogTraceView> AnalogTraceCodec::decode(const uint8_t* data, size_t size) const {
    auto frame = readMessageFrame(data, size, ANALOG_TRACE_IDENTIFIER, config_.max_message_size);
    if (!isOk(frame)) {
        logger_->debug("Rejected analog trace buffer: %s", getError(frame).message.c_str());
        return getError(frame);
    }

    ByteReader reader(data, size, getValue(frame).body_offset);

    auto digitizer_id = reader.read<uint8_t>("digitizer_id");
    if (!isOk(digitizer_id)) {
        return getError(digitizer_id);
    }
    auto sample_rate = reader.read<uint64_t>("sample_rate");
    if (!isOk(sample_rate)) {
        return getError(sample_rate);
    }
    if (getValue(sample_rate) == 0) {
        return zeroSampleRate();
    }
    auto channel_count = reader.read<uint32_t>("channel count");
    if (!isOk(channel_count)) {
        return getError(channel_count);
    }

    // Each entry needs at least its channel number and sample count
    uint32_t count = getValue(channel_count);
    if (count > reader.remaining() / calculateChannelTraceSize(0)) {
        return Error{Error::TRUNCATED_BUFFER,
                     "Buffer too small for " + std::to_string(count) + " channel entries"};
    }

    AnalogTraceView view;
    view.digitizer_id = getValue(digitizer_id);
    view.metadata = getValue(frame).metadata;
    view.sample_rate = getValue(sample_rate);

    try {
        view.channels.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto channel = reader.read<uint32_t>("channel");
            if (!isOk(channel)) {
                return getError(channel);
            }
            auto voltage = reader.readSequence<uint16_t>("channel voltage");
            if (!isOk(voltage)) {
                return getError(voltage);
            }
            ChannelTraceView trace;
            trace.channel = getValue(channel);
            trace.voltage = getValue(voltage);
            view.channels.push_back(trace);
        }
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate channel index"};
    }

    if (!reader.atEnd()) {
        return Error{Error::INVALID_FORMAT,
                     std::to_string(reader.remaining()) + " trailing bytes after analog trace body"};
    }

    std::vector<uint32_t> numbers;
    numbers.reserve(view.channels.size());
    for (const auto& trace : view.channels) {
        numbers.push_back(trace.channel);
    }
    auto channel_status = checkChannels(numbers, view.digitizer_id, view.metadata.frame_number);
    if (!isOk(channel_status)) {
        return getError(channel_status);
    }

    return view;
}

Result<AnalogTraceView> AnalogTraceCodec::decode(const std::vector<uint8_t>& buffer) const {
    return decode(buffer.data(), buffer.size());
}

Result<Core::AnalogTraceMessage> AnalogTraceCodec::decodeCopy(const uint8_t* data, size_t size) const {
    auto view = decode(data, size);
    if (!isOk(view)) {
        return getError(view);
    }
    try {
        return getValue(view).toOwned();
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate analog trace copy"};
    }
}

Result<Core::AnalogTraceMessage> AnalogTraceCodec::decodeCopy(const std::vector<uint8_t>& buffer) const {
    return decodeCopy(buffer.data(), buffer.size());
}

std::vector<Error> AnalogTraceCodec::validate(const Core::AnalogTraceMessage& message) {
    std::vector<Error> violations;

    if (message.sample_rate == 0) {
        violations.push_back(zeroSampleRate());
    }

    auto duplicates = findDuplicateChannels(channelNumbers(message.channels));
    if (!duplicates.empty()) {
        violations.emplace_back(Error::DUPLICATE_CHANNEL,
                                "Duplicate channel numbers: " + joinChannels(duplicates));
    }

    auto time_violations = validateGpsTime(message.metadata.timestamp, "metadata.timestamp");
    violations.insert(violations.end(), time_violations.begin(), time_violations.end());

    return violations;
}

} // namespace DIGISTREAM::Wire
