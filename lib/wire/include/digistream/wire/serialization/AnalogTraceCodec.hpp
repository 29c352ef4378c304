/**
 * @file AnalogTraceCodec.hpp
 * @brief Encoding and zero-copy decoding of "dat2" analog-trace messages
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "digistream/core/AnalogTraceMessage.hpp"
#include "digistream/core/FrameMetadata.hpp"
#include "digistream/wire/config/CodecConfig.hpp"
#include "digistream/wire/serialization/BufferIO.hpp"
#include "digistream/wire/utils/Error.hpp"
#include "digistream/wire/utils/Logger.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief One channel's waveform, borrowed from the source buffer
 */
struct ChannelTraceView {
    uint32_t channel = 0;
    ArrayView<uint16_t> voltage;

    Core::ChannelTrace toOwned() const;
};

/**
 * @brief Decoded analog trace borrowing its waveforms from the source buffer
 *
 * Only the small per-channel index is allocated; samples stay in the buffer.
 * Valid only as long as the buffer passed to AnalogTraceCodec::decode().
 */
struct AnalogTraceView {
    uint8_t digitizer_id = 0;
    Core::FrameMetadata metadata;
    uint64_t sample_rate = 0;
    std::vector<ChannelTraceView> channels;

    /// First channel with the given number, nullptr if absent
    const ChannelTraceView* findChannel(uint32_t channel) const;

    /// Sum of sample counts over all channels
    size_t totalSamples() const;

    Core::AnalogTraceMessage toOwned() const;
};

/**
 * @brief Codec for DigitizerAnalogTraceMessage buffers
 *
 * A zero sample rate is always rejected. Duplicate channel numbers are
 * rejected when CodecConfig::strict_channels is set, otherwise logged.
 */
class AnalogTraceCodec {
public:
    AnalogTraceCodec();
    explicit AnalogTraceCodec(const CodecConfig& config);

    const CodecConfig& getConfig() const { return config_; }
    bool isStrict() const { return config_.strict_channels; }

    /**
     * @brief Encode per-channel traces
     * @return ZERO_SAMPLE_RATE, DUPLICATE_CHANNEL (strict mode),
     *         MESSAGE_TOO_LARGE
     */
    Result<std::vector<uint8_t>> encode(uint8_t digitizer_id,
                                        const Core::FrameMetadata& metadata,
                                        uint64_t sample_rate,
                                        const std::vector<Core::ChannelTrace>& channels) const;

    Result<std::vector<uint8_t>> encode(const Core::AnalogTraceMessage& message) const;

    /**
     * @brief Decode without copying the waveforms
     *
     * Errors: BAD_IDENTIFIER, MISSING_REQUIRED_FIELD, TRUNCATED_BUFFER,
     * ZERO_SAMPLE_RATE, DUPLICATE_CHANNEL (strict mode), plus header/format
     * errors. Channels may have different trace lengths.
     */
    Result<AnalogTraceView> decode(const uint8_t* data, size_t size) const;
    Result<AnalogTraceView> decode(const std::vector<uint8_t>& buffer) const;

    // A view into a temporary would dangle
    Result<AnalogTraceView> decode(std::vector<uint8_t>&& buffer) const = delete;

    /**
     * @brief Decode into a message that owns its waveforms
     */
    Result<Core::AnalogTraceMessage> decodeCopy(const uint8_t* data, size_t size) const;
    Result<Core::AnalogTraceMessage> decodeCopy(const std::vector<uint8_t>& buffer) const;

    /**
     * @brief Structural check of a message before encoding
     *
     * Duplicate channels are always reported here, whatever the strict mode.
     * @return All violations found, empty if the message is valid
     */
    static std::vector<Error> validate(const Core::AnalogTraceMessage& message);

private:
    /// Applies the duplicate-channel policy; numbers must be the message's channel list
    Status checkChannels(const std::vector<uint32_t>& numbers, uint8_t digitizer_id,
                         uint32_t frame_number) const;

    CodecConfig config_;
    std::shared_ptr<Logger> logger_;
};

} // namespace DIGISTREAM::Wire
