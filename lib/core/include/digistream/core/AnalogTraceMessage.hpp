#ifndef DIGISTREAM_CORE_ANALOGTRACEMESSAGE_HPP
#define DIGISTREAM_CORE_ANALOGTRACEMESSAGE_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "digistream/core/FrameMetadata.hpp"

namespace DIGISTREAM {
namespace Core {

/**
 * @brief Raw waveform of a single channel
 */
struct ChannelTrace {
    uint32_t channel = 0;
    std::vector<uint16_t> voltage;

    ChannelTrace() = default;
    ChannelTrace(uint32_t ch, std::vector<uint16_t> samples)
        : channel(ch), voltage(std::move(samples))
    {
    }

    bool operator==(const ChannelTrace& other) const
    {
        return channel == other.channel && voltage == other.voltage;
    }
    bool operator!=(const ChannelTrace& other) const { return !(*this == other); }
};

/**
 * @brief Trace-mode digitizer output for one frame
 *
 * sample_rate (samples/second) applies to every channel. Trace lengths may
 * differ from channel to channel. Channel numbers are expected to be unique.
 */
struct AnalogTraceMessage {
    uint8_t digitizer_id = 0;
    FrameMetadata metadata;
    uint64_t sample_rate = 0;
    std::vector<ChannelTrace> channels;

    /// First trace with the given channel number, nullptr if absent
    const ChannelTrace* findChannel(uint32_t channel) const
    {
        for (const auto& trace : channels) {
            if (trace.channel == channel) {
                return &trace;
            }
        }
        return nullptr;
    }

    bool operator==(const AnalogTraceMessage& other) const
    {
        return digitizer_id == other.digitizer_id
            && metadata == other.metadata
            && sample_rate == other.sample_rate
            && channels == other.channels;
    }
    bool operator!=(const AnalogTraceMessage& other) const { return !(*this == other); }
};

} // namespace Core
} // namespace DIGISTREAM

#endif // DIGISTREAM_CORE_ANALOGTRACEMESSAGE_HPP
