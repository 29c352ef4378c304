#ifndef DIGISTREAM_CORE_EVENTLISTMESSAGE_HPP
#define DIGISTREAM_CORE_EVENTLISTMESSAGE_HPP

#include <cstdint>
#include <vector>

#include "digistream/core/FrameMetadata.hpp"

namespace DIGISTREAM {
namespace Core {

/**
 * @brief Event-mode digitizer output for one frame
 *
 * time, voltage and channel are parallel arrays: index i of each describes
 * one detected event. They must always have the same length.
 */
struct EventListMessage {
    uint8_t digitizer_id = 0;
    FrameMetadata metadata;
    std::vector<uint32_t> time;     ///< ns since frame start
    std::vector<uint16_t> voltage;  ///< measured pulse voltage
    std::vector<uint32_t> channel;  ///< channel number (not an index)

    /// Number of events, valid only when the three arrays agree
    size_t eventCount() const { return time.size(); }

    bool hasAlignedArrays() const
    {
        return time.size() == voltage.size() && time.size() == channel.size();
    }

    bool operator==(const EventListMessage& other) const
    {
        return digitizer_id == other.digitizer_id
            && metadata == other.metadata
            && time == other.time
            && voltage == other.voltage
            && channel == other.channel;
    }
    bool operator!=(const EventListMessage& other) const { return !(*this == other); }
};

} // namespace Core
} // namespace DIGISTREAM

#endif // DIGISTREAM_CORE_EVENTLISTMESSAGE_HPP
