#ifndef DIGISTREAM_CORE_FRAMEMETADATA_HPP
#define DIGISTREAM_CORE_FRAMEMETADATA_HPP

#include <cstdint>

#include "digistream/core/GpsTime.hpp"

namespace DIGISTREAM {
namespace Core {

/**
 * @brief Per-frame descriptor shared by every digitizer message
 *
 * frame_number increases monotonically within one digitizer's stream but is
 * not unique across digitizers. Embedded by value in both message types.
 */
struct FrameMetadata {
    GpsTime timestamp;             ///< Frame start time
    uint64_t period_number = 0;    ///< Run period counter
    uint8_t protons_per_pulse = 0; ///< Beam intensity for the frame
    bool running = false;          ///< Frame belongs to a recording run
    uint32_t frame_number = 0;     ///< Per-digitizer sequence id
    uint16_t veto_flags = 0;       ///< One bit per veto reason, 0 = no veto

    bool isVetoed() const { return veto_flags != 0; }
    bool hasVeto(uint16_t bit) const { return (veto_flags & bit) != 0; }

    bool operator==(const FrameMetadata& other) const
    {
        return timestamp == other.timestamp
            && period_number == other.period_number
            && protons_per_pulse == other.protons_per_pulse
            && running == other.running
            && frame_number == other.frame_number
            && veto_flags == other.veto_flags;
    }
    bool operator!=(const FrameMetadata& other) const { return !(*this == other); }
};

} // namespace Core
} // namespace DIGISTREAM

#endif // DIGISTREAM_CORE_FRAMEMETADATA_HPP
