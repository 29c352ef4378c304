#ifndef DIGISTREAM_CORE_GPSTIME_HPP
#define DIGISTREAM_CORE_GPSTIME_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace DIGISTREAM {
namespace Core {

/**
 * @brief Fixed-layout GPS timestamp of a digitizer frame
 *
 * Every field is a fixed-width unsigned integer. The year is counted from
 * 2000, the day is the day of the year (1-366). Sub-second resolution is
 * split into milli/micro/nanosecond parts (0-999 each).
 */
class GpsTime {
public:
    GpsTime()
        : year(0)
        , day(1)
        , hour(0)
        , minute(0)
        , second(0)
        , millisecond(0)
        , microsecond(0)
        , nanosecond(0)
    {
    }

    GpsTime(uint8_t yr, uint16_t dy, uint8_t hr, uint8_t min, uint8_t sec,
            uint16_t ms, uint16_t us, uint16_t ns)
        : year(yr)
        , day(dy)
        , hour(hr)
        , minute(min)
        , second(sec)
        , millisecond(ms)
        , microsecond(us)
        , nanosecond(ns)
    {
    }

    /**
     * @brief Convert nanoseconds since the Unix epoch (UTC)
     * @return GpsTime, or std::nullopt before 2000-01-01 or after 2255
     */
    static std::optional<GpsTime> fromUnixNs(uint64_t unix_ns);

    /**
     * @brief Stamp the current system time
     */
    static GpsTime now();

    /**
     * @brief Nanoseconds since the Unix epoch
     * @warning Only meaningful if isValid() is true
     */
    uint64_t toUnixNs() const;

    /**
     * @brief Check every field against its documented range
     */
    bool isValid() const;

    /// "YYYY-DDD HH:MM:SS.mmmuuunnn"
    std::string toString() const;

    bool operator==(const GpsTime& other) const;
    bool operator!=(const GpsTime& other) const { return !(*this == other); }

    uint8_t year;          // years since 2000
    uint16_t day;          // day of year, 1-366
    uint8_t hour;          // 0-23
    uint8_t minute;        // 0-59
    uint8_t second;        // 0-59
    uint16_t millisecond;  // 0-999
    uint16_t microsecond;  // 0-999
    uint16_t nanosecond;   // 0-999
};

} // namespace Core
} // namespace DIGISTREAM

#endif // DIGISTREAM_CORE_GPSTIME_HPP
