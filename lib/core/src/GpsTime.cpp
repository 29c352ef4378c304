#include "digistream/core/GpsTime.hpp"

#include <chrono>
#include <cstdio>

namespace DIGISTREAM {
namespace Core {

namespace {

constexpr uint64_t NS_PER_US = 1000ULL;
constexpr uint64_t NS_PER_MS = 1000ULL * NS_PER_US;
constexpr uint64_t NS_PER_SECOND = 1000ULL * NS_PER_MS;
constexpr uint64_t SECONDS_PER_DAY = 86400ULL;
constexpr uint64_t NS_PER_DAY = SECONDS_PER_DAY * NS_PER_SECOND;

// 1970-01-01 to 2000-01-01
constexpr uint64_t DAYS_UNIX_TO_2000 = 10957ULL;
constexpr unsigned BASE_YEAR = 2000;
constexpr unsigned MAX_YEAR_OFFSET = 255;

bool isLeapYear(unsigned year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInYear(unsigned year)
{
    return isLeapYear(year) ? 366 : 365;
}

} // namespace

std::optional<GpsTime> GpsTime::fromUnixNs(uint64_t unix_ns)
{
    uint64_t days = unix_ns / NS_PER_DAY;
    if (days < DAYS_UNIX_TO_2000) {
        return std::nullopt;
    }
    days -= DAYS_UNIX_TO_2000;

    unsigned year_offset = 0;
    while (days >= daysInYear(BASE_YEAR + year_offset)) {
        days -= daysInYear(BASE_YEAR + year_offset);
        ++year_offset;
        if (year_offset > MAX_YEAR_OFFSET) {
            return std::nullopt;
        }
    }

    uint64_t ns_of_day = unix_ns % NS_PER_DAY;
    uint64_t seconds_of_day = ns_of_day / NS_PER_SECOND;
    uint64_t sub_second = ns_of_day % NS_PER_SECOND;

    GpsTime time;
    time.year = static_cast<uint8_t>(year_offset);
    time.day = static_cast<uint16_t>(days + 1);
    time.hour = static_cast<uint8_t>(seconds_of_day / 3600);
    time.minute = static_cast<uint8_t>((seconds_of_day % 3600) / 60);
    time.second = static_cast<uint8_t>(seconds_of_day % 60);
    time.millisecond = static_cast<uint16_t>(sub_second / NS_PER_MS);
    time.microsecond = static_cast<uint16_t>((sub_second % NS_PER_MS) / NS_PER_US);
    time.nanosecond = static_cast<uint16_t>(sub_second % NS_PER_US);
    return time;
}

GpsTime GpsTime::now()
{
    using namespace std::chrono;
    auto ns = duration_cast<nanoseconds>(system_clock::now().time_since_epoch());
    auto time = fromUnixNs(static_cast<uint64_t>(ns.count()));
    return time.value_or(GpsTime{});
}

uint64_t GpsTime::toUnixNs() const
{
    uint64_t days = DAYS_UNIX_TO_2000;
    for (unsigned y = 0; y < year; ++y) {
        days += daysInYear(BASE_YEAR + y);
    }
    days += static_cast<uint64_t>(day) - 1;

    uint64_t seconds = days * SECONDS_PER_DAY
                     + static_cast<uint64_t>(hour) * 3600
                     + static_cast<uint64_t>(minute) * 60
                     + second;

    return seconds * NS_PER_SECOND
         + static_cast<uint64_t>(millisecond) * NS_PER_MS
         + static_cast<uint64_t>(microsecond) * NS_PER_US
         + nanosecond;
}

bool GpsTime::isValid() const
{
    return day >= 1 && day <= daysInYear(BASE_YEAR + year)
        && hour <= 23
        && minute <= 59
        && second <= 59
        && millisecond <= 999
        && microsecond <= 999
        && nanosecond <= 999;
}

std::string GpsTime::toString() const
{
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04u-%03u %02u:%02u:%02u.%03u%03u%03u",
                  BASE_YEAR + year, static_cast<unsigned>(day),
                  static_cast<unsigned>(hour), static_cast<unsigned>(minute),
                  static_cast<unsigned>(second), static_cast<unsigned>(millisecond),
                  static_cast<unsigned>(microsecond), static_cast<unsigned>(nanosecond));
    return std::string(buffer);
}

bool GpsTime::operator==(const GpsTime& other) const
{
    return year == other.year
        && day == other.day
        && hour == other.hour
        && minute == other.minute
        && second == other.second
        && millisecond == other.millisecond
        && microsecond == other.microsecond
        && nanosecond == other.nanosecond;
}

} // namespace Core
} // namespace DIGISTREAM
