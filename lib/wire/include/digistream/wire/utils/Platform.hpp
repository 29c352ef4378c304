#pragma once

#include <cstdint>

namespace DIGISTREAM::Wire {

/**
 * @brief Monotonic timestamp for measuring intervals
 * @return Nanoseconds on the steady clock; not related to wall time
 */
uint64_t getCurrentTimestampNs();

namespace Platform {

/// "Linux", "macOS" or "Unknown", reported at startup
const char* getPlatformName();

} // namespace Platform

} // namespace DIGISTREAM::Wire
