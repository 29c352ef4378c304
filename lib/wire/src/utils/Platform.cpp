/**
 * @file Platform.cpp
 * @brief Clock and host helpers
 */

#include "digistream/wire/utils/Platform.hpp"

#include <chrono>

namespace DIGISTREAM::Wire {

uint64_t getCurrentTimestampNs() {
    auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

const char* Platform::getPlatformName() {
#if defined(__linux__)
    return "Linux";
#elif defined(__APPLE__)
    return "macOS";
#else
    return "Unknown";
#endif
}

} // namespace DIGISTREAM::Wire
