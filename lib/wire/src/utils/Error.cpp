/**
 * @file Error.cpp
 * @brief Implementation of Error handling and Result pattern
 */

#include "digistream/wire/utils/Error.hpp"
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#ifndef NDEBUG
#include <execinfo.h>  // For backtrace (Linux/macOS)
#include <cstdlib>
#endif

namespace DIGISTREAM::Wire {

Error::Error(Code c, const std::string& msg, int errno_val)
    : code(c), message(msg), timestamp(getCurrentTimestamp()) {

    if (errno_val != 0) {
        system_errno = errno_val;
        message += " (errno: " + std::to_string(errno_val) + " - " + std::strerror(errno_val) + ")";
    }

#ifndef NDEBUG
    captureStackTrace();
#endif
}

std::string Error::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    // Format: "YYYY-MM-DD HH:MM:SS"
    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void Error::captureStackTrace() {
#ifndef NDEBUG
    constexpr int MAX_FRAMES = 16;
    void* buffer[MAX_FRAMES];

    int frame_count = backtrace(buffer, MAX_FRAMES);
    if (frame_count > 0) {
        char** symbols = backtrace_symbols(buffer, frame_count);
        if (symbols) {
            stack_trace.reserve(frame_count);
            for (int i = 0; i < frame_count; ++i) {
                stack_trace.emplace_back(symbols[i]);
            }
            std::free(symbols);
        }
    }

    if (stack_trace.empty()) {
        stack_trace.emplace_back("Stack trace capture not available");
    }
#endif
}

const char* errorCodeToString(Error::Code code) {
    switch (code) {
        case Error::SUCCESS: return "SUCCESS";
        case Error::BAD_IDENTIFIER: return "BAD_IDENTIFIER";
        case Error::MISSING_REQUIRED_FIELD: return "MISSING_REQUIRED_FIELD";
        case Error::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case Error::TRUNCATED_BUFFER: return "TRUNCATED_BUFFER";
        case Error::ZERO_SAMPLE_RATE: return "ZERO_SAMPLE_RATE";
        case Error::DUPLICATE_CHANNEL: return "DUPLICATE_CHANNEL";
        case Error::FIELD_OUT_OF_RANGE: return "FIELD_OUT_OF_RANGE";
        case Error::INVALID_HEADER: return "INVALID_HEADER";
        case Error::VERSION_MISMATCH: return "VERSION_MISMATCH";
        case Error::INVALID_FORMAT: return "INVALID_FORMAT";
        case Error::MESSAGE_TOO_LARGE: return "MESSAGE_TOO_LARGE";
        case Error::MEMORY_ALLOCATION: return "MEMORY_ALLOCATION";
        case Error::INVALID_CONFIG: return "INVALID_CONFIG";
        case Error::SYSTEM_ERROR: return "SYSTEM_ERROR";
    }
    return "UNKNOWN";
}

} // namespace DIGISTREAM::Wire
