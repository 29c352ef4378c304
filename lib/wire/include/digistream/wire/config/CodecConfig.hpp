/**
 * @file CodecConfig.hpp
 * @brief Options shared by the event-list and analog-trace codecs
 */

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

#include "digistream/wire/serialization/ProtocolConstants.hpp"
#include "digistream/wire/utils/Error.hpp"
#include "digistream/wire/utils/Logger.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief Codec configuration
 *
 * @par Example JSON:
 * @code{.json}
 * {
 *   "strict_channels": true,
 *   "max_message_size": 16777216,
 *   "log_level": "info",
 *   "log_directory": "./logs"
 * }
 * @endcode
 */
struct CodecConfig {
    /// Reject duplicate channel numbers in analog traces instead of warning
    bool strict_channels = false;

    /// Largest buffer accepted by decode or produced by encode
    size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE;

    LogLevel log_level = LogLevel::WARNING;

    /// Empty = log to stderr
    std::string log_directory;

    /**
     * @brief Check option values
     * @return INVALID_CONFIG if max_message_size cannot hold an empty message
     */
    Status validate() const;

    /**
     * @brief Build a configuration from JSON; absent keys keep their defaults
     */
    static Result<CodecConfig> fromJSON(const nlohmann::json& config);

    /**
     * @brief Load a JSON configuration file
     */
    static Result<CodecConfig> fromFile(const std::string& filename);

    nlohmann::json toJSON() const;
};

/**
 * @brief Apply log_level and log_directory to the shared loggers
 */
Status configureLogging(const CodecConfig& config);

} // namespace DIGISTREAM::Wire
