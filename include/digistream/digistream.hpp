#ifndef DIGISTREAM_HPP
#define DIGISTREAM_HPP

/**
 * @file digistream.hpp
 * @brief Main umbrella header for the DIGISTREAM wire format library
 *
 * This header provides access to all DIGISTREAM components:
 * - Core value types shared by producers and consumers
 * - Wire library for encoding, decoding and routing digitizer messages
 *
 * Usage:
 *   #include <digistream/digistream.hpp>
 *
 * For selective inclusion, use individual headers:
 * - For value types only: #include "digistream/core/EventListMessage.hpp"
 * - For one codec: #include "digistream/wire/serialization/EventListCodec.hpp"
 */

// ============================================================================
// CORE LIBRARY HEADERS
// ============================================================================

#include "digistream/core/AnalogTraceMessage.hpp"
#include "digistream/core/EventListMessage.hpp"
#include "digistream/core/FrameMetadata.hpp"
#include "digistream/core/GpsTime.hpp"

// ============================================================================
// WIRE LIBRARY HEADERS
// ============================================================================

// Codecs and routing
#include "digistream/wire/serialization/AnalogTraceCodec.hpp"
#include "digistream/wire/serialization/EventListCodec.hpp"
#include "digistream/wire/serialization/FrameMetadataCodec.hpp"
#include "digistream/wire/serialization/MessageDispatcher.hpp"
#include "digistream/wire/serialization/MessageIdentifier.hpp"

// Layout constants and buffer helpers
#include "digistream/wire/serialization/BufferIO.hpp"
#include "digistream/wire/serialization/ProtocolConstants.hpp"

// Configuration and utilities
#include "digistream/wire/config/CodecConfig.hpp"
#include "digistream/wire/utils/Error.hpp"
#include "digistream/wire/utils/Logger.hpp"
#include "digistream/wire/utils/Platform.hpp"

// ============================================================================
// LIBRARY UTILITIES AND VERSION INFO
// ============================================================================

/**
 * @namespace DIGISTREAM
 * @brief Main namespace for all DIGISTREAM components
 */
namespace DIGISTREAM
{

/**
 * @brief Get library version information
 * @return Version string in format "major.minor.patch"
 */
const char *getVersion();

/**
 * @brief Initialize logging from an optional JSON codec configuration
 * @param config_path Path to a configuration file, nullptr for defaults
 * @return Loaded configuration, or the error that prevented loading it
 */
Wire::Result<Wire::CodecConfig> initialize(const char *config_path = nullptr);

}  // namespace DIGISTREAM

#endif  // DIGISTREAM_HPP
