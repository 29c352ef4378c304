/**
 * @file EventListCodec.hpp
 * @brief Encoding and zero-copy decoding of "dev2" event-list messages
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "digistream/core/EventListMessage.hpp"
#include "digistream/core/FrameMetadata.hpp"
#include "digistream/wire/config/CodecConfig.hpp"
#include "digistream/wire/serialization/BufferIO.hpp"
#include "digistream/wire/utils/Error.hpp"
#include "digistream/wire/utils/Logger.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief Decoded event list borrowing its arrays from the source buffer
 *
 * Valid only as long as the buffer passed to EventListCodec::decode().
 * Use toOwned() or EventListCodec::decodeCopy() to outlive it.
 */
struct EventListView {
    uint8_t digitizer_id = 0;
    Core::FrameMetadata metadata;
    ArrayView<uint32_t> time;
    ArrayView<uint16_t> voltage;
    ArrayView<uint32_t> channel;

    size_t eventCount() const { return time.size(); }

    Core::EventListMessage toOwned() const;
};

/**
 * @brief Codec for DigitizerEventListMessage buffers
 *
 * Stateless apart from its configuration; one instance may be shared by
 * several threads.
 */
class EventListCodec {
public:
    EventListCodec();
    explicit EventListCodec(const CodecConfig& config);

    const CodecConfig& getConfig() const { return config_; }

    /**
     * @brief Encode parallel event arrays
     * @return LENGTH_MISMATCH (before anything is written) if the three
     *         arrays differ in length, MESSAGE_TOO_LARGE above the size limit
     */
    Result<std::vector<uint8_t>> encode(uint8_t digitizer_id,
                                        const Core::FrameMetadata& metadata,
                                        const std::vector<uint32_t>& time,
                                        const std::vector<uint16_t>& voltage,
                                        const std::vector<uint32_t>& channel) const;

    Result<std::vector<uint8_t>> encode(const Core::EventListMessage& message) const;

    /**
     * @brief Decode without copying the event arrays
     *
     * Errors: BAD_IDENTIFIER, MISSING_REQUIRED_FIELD, LENGTH_MISMATCH,
     * TRUNCATED_BUFFER, plus header/format errors.
     */
    Result<EventListView> decode(const uint8_t* data, size_t size) const;
    Result<EventListView> decode(const std::vector<uint8_t>& buffer) const;

    // A view into a temporary would dangle
    Result<EventListView> decode(std::vector<uint8_t>&& buffer) const = delete;

    /**
     * @brief Decode into a message that owns its arrays
     */
    Result<Core::EventListMessage> decodeCopy(const uint8_t* data, size_t size) const;
    Result<Core::EventListMessage> decodeCopy(const std::vector<uint8_t>& buffer) const;

    /**
     * @brief Structural check of a message before encoding
     * @return All violations found, empty if the message is valid
     */
    static std::vector<Error> validate(const Core::EventListMessage& message);

private:
    CodecConfig config_;
    std::shared_ptr<Logger> logger_;
};

} // namespace DIGISTREAM::Wire
