/**
 * @file MessageDispatcher.hpp
 * @brief Routes heterogeneous buffers to per-kind handlers
 */

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

#include "digistream/wire/config/CodecConfig.hpp"
#include "digistream/wire/serialization/AnalogTraceCodec.hpp"
#include "digistream/wire/serialization/EventListCodec.hpp"
#include "digistream/wire/serialization/MessageIdentifier.hpp"
#include "digistream/wire/utils/Error.hpp"
#include "digistream/wire/utils/Logger.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief Snapshot of MessageDispatcher counters
 */
struct DispatchStatistics {
    uint64_t event_lists = 0;       ///< "dev2" buffers seen, decoded or not
    uint64_t analog_traces = 0;     ///< "dat2" buffers seen, decoded or not
    uint64_t unknown = 0;           ///< Buffers with an unrecognised tag
    uint64_t bytes_received = 0;
    uint64_t last_dispatch_ns = 0;  ///< Steady clock, 0 if nothing dispatched

    /// Failed dispatches by error code; codes that never occurred are absent
    std::map<Error::Code, uint64_t> failures;

    uint64_t received(MessageKind kind) const;
    uint64_t totalReceived() const { return event_lists + analog_traces + unknown; }
    uint64_t failureCount(Error::Code code) const;
    uint64_t totalFailures() const;
};

/**
 * @brief Consumer-side router
 *
 * dispatch() identifies the buffer, decodes it with the matching codec and
 * hands the borrowed view to the registered handler. Views passed to a
 * handler are valid only for the duration of the call.
 *
 * Handlers are registered before dispatching starts. dispatch() only
 * updates atomic counters, so one dispatcher may serve several threads.
 */
class MessageDispatcher {
public:
    using EventListHandler = std::function<void(const EventListView&)>;
    using AnalogTraceHandler = std::function<void(const AnalogTraceView&)>;
    using UnknownHandler = std::function<void(const uint8_t*, size_t)>;

    MessageDispatcher();
    explicit MessageDispatcher(const CodecConfig& config);

    void onEventList(EventListHandler handler) { event_list_handler_ = std::move(handler); }
    void onAnalogTrace(AnalogTraceHandler handler) { analog_trace_handler_ = std::move(handler); }

    /// Called with buffers whose identifier is not recognised
    void onUnknown(UnknownHandler handler) { unknown_handler_ = std::move(handler); }

    /**
     * @brief Decode one buffer and invoke its handler
     *
     * A recognised kind without a handler is still decoded, so malformed
     * buffers are reported either way.
     *
     * @return Decode error, or BAD_IDENTIFIER for an unknown tag (after the
     *         unknown handler, if any, has run)
     */
    Status dispatch(const uint8_t* data, size_t size) const;
    Status dispatch(const std::vector<uint8_t>& buffer) const;

    const EventListCodec& eventListCodec() const { return event_list_codec_; }
    const AnalogTraceCodec& analogTraceCodec() const { return analog_trace_codec_; }

    // Statistics
    DispatchStatistics getStatistics() const;
    void resetStatistics();

private:
    static constexpr size_t MESSAGE_KIND_COUNT = static_cast<size_t>(MessageKind::Unknown) + 1;
    static constexpr size_t ERROR_CODE_COUNT = static_cast<size_t>(Error::SYSTEM_ERROR) + 1;

    Status record(MessageKind kind, size_t size, Status status) const;

    EventListCodec event_list_codec_;
    AnalogTraceCodec analog_trace_codec_;

    EventListHandler event_list_handler_;
    AnalogTraceHandler analog_trace_handler_;
    UnknownHandler unknown_handler_;

    std::shared_ptr<Logger> logger_;

    mutable std::array<std::atomic<uint64_t>, MESSAGE_KIND_COUNT> received_counts_;
    mutable std::array<std::atomic<uint64_t>, ERROR_CODE_COUNT> failure_counts_;
    mutable std::atomic<uint64_t> bytes_received_{0};
    mutable std::atomic<uint64_t> last_dispatch_ns_{0};
};

} // namespace DIGISTREAM::Wire
