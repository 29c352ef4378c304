#include "digistream/wire/serialization/MessageDispatcher.hpp"

#include <string>

#include "digistream/wire/utils/Platform.hpp"

namespace DIGISTREAM::Wire {

uint64_t DispatchStatistics::received(MessageKind kind) const {
    switch (kind) {
        case MessageKind::EventList:
            return event_lists;
        case MessageKind::AnalogTrace:
            return analog_traces;
        case MessageKind::Unknown:
            return unknown;
    }
    return 0;
}

uint64_t DispatchStatistics::failureCount(Error::Code code) const {
    auto it = failures.find(code);
    return it == failures.end() ? 0 : it->second;
}

uint64_t DispatchStatistics::totalFailures() const {
    uint64_t total = 0;
    for (const auto& entry : failures) {
        total += entry.second;
    }
    return total;
}

MessageDispatcher::MessageDispatcher()
    : MessageDispatcher(CodecConfig{})
{
}

MessageDispatcher::MessageDispatcher(const CodecConfig& config)
    : event_list_codec_(config)
    , analog_trace_codec_(config)
    , logger_(Logger::getLogger("MessageDispatcher"))
{
    resetStatistics();
}

Status MessageDispatcher::dispatch(const uint8_t* data, size_t size) const {
    MessageKind kind = identify(data, size);
    switch (kind) {
        case MessageKind::EventList: {
            auto view = event_list_codec_.decode(data, size);
            if (!isOk(view)) {
                return record(kind, size, getError(view));
            }
            if (event_list_handler_) {
                event_list_handler_(getValue(view));
            }
            return record(kind, size, std::monostate{});
        }

        case MessageKind::AnalogTrace: {
            auto view = analog_trace_codec_.decode(data, size);
            if (!isOk(view)) {
                return record(kind, size, getError(view));
            }
            if (analog_trace_handler_) {
                analog_trace_handler_(getValue(view));
            }
            return record(kind, size, std::monostate{});
        }

        case MessageKind::Unknown:
            break;
    }

    std::string tag = describeIdentifier(data, size);
    logger_->debug("Unrecognised identifier \"%s\" (%zu bytes)", tag.c_str(), size);
    if (unknown_handler_) {
        unknown_handler_(data, size);
    }
    return record(kind, size, Error{Error::BAD_IDENTIFIER, "Unrecognised identifier \"" + tag + "\""});
}

Status MessageDispatcher::dispatch(const std::vector<uint8_t>& buffer) const {
    return dispatch(buffer.data(), buffer.size());
}

Status MessageDispatcher::record(MessageKind kind, size_t size, Status status) const {
    received_counts_[static_cast<size_t>(kind)].fetch_add(1, std::memory_order_relaxed);
    bytes_received_.fetch_add(size, std::memory_order_relaxed);
    last_dispatch_ns_.store(getCurrentTimestampNs(), std::memory_order_relaxed);
    if (!isOk(status)) {
        failure_counts_[static_cast<size_t>(getError(status).code)].fetch_add(1, std::memory_order_relaxed);
    }
    return status;
}

DispatchStatistics MessageDispatcher::getStatistics() const {
    DispatchStatistics stats;
    stats.event_lists = received_counts_[static_cast<size_t>(MessageKind::EventList)].load();
    stats.analog_traces = received_counts_[static_cast<size_t>(MessageKind::AnalogTrace)].load();
    stats.unknown = received_counts_[static_cast<size_t>(MessageKind::Unknown)].load();
    stats.bytes_received = bytes_received_.load();
    stats.last_dispatch_ns = last_dispatch_ns_.load();
    for (size_t code = 0; code < ERROR_CODE_COUNT; ++code) {
        uint64_t count = failure_counts_[code].load();
        if (count > 0) {
            stats.failures[static_cast<Error::Code>(code)] = count;
        }
    }
    return stats;
}

void MessageDispatcher::resetStatistics() {
    for (auto& count : received_counts_) {
        count.store(0);
    }
    for (auto& count : failure_counts_) {
        count.store(0);
    }
    bytes_received_.store(0);
    last_dispatch_ns_.store(0);
}

} // namespace DIGISTREAM::Wire
