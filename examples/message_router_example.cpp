/**
 * @file message_router_example.cpp
 * @brief Consumer routing a mixed buffer stream through MessageDispatcher
 *
 * The stream is produced in-process: event lists, analog traces, a buffer
 * from some other producer and one corrupted event list.
 *
 * Usage: message_router_example [frames] [config.json]
 */

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "digistream/digistream.hpp"

using namespace DIGISTREAM;
using namespace DIGISTREAM::Wire;

namespace {

struct RouterStats {
    size_t event_lists = 0;
    size_t events = 0;
    size_t traces = 0;
    size_t samples = 0;
    size_t foreign = 0;
    size_t malformed = 0;
};

Core::EventListMessage MakeEvents(uint32_t frame) {
    Core::EventListMessage message;
    message.digitizer_id = static_cast<uint8_t>(frame % 4);
    message.metadata.timestamp = Core::GpsTime::now();
    message.metadata.frame_number = frame;
    message.metadata.running = true;
    for (uint32_t i = 0; i < 16 + frame; ++i) {
        message.time.push_back(i * 250);
        message.voltage.push_back(static_cast<uint16_t>(2000 + (i * 37) % 500));
        message.channel.push_back(i % 8);
    }
    return message;
}

Core::AnalogTraceMessage MakeTrace(uint32_t frame) {
    Core::AnalogTraceMessage message;
    message.digitizer_id = 7;
    message.metadata.timestamp = Core::GpsTime::now();
    message.metadata.frame_number = frame;
    message.sample_rate = 500000000ULL;
    for (uint32_t c = 0; c < 4; ++c) {
        message.channels.emplace_back(c, std::vector<uint16_t>(256 + c * 64, 404));
    }
    return message;
}

} // namespace

int main(int argc, char* argv[]) {
    uint32_t frames = 12;
    try {
        if (argc > 1) frames = static_cast<uint32_t>(std::stoul(argv[1]));
    } catch (const std::exception& e) {
        std::cerr << "Invalid frame count: " << e.what() << "\n";
        return 1;
    }

    auto init = initialize(argc > 2 ? argv[2] : nullptr);
    if (!isOk(init)) {
        std::cerr << "Failed to initialize: " << getError(init).message << "\n";
        return 1;
    }

    std::cout << "DIGISTREAM v" << getVersion() << " - Message Router\n";
    std::cout << "===================================\n";

    MessageDispatcher dispatcher(getValue(init));
    auto logger = Logger::getLogger("MessageRouter");

    // Producer side
    std::vector<std::vector<uint8_t>> stream;
    for (uint32_t frame = 0; frame < frames; ++frame) {
        Result<std::vector<uint8_t>> encoded = frame % 3 == 2
            ? dispatcher.analogTraceCodec().encode(MakeTrace(frame))
            : dispatcher.eventListCodec().encode(MakeEvents(frame));
        if (!isOk(encoded)) {
            logger->error("Frame %u: encode failed: %s", frame, getError(encoded).message.c_str());
            return 1;
        }
        stream.push_back(takeValue(std::move(encoded)));
    }
    stream.push_back({'p', 'i', 'n', 'g', 0x00});
    if (!stream.empty() && identify(stream[0].data(), stream[0].size()) == MessageKind::EventList) {
        std::vector<uint8_t> corrupted = stream[0];
        corrupted.resize(corrupted.size() / 2);
        stream.push_back(corrupted);
    }

    // Consumer side
    RouterStats stats;
    dispatcher.onEventList([&](const EventListView& view) {
        ++stats.event_lists;
        stats.events += view.eventCount();
        std::cout << "  dev2 digitizer " << static_cast<int>(view.digitizer_id)
                  << " frame " << std::setw(3) << view.metadata.frame_number
                  << " at " << view.metadata.timestamp.toString()
                  << ": " << view.eventCount() << " events\n";
    });
    dispatcher.onAnalogTrace([&](const AnalogTraceView& view) {
        ++stats.traces;
        stats.samples += view.totalSamples();
        std::cout << "  dat2 digitizer " << static_cast<int>(view.digitizer_id)
                  << " frame " << std::setw(3) << view.metadata.frame_number
                  << ": " << view.channels.size() << " channels, "
                  << view.totalSamples() << " samples at " << view.sample_rate << " S/s\n";
    });
    dispatcher.onUnknown([&](const uint8_t* data, size_t size) {
        ++stats.foreign;
        std::cout << "  skipped foreign buffer \"" << describeIdentifier(data, size) << "\"\n";
    });

    for (const auto& buffer : stream) {
        auto status = dispatcher.dispatch(buffer);
        if (!isOk(status) && !getError(status).isForeignBuffer()) {
            ++stats.malformed;
            logger->warning("Dropped malformed %s buffer: %s",
                            messageKindToString(identify(buffer.data(), buffer.size())).c_str(),
                            getError(status).message.c_str());
        }
    }

    std::cout << "\n=== Routing Summary ===\n";
    std::cout << "Event lists: " << stats.event_lists << " (" << stats.events << " events)\n";
    std::cout << "Analog traces: " << stats.traces << " (" << stats.samples << " samples)\n";
    std::cout << "Foreign buffers: " << stats.foreign << "\n";
    std::cout << "Malformed buffers: " << stats.malformed << "\n";

    DispatchStatistics dispatched = dispatcher.getStatistics();
    std::cout << "Dispatched: " << dispatched.totalReceived() << " buffers, "
              << dispatched.bytes_received << " bytes\n";
    for (const auto& failure : dispatched.failures) {
        std::cout << "  " << errorCodeToString(failure.first) << ": " << failure.second << "\n";
    }
    return 0;
}
