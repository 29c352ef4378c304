/**
 * @file trace_generator_example.cpp
 * @brief Synthetic 8-channel analog trace producer
 *
 * Usage: trace_generator_example [digitizer_id] [samples_per_frame]
 *                                [start_frame] [frame_count] [frame_time_ms]
 *                                [config.json]
 */

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "digistream/digistream.hpp"

using namespace DIGISTREAM;
using namespace DIGISTREAM::Wire;

namespace {

constexpr uint32_t CHANNEL_COUNT = 8;
constexpr uint64_t SAMPLE_RATE = 1000000000ULL;
constexpr uint16_t BASELINE = 404;

volatile std::sig_atomic_t running = 1;

void SignalHandler(int) {
    running = 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    uint8_t digitizer_id = 0;
    size_t samples_per_frame = 20000;
    uint32_t frame_number = 0;
    uint32_t frame_count = 10;
    std::chrono::milliseconds frame_time(20);
    const char* config_path = nullptr;

    try {
        if (argc > 1) digitizer_id = static_cast<uint8_t>(std::stoul(argv[1]));
        if (argc > 2) samples_per_frame = std::stoul(argv[2]);
        if (argc > 3) frame_number = static_cast<uint32_t>(std::stoul(argv[3]));
        if (argc > 4) frame_count = static_cast<uint32_t>(std::stoul(argv[4]));
        if (argc > 5) frame_time = std::chrono::milliseconds(std::stoul(argv[5]));
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }
    if (argc > 6) config_path = argv[6];

    auto init = initialize(config_path);
    if (!isOk(init)) {
        std::cerr << "Failed to initialize: " << getError(init).message << "\n";
        return 1;
    }
    const CodecConfig& config = getValue(init);

    std::cout << "DIGISTREAM v" << getVersion() << " - Analog Trace Generator\n";
    std::cout << "=============================================\n";
    std::cout << "Digitizer: " << static_cast<int>(digitizer_id) << "\n";
    std::cout << "Samples per channel: " << samples_per_frame << "\n";
    std::cout << "Frames: " << frame_count << " every " << frame_time.count() << " ms\n\n";

    auto logger = Logger::getLogger("TraceGenerator");
    AnalogTraceCodec codec(config);

    // Sample 0 carries the frame number, sample 1 the digitizer id
    Core::AnalogTraceMessage message;
    message.digitizer_id = digitizer_id;
    message.sample_rate = SAMPLE_RATE;
    for (uint32_t c = 0; c < CHANNEL_COUNT; ++c) {
        std::vector<uint16_t> samples(samples_per_frame, BASELINE);
        if (samples.size() > 1) {
            samples[1] = digitizer_id;
        }
        message.channels.emplace_back(c, std::move(samples));
    }

    size_t total_bytes = 0;
    uint32_t sent = 0;
    while (running && sent < frame_count) {
        message.metadata.timestamp = Core::GpsTime::now();
        message.metadata.frame_number = frame_number;
        message.metadata.running = true;
        for (auto& trace : message.channels) {
            if (!trace.voltage.empty()) {
                trace.voltage[0] = static_cast<uint16_t>(frame_number);
            }
        }

        uint64_t start = getCurrentTimestampNs();
        auto encoded = codec.encode(message);
        uint64_t elapsed_us = (getCurrentTimestampNs() - start) / 1000;

        if (!isOk(encoded)) {
            logger->error("Frame %u: encode failed: %s", frame_number,
                          getError(encoded).message.c_str());
            return 1;
        }

        total_bytes += getValue(encoded).size();
        logger->info("Frame %u (%s): %zu bytes encoded in %llu us", frame_number,
                     message.metadata.timestamp.toString().c_str(), getValue(encoded).size(),
                     static_cast<unsigned long long>(elapsed_us));
        std::cout << "Frame " << frame_number << ": " << getValue(encoded).size()
                  << " bytes, encode took " << elapsed_us << " us\n";

        ++frame_number;
        ++sent;
        std::this_thread::sleep_for(frame_time);
    }

    std::cout << "\nGenerated " << sent << " frames, " << total_bytes << " bytes total\n";
    return 0;
}
