/**
 * @file test_concurrent_codecs.cpp
 * @brief Shared codecs used from several threads at once
 *
 * Each worker encodes and decodes its own randomly generated messages
 * through codec instances shared by all workers. Results must be identical
 * to a single-threaded run over the same messages.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

#include "digistream/wire/serialization/AnalogTraceCodec.hpp"
#include "digistream/wire/serialization/EventListCodec.hpp"
#include "digistream/wire/serialization/MessageIdentifier.hpp"
#include "unit/wire/test_helpers.hpp"

using namespace DIGISTREAM::Wire;
using DIGISTREAM::Core::AnalogTraceMessage;
using DIGISTREAM::Core::EventListMessage;

namespace {
constexpr int NUM_THREADS = 8;
constexpr int MESSAGES_PER_THREAD = 200;
}

class ConcurrentCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 gen(20240601);
        for (int t = 0; t < NUM_THREADS; ++t) {
            std::vector<EventListMessage> events;
            std::vector<AnalogTraceMessage> traces;
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                events.push_back(TestHelpers::MakeRandomEventList(gen));
                traces.push_back(TestHelpers::MakeRandomAnalogTrace(gen));
            }
            event_inputs.push_back(std::move(events));
            trace_inputs.push_back(std::move(traces));
        }

        // Single-threaded baseline
        for (int t = 0; t < NUM_THREADS; ++t) {
            std::vector<std::vector<uint8_t>> events;
            std::vector<std::vector<uint8_t>> traces;
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                auto event_bytes = event_codec.encode(event_inputs[t][i]);
                auto trace_bytes = trace_codec.encode(trace_inputs[t][i]);
                ASSERT_TRUE(isOk(event_bytes));
                ASSERT_TRUE(isOk(trace_bytes));
                events.push_back(getValue(event_bytes));
                traces.push_back(getValue(trace_bytes));
            }
            event_baseline.push_back(std::move(events));
            trace_baseline.push_back(std::move(traces));
        }
    }

    EventListCodec event_codec;
    AnalogTraceCodec trace_codec;

    std::vector<std::vector<EventListMessage>> event_inputs;
    std::vector<std::vector<AnalogTraceMessage>> trace_inputs;
    std::vector<std::vector<std::vector<uint8_t>>> event_baseline;
    std::vector<std::vector<std::vector<uint8_t>>> trace_baseline;
};

/**
 * Interleaved encode and decode on shared codecs matches the baseline
 */
TEST_F(ConcurrentCodecTest, InterleavedEncodeDecodeMatchesBaseline)
{
    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < NUM_THREADS; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                auto event_bytes = event_codec.encode(event_inputs[t][i]);
                auto trace_bytes = trace_codec.encode(trace_inputs[t][i]);
                if (!isOk(event_bytes) || !isOk(trace_bytes)) {
                    failures++;
                    continue;
                }
                if (getValue(event_bytes) != event_baseline[t][i] ||
                    getValue(trace_bytes) != trace_baseline[t][i]) {
                    mismatches++;
                }

                // Decode a neighbour's baseline buffer to mix the access pattern
                int other = (t + i) % NUM_THREADS;
                const auto& foreign_events = event_baseline[other][i];
                const auto& foreign_trace = trace_baseline[other][i];

                auto event_copy = event_codec.decodeCopy(foreign_events);
                auto trace_copy = trace_codec.decodeCopy(foreign_trace);
                if (!isOk(event_copy) || !isOk(trace_copy)) {
                    failures++;
                    continue;
                }
                if (getValue(event_copy) != event_inputs[other][i] ||
                    getValue(trace_copy) != trace_inputs[other][i]) {
                    mismatches++;
                }

                if (identify(foreign_events.data(), foreign_events.size()) != MessageKind::EventList ||
                    identify(foreign_trace.data(), foreign_trace.size()) != MessageKind::AnalogTrace) {
                    mismatches++;
                }
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
}

/**
 * Views decoded concurrently from one shared buffer agree
 */
TEST_F(ConcurrentCodecTest, ConcurrentViewsOverSharedBuffer)
{
    const std::vector<uint8_t>& shared = trace_baseline[0][0];
    const AnalogTraceMessage& expected = trace_inputs[0][0];
    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < NUM_THREADS; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                auto view = trace_codec.decode(shared);
                if (!isOk(view) || getValue(view).toOwned() != expected) {
                    mismatches++;
                }
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}
