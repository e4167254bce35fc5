#include "duplex_bridge.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

std::vector<AudioDevice> bridge_devices() {
    return {make_device("Mic", 2, 0, 48000), make_device("CABLE Input", 0, 2, 44100)};
}

BridgeConfig bridge_config(std::size_t capacity = 8) {
    BridgeConfig config;
    config.microphone_name = "Mic";
    config.virtual_output_name = "CABLE Input";
    config.input_block_size = 4;
    config.output_block_size = 6;
    config.queue_capacity = capacity;
    return config;
}

std::vector<float> pull(DuplexBridge& bridge, std::size_t count) {
    std::vector<float> out(count, -1.0f);
    bridge.on_output(out.data(), out.size());
    return out;
}

void push(DuplexBridge& bridge, std::vector<float> samples) { bridge.on_input(samples.data(), samples.size()); }

} // namespace

TEST(DuplexBridgeTest, OutputSplitsFramesWithoutLosingSamples) {
    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config());

    push(bridge, {1, 2, 3, 4});
    push(bridge, {5, 6, 7, 8});

    EXPECT_EQ(pull(bridge, 6), std::vector<float>({1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(bridge.queue().size(), 1u);
    EXPECT_EQ(pull(bridge, 2), std::vector<float>({7, 8}));
    EXPECT_TRUE(bridge.queue().empty());
    EXPECT_EQ(bridge.underrun_count(), 0u);
    EXPECT_EQ(bridge.frames_enqueued(), 2u);
}

TEST(DuplexBridgeTest, RemainderStaysAheadOfLaterFrames) {
    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config());

    push(bridge, {1, 2, 3, 4});
    EXPECT_EQ(pull(bridge, 3), std::vector<float>({1, 2, 3}));
    push(bridge, {5, 6});
    EXPECT_EQ(pull(bridge, 3), std::vector<float>({4, 5, 6}));
}

TEST(DuplexBridgeTest, FullQueueDropsIncomingFrame) {
    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config(2));

    push(bridge, {1});
    push(bridge, {2});
    push(bridge, {3});

    EXPECT_EQ(bridge.overflow_count(), 1u);
    EXPECT_EQ(bridge.frames_enqueued(), 2u);
    EXPECT_EQ(pull(bridge, 2), std::vector<float>({1, 2}));
}

TEST(DuplexBridgeTest, EmptyQueueFillsSilence) {
    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config());

    EXPECT_EQ(pull(bridge, 4), std::vector<float>(4, 0.0f));
    EXPECT_EQ(bridge.underrun_count(), 1u);
}

TEST(DuplexBridgeTest, PartialUnderrunPadsTail) {
    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config());

    push(bridge, {0.5f, -0.5f});
    EXPECT_EQ(pull(bridge, 4), std::vector<float>({0.5f, -0.5f, 0.0f, 0.0f}));
    EXPECT_EQ(bridge.underrun_count(), 1u);
}

TEST(DuplexBridgeTest, StartOpensBothStreams) {
    FakeAudioBackend backend(bridge_devices());
    DuplexBridge bridge(backend, bridge_config());

    Status status = bridge.start();
    ASSERT_TRUE(status.is_ok()) << status.to_string();
    EXPECT_EQ(bridge.state(), BridgeState::Running);
    EXPECT_EQ(bridge.input_device_index(), 0);
    EXPECT_EQ(bridge.output_device_index(), 1);
    EXPECT_EQ(bridge.sample_rate(), 48000u);

    ASSERT_EQ(backend.input_params.size(), 1u);
    ASSERT_EQ(backend.output_params.size(), 1u);
    EXPECT_EQ(backend.input_params[0].device_name, "Mic");
    EXPECT_EQ(backend.input_params[0].block_size, 4u);
    EXPECT_EQ(backend.output_params[0].device_name, "CABLE Input");
    EXPECT_EQ(backend.output_params[0].sample_rate, 48000u);
    EXPECT_EQ(backend.output_params[0].block_size, 6u);
    EXPECT_TRUE(backend.input_stream->active());
    EXPECT_TRUE(backend.output_stream->active());

    std::vector<float> captured = {0.1f, 0.2f, 0.3f, 0.4f};
    backend.input_handler->on_input(captured.data(), captured.size());
    std::vector<float> played(4, 1.0f);
    backend.output_handler->on_output(played.data(), played.size());
    EXPECT_EQ(played, captured);

    bridge.stop();
    EXPECT_EQ(bridge.state(), BridgeState::Stopped);
    EXPECT_EQ(backend.closed_streams, 2);
}

TEST(DuplexBridgeTest, ConfiguredSampleRateWins) {
    FakeAudioBackend backend(bridge_devices());
    BridgeConfig config = bridge_config();
    config.sample_rate = 16000;
    DuplexBridge bridge(backend, config);

    ASSERT_TRUE(bridge.start().is_ok());
    EXPECT_EQ(backend.input_params[0].sample_rate, 16000u);
    EXPECT_EQ(backend.output_params[0].sample_rate, 16000u);
}

TEST(DuplexBridgeTest, StopIsIdempotentInAnyState) {
    FakeAudioBackend backend(bridge_devices());
    DuplexBridge bridge(backend, bridge_config());

    bridge.stop();
    EXPECT_EQ(bridge.state(), BridgeState::Stopped);
    bridge.stop();
    EXPECT_EQ(bridge.state(), BridgeState::Stopped);
    EXPECT_EQ(backend.closed_streams, 0);
}

TEST(DuplexBridgeTest, MissingDeviceLeavesBridgeIdle) {
    FakeAudioBackend backend({make_device("Mic", 2, 0)});
    DuplexBridge bridge(backend, bridge_config());

    Status status = bridge.start();
    EXPECT_EQ(status.kind(), ErrorKind::DeviceNotFound);
    EXPECT_NE(status.message().find("Input index: 0"), std::string::npos);
    EXPECT_NE(status.message().find("Output index: None"), std::string::npos);
    EXPECT_EQ(bridge.state(), BridgeState::Idle);
    EXPECT_TRUE(backend.input_params.empty());
}

TEST(DuplexBridgeTest, DevicesMustMatchExactly) {
    FakeAudioBackend backend({make_device("USB Mic", 2, 0), make_device("CABLE Input (VB-Audio)", 0, 2)});
    DuplexBridge bridge(backend, bridge_config());

    EXPECT_EQ(bridge.start().kind(), ErrorKind::DeviceNotFound);
    EXPECT_EQ(bridge.state(), BridgeState::Idle);
}

TEST(DuplexBridgeTest, MatchIgnoresCaseAndSurroundingSpace) {
    FakeAudioBackend backend({make_device("  mic ", 2, 0), make_device("cable input", 0, 2)});
    DuplexBridge bridge(backend, bridge_config());

    EXPECT_TRUE(bridge.start().is_ok());
}

TEST(DuplexBridgeTest, DirectionMattersForResolution) {
    // "Mic" exists but only as an output device
    FakeAudioBackend backend({make_device("Mic", 0, 2), make_device("CABLE Input", 0, 2)});
    DuplexBridge bridge(backend, bridge_config());

    EXPECT_EQ(bridge.start().kind(), ErrorKind::DeviceNotFound);
}

TEST(DuplexBridgeTest, OutputOpenFailureClosesInput) {
    FakeAudioBackend backend(bridge_devices());
    backend.fail_output_open = true;
    DuplexBridge bridge(backend, bridge_config());

    Status status = bridge.start();
    EXPECT_EQ(status.kind(), ErrorKind::DeviceOpenFailure);
    EXPECT_EQ(bridge.state(), BridgeState::Idle);
    EXPECT_EQ(backend.input_params.size(), 1u);
    EXPECT_EQ(backend.closed_streams, 1);
}

TEST(DuplexBridgeTest, RestartResetsCounters) {
    FakeAudioBackend backend(bridge_devices());
    DuplexBridge bridge(backend, bridge_config(1));

    ASSERT_TRUE(bridge.start().is_ok());
    push(bridge, {1});
    push(bridge, {2});
    EXPECT_EQ(bridge.overflow_count(), 1u);
    bridge.stop();

    ASSERT_TRUE(bridge.start().is_ok());
    EXPECT_EQ(bridge.overflow_count(), 0u);
    EXPECT_TRUE(bridge.queue().empty());
    EXPECT_EQ(bridge.state(), BridgeState::Running);
}

TEST(DuplexBridgeTest, ConcurrentCallbacksKeepEverySampleInOrder) {
    constexpr std::size_t kFrames = 20000;
    constexpr std::size_t kFrameSize = 7;
    constexpr std::size_t kTotal = kFrames * kFrameSize;

    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config(100000));

    // samples are numbered from 1 so underrun padding (0) is told apart
    std::thread producer([&bridge] {
        std::vector<float> frame(kFrameSize);
        float next = 1.0f;
        for (std::size_t i = 0; i < kFrames; ++i) {
            for (auto& sample : frame) sample = next++;
            bridge.on_input(frame.data(), frame.size());
        }
    });

    std::vector<float> received;
    received.reserve(kTotal);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    std::vector<float> block(5);
    while (received.size() < kTotal && std::chrono::steady_clock::now() < deadline) {
        bridge.on_output(block.data(), block.size());
        for (float sample : block) {
            if (sample != 0.0f) received.push_back(sample);
        }
    }
    producer.join();

    ASSERT_EQ(received.size(), kTotal);
    for (std::size_t i = 0; i < kTotal; ++i) {
        ASSERT_EQ(received[i], static_cast<float>(i + 1)) << "at sample " << i;
    }
    EXPECT_EQ(bridge.overflow_count(), 0u);
    EXPECT_EQ(bridge.lost_remainders(), 0u);
    EXPECT_EQ(bridge.frames_enqueued(), kFrames);
}

TEST(DuplexBridgeTest, SplitRemainderIsNotCountedAsOverflow) {
    FakeAudioBackend backend;
    DuplexBridge bridge(backend, bridge_config(1));

    push(bridge, {1, 2, 3});
    push(bridge, {4});
    EXPECT_EQ(bridge.overflow_count(), 1u);

    EXPECT_EQ(pull(bridge, 1), std::vector<float>({1}));
    EXPECT_EQ(bridge.queue().size(), 1u);
    EXPECT_EQ(bridge.overflow_count(), 1u);
    EXPECT_EQ(bridge.lost_remainders(), 0u);

    push(bridge, {5});
    EXPECT_EQ(bridge.overflow_count(), 2u);
    EXPECT_EQ(pull(bridge, 2), std::vector<float>({2, 3}));
}

TEST(DuplexBridgeTest, StreamsHealthyFollowsDriverState) {
    FakeAudioBackend backend(bridge_devices());
    DuplexBridge bridge(backend, bridge_config());
    EXPECT_FALSE(bridge.streams_healthy());

    ASSERT_TRUE(bridge.start().is_ok());
    EXPECT_TRUE(bridge.streams_healthy());

    backend.output_stream->failed = true;
    EXPECT_FALSE(bridge.streams_healthy());
    EXPECT_EQ(bridge.state(), BridgeState::Running);

    bridge.stop();
    EXPECT_FALSE(bridge.streams_healthy());
}
