#pragma once

#include "audio_backend.hpp"
#include "frame_queue.hpp"
#include "status.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

enum class BridgeState { Idle, Initializing, Running, Stopped };

const char* bridge_state_name(BridgeState state);

struct BridgeConfig {
    std::string microphone_name;
    std::string virtual_output_name;
    unsigned sample_rate = 0;          // 0: the microphone's default rate
    unsigned input_block_size = 2048;
    unsigned output_block_size = 2048;
    std::size_t queue_capacity = FrameQueue::kDefaultCapacity;
};

// Relays the microphone into the virtual cable. The capture stream pushes
// each block onto the queue, the playback stream pulls exactly what the
// device asks for. The two callbacks are this object's on_input/on_output,
// driven by the backend's stream threads.
class DuplexBridge : public InputHandler, public OutputHandler {
public:
    DuplexBridge(AudioBackend& backend, BridgeConfig config);
    ~DuplexBridge() override;

    DuplexBridge(const DuplexBridge&) = delete;
    DuplexBridge& operator=(const DuplexBridge&) = delete;

    // Resolves both devices by exact name, opens and starts both streams.
    // On failure the bridge is back to Idle and nothing stays open.
    Status start();

    // Idempotent; valid in any state.
    void stop();

    BridgeState state() const { return state_.load(); }
    int input_device_index() const { return input_index_; }
    int output_device_index() const { return output_index_; }
    unsigned sample_rate() const { return sample_rate_; }

    // Capture blocks refused by a full queue.
    uint64_t overflow_count() const { return overflow_count_.load(); }
    uint64_t underrun_count() const { return underrun_count_.load(); }
    uint64_t frames_enqueued() const { return frames_enqueued_.load(); }
    // Split remainders the queue would not take back.
    uint64_t lost_remainders() const { return lost_remainders_.load(); }

    // False once either driver thread has given up on its device, or when
    // the bridge is not running.
    bool streams_healthy() const;
    const FrameQueue& queue() const { return queue_; }

    void on_input(const float* samples, std::size_t count) noexcept override;
    void on_output(float* samples, std::size_t count) noexcept override;

private:
    void close_streams();

    AudioBackend& backend_;
    BridgeConfig config_;
    FrameQueue queue_;

    std::atomic<BridgeState> state_{BridgeState::Idle};
    int input_index_ = -1;
    int output_index_ = -1;
    unsigned sample_rate_ = 0;
    std::unique_ptr<AudioStream> input_stream_;
    std::unique_ptr<AudioStream> output_stream_;

    std::atomic<uint64_t> overflow_count_{0};
    std::atomic<uint64_t> underrun_count_{0};
    std::atomic<uint64_t> frames_enqueued_{0};
    std::atomic<uint64_t> lost_remainders_{0};
};
