#pragma once

#include "audio_backend.hpp"
#include "cancellation.hpp"
#include "device_directory.hpp"
#include "status.hpp"

#include <chrono>
#include <string>

struct SilenceGateConfig {
    std::string monitored_device_name;   // empty: the gate is a no-op
    float threshold_amplitude = 500.0f;
    double required_silence_seconds = 2.0;
    double frame_seconds = 0.1;
    bool required = false;
    unsigned sample_rate = 44100;
    // Pause between frame reads; negative means one frame duration.
    std::chrono::milliseconds yield_interval{-1};
};

// Blocks until the monitored (loopback) device has been quiet for the
// configured time. The device is matched among output-capable devices and
// read as an input stream, which only works for loopback endpoints.
class SilenceGate {
public:
    SilenceGate(AudioBackend& backend, const DeviceDirectory& directory, SilenceGateConfig config);

    Status wait_for_silence(CancellationToken& cancel);

    const SilenceGateConfig& config() const { return config_; }

private:
    AudioBackend& backend_;
    const DeviceDirectory& directory_;
    SilenceGateConfig config_;
};
