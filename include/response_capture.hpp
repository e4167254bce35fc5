#pragma once

#include "audio_backend.hpp"
#include "audio_routing.hpp"
#include "cancellation.hpp"
#include "device_directory.hpp"
#include "status.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct CaptureConfig {
    std::string device_name;             // used when the routing context has no input
    float threshold_amplitude = 500.0f;
    double silence_seconds = 1.5;
    double frame_seconds = 0.1;
    unsigned sample_rate = 44100;
    double max_duration_seconds = 10.0;
};

enum class CaptureOutcome { Silence, MaxDuration };

struct CaptureResult {
    std::vector<int16_t> samples;
    unsigned sample_rate = 0;
    CaptureOutcome outcome = CaptureOutcome::Silence;

    double duration_seconds() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

// Records the bot's reply until it falls silent or the time limit passes.
// Running out of time is an ordinary outcome, not an error.
class ResponseCapture {
public:
    ResponseCapture(AudioBackend& backend, const DeviceDirectory& directory, CaptureConfig config);

    Status capture(const RoutingContext& routing, CancellationToken& cancel, CaptureResult& out);

    // capture() followed by writing a mono 16-bit WAV.
    Status record_to_file(const RoutingContext& routing, const std::filesystem::path& path,
                          CancellationToken& cancel, CaptureResult& out);

private:
    AudioBackend& backend_;
    const DeviceDirectory& directory_;
    CaptureConfig config_;
};
