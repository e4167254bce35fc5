#pragma once

#include "audio_backend.hpp"
#include "cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

// Consecutive-silent-frame counter. A frame is silent when its mean absolute
// amplitude is below the threshold; any other frame resets the run.
class SilenceDetector {
public:
    SilenceDetector(float threshold_amplitude, double required_silence_seconds, double frame_seconds);

    // Returns true once the run of silent frames is long enough.
    bool feed(const int16_t* samples, std::size_t count);
    bool feed(const std::vector<int16_t>& frame) { return feed(frame.data(), frame.size()); }

    void reset() { silent_frames_ = 0; }

    int silent_frames() const { return silent_frames_; }
    int required_frames() const { return required_frames_; }
    float last_amplitude() const { return last_amplitude_; }

private:
    float threshold_;
    int required_frames_;
    int silent_frames_ = 0;
    float last_amplitude_ = 0.0f;
};

enum class SilenceLoopMode { GateOnly, CaptureAndReturn };

enum class SilenceOutcome { Silence, MaxDuration, Cancelled };

struct SilenceLoopParams {
    float threshold_amplitude = 500.0f;
    double required_silence_seconds = 2.0;
    double frame_seconds = 0.1;
    double max_duration_seconds = 0.0;   // 0: no limit
    std::chrono::milliseconds yield_interval{0};
};

// Reads frames from `reader` until the detector reports a silent run, the
// elapsed time passes max_duration_seconds, or `cancel` fires. In
// CaptureAndReturn mode every frame read is appended to `recorded` in order.
// Between frames it waits yield_interval on the token (zero just yields).
// Reader errors propagate as std::runtime_error.
SilenceOutcome run_silence_loop(PcmReader& reader,
                                const SilenceLoopParams& params,
                                SilenceLoopMode mode,
                                CancellationToken& cancel,
                                std::vector<int16_t>* recorded);
