#include "silence_detector.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

SilenceDetector::SilenceDetector(float threshold_amplitude, double required_silence_seconds, double frame_seconds)
    : threshold_(threshold_amplitude) {
    if (frame_seconds <= 0.0) {
        throw std::invalid_argument("frame duration must be positive");
    }
    required_frames_ = std::max(1, static_cast<int>(required_silence_seconds / frame_seconds));
}

bool SilenceDetector::feed(const int16_t* samples, std::size_t count) {
    last_amplitude_ = mean_abs_amplitude(samples, count);
    if (last_amplitude_ < threshold_) {
        ++silent_frames_;
    } else {
        silent_frames_ = 0;
    }
    return silent_frames_ >= required_frames_;
}

SilenceOutcome run_silence_loop(PcmReader& reader,
                                const SilenceLoopParams& params,
                                SilenceLoopMode mode,
                                CancellationToken& cancel,
                                std::vector<int16_t>* recorded) {
    SilenceDetector detector(params.threshold_amplitude, params.required_silence_seconds, params.frame_seconds);
    const auto started = std::chrono::steady_clock::now();
    std::vector<int16_t> frame;

    while (!cancel.cancelled()) {
        if (reader.read(frame) == 0) {
            if (cancel.wait_for(params.yield_interval)) break;
            continue;
        }
        if (mode == SilenceLoopMode::CaptureAndReturn && recorded) {
            recorded->insert(recorded->end(), frame.begin(), frame.end());
        }

        bool quiet = detector.feed(frame);
        if (debug_logging_enabled()) {
            std::ostringstream oss;
            oss.precision(2);
            oss << std::fixed << "Frame amplitude: " << detector.last_amplitude() << " (" << dbfs(frame) << " dBFS)";
            log_debug("SilenceLoop", oss.str());
        }
        if (quiet) return SilenceOutcome::Silence;

        if (params.max_duration_seconds > 0.0) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
            if (elapsed.count() > params.max_duration_seconds) return SilenceOutcome::MaxDuration;
        }

        if (cancel.wait_for(params.yield_interval)) break;
    }
    return SilenceOutcome::Cancelled;
}
