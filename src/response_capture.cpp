#include "response_capture.hpp"

#include "logging.hpp"
#include "silence_detector.hpp"
#include "wav_file.hpp"

#include <sstream>
#include <stdexcept>

namespace {
const char* kTag = "ResponseCapture";
}

ResponseCapture::ResponseCapture(AudioBackend& backend, const DeviceDirectory& directory, CaptureConfig config)
    : backend_(backend), directory_(directory), config_(std::move(config)) {}

Status ResponseCapture::capture(const RoutingContext& routing, CancellationToken& cancel, CaptureResult& out) {
    std::optional<int> idx = routing.default_input;
    if (!idx) idx = directory_.find_contains(config_.device_name, Direction::Input);
    const AudioDevice* device = idx ? directory_.device(*idx) : nullptr;
    if (!device) {
        return directory_.not_found_status("Recording device", config_.device_name, Direction::Input);
    }

    StreamParams params;
    params.device_index = device->index;
    params.device_name = device->name;
    params.sample_rate = config_.sample_rate;
    params.block_size = static_cast<unsigned>(config_.sample_rate * config_.frame_seconds);

    SilenceLoopParams loop;
    loop.threshold_amplitude = config_.threshold_amplitude;
    loop.required_silence_seconds = config_.silence_seconds;
    loop.frame_seconds = config_.frame_seconds;
    loop.max_duration_seconds = config_.max_duration_seconds;

    out.samples.clear();
    out.sample_rate = config_.sample_rate;

    SilenceOutcome outcome = SilenceOutcome::Cancelled;
    try {
        auto reader = backend_.open_reader(params);
        outcome = run_silence_loop(*reader, loop, SilenceLoopMode::CaptureAndReturn, cancel, &out.samples);
    } catch (const std::invalid_argument& e) {
        return Status::error(ErrorKind::ConfigurationError, e.what());
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::DeviceOpenFailure,
                             "Audio recording on " + device->name + " failed: " + e.what());
    }

    if (outcome == SilenceOutcome::Cancelled) {
        return Status::error(ErrorKind::Cancelled, "Recording interrupted");
    }
    out.outcome = outcome == SilenceOutcome::Silence ? CaptureOutcome::Silence : CaptureOutcome::MaxDuration;

    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << "captured " << out.duration_seconds() << " s from " << device->name
        << (out.outcome == CaptureOutcome::Silence ? " (stopped on silence)" : " (reached time limit)");
    log_info(kTag, oss.str());
    return Status::ok();
}

Status ResponseCapture::record_to_file(const RoutingContext& routing, const std::filesystem::path& path,
                                       CancellationToken& cancel, CaptureResult& out) {
    Status status = capture(routing, cancel, out);
    if (!status.is_ok()) return status;
    try {
        write_wav(path, out.samples, out.sample_rate);
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::IoError, e.what());
    }
    return Status::ok();
}
