#include "silence_gate.hpp"

#include "logging.hpp"
#include "silence_detector.hpp"

#include <stdexcept>

namespace {
const char* kTag = "SilenceGate";
}

SilenceGate::SilenceGate(AudioBackend& backend, const DeviceDirectory& directory, SilenceGateConfig config)
    : backend_(backend), directory_(directory), config_(std::move(config)) {}

Status SilenceGate::wait_for_silence(CancellationToken& cancel) {
    if (config_.monitored_device_name.empty()) {
        if (config_.required) {
            return Status::error(ErrorKind::ConfigurationError,
                                 "BOT_OUTPUT_DEVICE must be set when running with --verify.");
        }
        return Status::ok();
    }

    auto idx = directory_.find_contains(config_.monitored_device_name, Direction::Output);
    if (!idx) {
        return directory_.not_found_status("BOT_OUTPUT_DEVICE", config_.monitored_device_name, Direction::Output);
    }
    const AudioDevice* device = directory_.device(*idx);
    log_info(kTag, "Waiting for silence on device: " + device->name + " (index " + std::to_string(*idx) + ")");

    StreamParams params;
    params.device_index = *idx;
    params.device_name = device->name;
    params.sample_rate = config_.sample_rate;
    params.block_size = static_cast<unsigned>(config_.sample_rate * config_.frame_seconds);

    SilenceLoopParams loop;
    loop.threshold_amplitude = config_.threshold_amplitude;
    loop.required_silence_seconds = config_.required_silence_seconds;
    loop.frame_seconds = config_.frame_seconds;
    loop.yield_interval = config_.yield_interval.count() >= 0
                              ? config_.yield_interval
                              : std::chrono::milliseconds(static_cast<long>(config_.frame_seconds * 1000.0));

    SilenceOutcome outcome = SilenceOutcome::Cancelled;
    try {
        auto reader = backend_.open_reader(params);
        outcome = run_silence_loop(*reader, loop, SilenceLoopMode::GateOnly, cancel, nullptr);
    } catch (const std::invalid_argument& e) {
        return Status::error(ErrorKind::ConfigurationError, e.what());
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::DeviceOpenFailure,
                             "Cannot monitor " + device->name + ": " + e.what());
    }

    if (outcome == SilenceOutcome::Cancelled) {
        return Status::error(ErrorKind::Cancelled, "Wait for silence interrupted");
    }
    log_info(kTag, "Silence detected.");
    return Status::ok();
}
