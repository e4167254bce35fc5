#include "probe_session.hpp"

#include "audio_player.hpp"
#include "audio_routing.hpp"
#include "device_directory.hpp"
#include "logging.hpp"
#include "prompt_cache.hpp"
#include "response_capture.hpp"
#include "silence_gate.hpp"

#include <sstream>

namespace {

const char* kTag = "ProbeSession";

BridgeConfig bridge_config(const AppConfig& config) {
    BridgeConfig bridge;
    bridge.microphone_name = config.microphone_name;
    bridge.virtual_output_name = config.virtual_output_name;
    bridge.sample_rate = config.microphone_sample_rate;
    bridge.input_block_size = config.bridge_input_block;
    bridge.output_block_size = config.bridge_output_block;
    bridge.queue_capacity = config.bridge_queue_capacity;
    return bridge;
}

Status validate_devices(const AppConfig& config, const DeviceDirectory& directory) {
    std::ostringstream missing;
    const std::pair<const char*, const std::string*> required[] = {
        {"MICROPHONE_NAME", &config.microphone_name},
        {"VIRTUAL_OUTPUT_NAME", &config.virtual_output_name},
        {"VIRTUAL_INPUT_NAME", &config.virtual_input_name},
    };
    bool all_found = true;
    for (const auto& entry : required) {
        if (entry.second->empty()) {
            missing << "  " << entry.first << " is empty\n";
            all_found = false;
        } else if (!directory.has_device_named(*entry.second)) {
            missing << "  Audio device not found: " << *entry.second << " (" << entry.first << ")\n";
            all_found = false;
        }
    }
    if (all_found) return Status::ok();
    return Status::error(ErrorKind::ConfigurationError,
                         "One or more audio devices are missing or misconfigured:\n" + missing.str() +
                             "Available devices:\n" + directory.describe());
}

} // namespace

ProbeSession::ProbeSession(const AppConfig& config,
                           AudioBackend& backend,
                           SpeechSynthesizer& synthesizer,
                           SpeechTranscriber& transcriber,
                           ResponseClassifier& classifier,
                           bool verify,
                           SessionTiming timing)
    : config_(config),
      backend_(backend),
      synthesizer_(synthesizer),
      transcriber_(transcriber),
      classifier_(classifier),
      verify_(verify),
      timing_(timing),
      bridge_(backend, bridge_config(config)) {}

Status ProbeSession::run(const std::string& prompt_text, CancellationToken& cancel) {
    DeviceDirectory directory;
    try {
        directory = DeviceDirectory::enumerate(backend_);
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::DeviceOpenFailure, std::string("Cannot enumerate audio devices: ") + e.what());
    }

    Status status = validate_devices(config_, directory);
    if (!status.is_ok()) return status;

    log_info(kTag, "Generating prompt audio (TTS)...");
    const auto prompt_path = config_.audio_output_dir / ("probe_prompt." + synthesizer_.format());
    PromptAudioCache cache(config_.audio_output_dir);
    bool cache_used = false;
    status = cache.fetch_or_generate(prompt_text, prompt_path, synthesizer_, cache_used);
    if (!status.is_ok()) return status;
    log_info(kTag, cache_used ? "Using cached prompt audio." : "Prompt audio generated via TTS.");

    log_info(kTag, "Routing audio devices...");
    RoutingContext routing;
    AudioRoutingService router(directory);
    status = router.route_output(routing, config_.virtual_output_name);
    if (!status.is_ok()) return status;
    status = router.route_input(routing, config_.virtual_input_name);
    if (!status.is_ok()) return status;

    SilenceGateConfig gate_config;
    gate_config.monitored_device_name = config_.bot_output_device;
    gate_config.threshold_amplitude = config_.silence_threshold;
    gate_config.required_silence_seconds = timing_.gate_silence_seconds;
    gate_config.required = verify_;
    gate_config.yield_interval = timing_.gate_yield;
    SilenceGate gate(backend_, directory, gate_config);
    status = gate.wait_for_silence(cancel);
    if (!status.is_ok()) return status;

    log_info(kTag, "Playing prompt audio...");
    AudioPlayer player(backend_, directory);
    status = player.play(prompt_path, routing, cancel);
    if (!status.is_ok()) return status;

    log_info(kTag, "Starting microphone-to-virtual-cable bridge...");
    status = bridge_.start();
    if (!status.is_ok()) return status;

    if (!verify_) return keep_forwarding(cancel);

    log_info(kTag, "Recording model's response...");
    CaptureConfig capture_config;
    capture_config.device_name = config_.virtual_input_name;
    capture_config.threshold_amplitude = config_.silence_threshold;
    capture_config.silence_seconds = timing_.response_silence_seconds;
    capture_config.max_duration_seconds = timing_.response_max_seconds;
    ResponseCapture capture(backend_, directory, capture_config);
    CaptureResult recording;
    const auto response_path = config_.audio_output_dir / "model_response.wav";
    status = capture.record_to_file(routing, response_path, cancel, recording);
    if (!status.is_ok()) {
        bridge_.stop();
        return status;
    }

    std::string transcript;
    try {
        log_info(kTag, "Transcribing model response...");
        transcript = transcriber_.transcribe(response_path);
        log_info(kTag, "Evaluating jailbreak attempt...");
        verdict_ = classifier_.classify(transcript);
        has_verdict_ = true;
    } catch (const std::exception& e) {
        bridge_.stop();
        return Status::error(ErrorKind::ServiceFailure, e.what());
    }
    log_info(kTag, "Transcript: " + transcript);
    log_info(kTag, std::string("Verdict: ") + (verdict_.success ? "success" : "failure") + " - " + verdict_.reason);

    if (verdict_.success) return keep_forwarding(cancel);

    log_info(kTag, "Jailbreak attempt failed or was rejected. Stopping audio bridge.");
    bridge_.stop();
    return Status::ok();
}

Status ProbeSession::keep_forwarding(CancellationToken& cancel) {
    log_info(kTag, "Microphone is now live. You can talk to the bot. Press Ctrl+C to stop.");
    while (!cancel.wait_for(timing_.forwarding_poll)) {
        if (!bridge_.streams_healthy()) {
            bridge_.stop();
            return Status::error(ErrorKind::DeviceOpenFailure,
                                 "Audio device stopped responding; microphone forwarding ended.");
        }
        log_debug(kTag, "queue " + std::to_string(bridge_.queue().size()) + " frames, dropped " +
                            std::to_string(bridge_.overflow_count()) + ", underruns " +
                            std::to_string(bridge_.underrun_count()));
    }
    log_info(kTag, "Microphone forwarding stopped.");
    bridge_.stop();
    return Status::ok();
}
