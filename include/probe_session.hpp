#pragma once

#include "app_config.hpp"
#include "audio_backend.hpp"
#include "cancellation.hpp"
#include "duplex_bridge.hpp"
#include "speech_services.hpp"
#include "status.hpp"

#include <chrono>
#include <memory>
#include <string>

struct SessionTiming {
    double gate_silence_seconds = 2.0;
    double response_max_seconds = 10.0;
    double response_silence_seconds = 1.5;
    std::chrono::milliseconds forwarding_poll{1000};
    std::chrono::milliseconds gate_yield{-1};
};

// One probing run: validate devices, synthesize (or reuse) the prompt,
// route, wait for a quiet line, play the prompt, go live through the bridge
// and, with verification on, judge the bot's reply first.
class ProbeSession {
public:
    ProbeSession(const AppConfig& config,
                 AudioBackend& backend,
                 SpeechSynthesizer& synthesizer,
                 SpeechTranscriber& transcriber,
                 ResponseClassifier& classifier,
                 bool verify,
                 SessionTiming timing = SessionTiming());

    Status run(const std::string& prompt_text, CancellationToken& cancel);

    const DuplexBridge& bridge() const { return bridge_; }
    // Set once a verified run has been classified.
    bool has_verdict() const { return has_verdict_; }
    const Verdict& verdict() const { return verdict_; }

private:
    Status keep_forwarding(CancellationToken& cancel);

    const AppConfig& config_;
    AudioBackend& backend_;
    SpeechSynthesizer& synthesizer_;
    SpeechTranscriber& transcriber_;
    ResponseClassifier& classifier_;
    bool verify_;
    SessionTiming timing_;
    DuplexBridge bridge_;
    bool has_verdict_ = false;
    Verdict verdict_;
};
