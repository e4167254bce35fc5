#pragma once

#include "speech_services.hpp"

#include <memory>
#include <string>

// Offline transcription with a Vosk model. Built only with
// VOICEPROBE_ENABLE_VOSK; otherwise construction throws.
class VoskTranscriber : public SpeechTranscriber {
public:
    explicit VoskTranscriber(const std::string& model_path);
    ~VoskTranscriber() override;

    // Reads a 16-bit PCM WAV, feeds it through a recognizer at the file's
    // rate and returns the final text.
    std::string transcribe(const std::filesystem::path& audio_file) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
