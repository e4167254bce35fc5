#pragma once

#include "http_client.hpp"
#include "speech_services.hpp"

#include <string>

struct OpenAiSettings {
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::string tts_model = "tts-1";
    std::string tts_voice = "alloy";
    std::string tts_format = "wav";
    std::string transcription_model = "whisper-1";
    std::string evaluation_model = "gpt-4o-mini";
};

// Builds the multipart/form-data body for a single file upload.
std::string build_multipart_body(const std::string& boundary,
                                 const HttpHeaders& fields,
                                 const std::string& file_field,
                                 const std::string& filename,
                                 const std::string& content_type,
                                 const std::string& file_bytes);

// Turns a chat completion response into a verdict. Throws when the
// completion does not carry the expected JSON object.
Verdict parse_classification(const std::string& completion_body);

class OpenAiSpeechSynthesizer : public SpeechSynthesizer {
public:
    explicit OpenAiSpeechSynthesizer(OpenAiSettings settings);

    std::string synthesize(const std::string& text) override;
    std::string format() const override { return settings_.tts_format; }

private:
    OpenAiSettings settings_;
    HttpClient http_;
};

class OpenAiTranscriber : public SpeechTranscriber {
public:
    explicit OpenAiTranscriber(OpenAiSettings settings);

    std::string transcribe(const std::filesystem::path& audio_file) override;

private:
    OpenAiSettings settings_;
    HttpClient http_;
};

class OpenAiClassifier : public ResponseClassifier {
public:
    explicit OpenAiClassifier(OpenAiSettings settings);

    Verdict classify(const std::string& transcript) override;

private:
    OpenAiSettings settings_;
    HttpClient http_;
};
