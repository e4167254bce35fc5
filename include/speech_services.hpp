#pragma once

#include <filesystem>
#include <string>

// Boundary collaborators. Every call either returns a result or throws
// std::runtime_error; callers treat any throw as "the operation failed".

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    // Encoded audio bytes in format().
    virtual std::string synthesize(const std::string& text) = 0;
    virtual std::string format() const = 0;
};

class SpeechTranscriber {
public:
    virtual ~SpeechTranscriber() = default;
    virtual std::string transcribe(const std::filesystem::path& audio_file) = 0;
};

struct Verdict {
    bool success = false;
    std::string reason;
};

class ResponseClassifier {
public:
    virtual ~ResponseClassifier() = default;
    virtual Verdict classify(const std::string& transcript) = 0;
};
