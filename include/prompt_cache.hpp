#pragma once

#include "speech_services.hpp"
#include "status.hpp"

#include <filesystem>
#include <string>

// Lower-case hex SHA-256 of the UTF-8 bytes of `text`.
std::string sha256_hex(const std::string& text);

// Flat directory of synthesized prompts keyed by the hash of their text.
class PromptAudioCache {
public:
    explicit PromptAudioCache(std::filesystem::path cache_dir) : cache_dir_(std::move(cache_dir)) {}

    std::filesystem::path entry_path(const std::string& text, const std::string& format) const;

    // Copies a cached rendering of `text` to `output_path`, or synthesizes
    // it, writes it there and stores a copy in the cache.
    Status fetch_or_generate(const std::string& text,
                             const std::filesystem::path& output_path,
                             SpeechSynthesizer& synthesizer,
                             bool& cache_used);

private:
    std::filesystem::path cache_dir_;
};
