#pragma once

#include "openai_services.hpp"
#include "status.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

struct AppConfig {
    OpenAiSettings openai;
    std::string transcription_backend = "openai";   // "openai" or "vosk"
    std::string vosk_model_path = "models/vosk-model-small-en-us-0.15";

    std::string microphone_name = "default";
    unsigned microphone_sample_rate = 0;            // 0: the device's default rate
    std::string virtual_output_name = "hw:CARD=Loopback,DEV=0";
    std::string virtual_input_name = "hw:CARD=Loopback,DEV=1";
    std::string bot_output_device;                  // empty: no silence gate

    std::filesystem::path audio_output_dir = "recorded_audio";

    unsigned bridge_input_block = 2048;
    unsigned bridge_output_block = 2048;
    std::size_t bridge_queue_capacity = 100;
    float silence_threshold = 500.0f;

    bool debug = false;
};

bool parse_env_bool(const char* value, bool default_value);

// KEY=VALUE lines, '#' comments, optional "export " prefix and quotes.
// Variables already in the environment are left alone. A missing file is
// not an error.
Status load_dotenv(const std::filesystem::path& path);

// Reads AppConfig from the environment. Malformed numbers and unsupported
// choices are a ConfigurationError.
Status load_config(AppConfig& config);
