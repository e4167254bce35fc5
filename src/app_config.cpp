#include "app_config.hpp"

#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace {

void read_string(const char* name, std::string& target) {
    if (const char* v = std::getenv(name)) {
        if (*v) target = v;
    }
}

bool read_unsigned(const char* name, unsigned long max, unsigned long& target, Status& status) {
    const char* v = std::getenv(name);
    if (!v || !*v) return true;
    errno = 0;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || parsed > max || v[0] == '-') {
        status = Status::error(ErrorKind::ConfigurationError,
                               std::string(name) + " must be a non-negative integer, got '" + v + "'");
        return false;
    }
    target = parsed;
    return true;
}

} // namespace

bool parse_env_bool(const char* value, bool default_value) {
    if (!value) return default_value;
    std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return default_value;
}

Status load_dotenv(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) return Status::ok();

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        if (entry.compare(0, 7, "export ") == 0) entry = trim(entry.substr(7));

        std::size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Status::error(ErrorKind::ConfigurationError,
                                 path.string() + ":" + std::to_string(line_no) + ": expected KEY=VALUE");
        }
        std::string key = trim(entry.substr(0, eq));
        std::string value = trim(entry.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            std::size_t comment = value.find(" #");
            if (comment != std::string::npos) value = trim(value.substr(0, comment));
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
    return Status::ok();
}

Status load_config(AppConfig& config) {
    read_string("OPENAI_API_KEY", config.openai.api_key);
    read_string("OPENAI_BASE_URL", config.openai.base_url);
    read_string("OPENAI_TTS_VOICE", config.openai.tts_voice);
    read_string("OPENAI_TTS_MODEL", config.openai.tts_model);
    read_string("OPENAI_TTS_OUTPUT_FORMAT", config.openai.tts_format);
    read_string("TRANSCRIPTION_MODEL", config.openai.transcription_model);
    read_string("GPT_EVALUATION_MODEL", config.openai.evaluation_model);
    read_string("TRANSCRIPTION_BACKEND", config.transcription_backend);
    read_string("VOICEPROBE_VOSK_MODEL", config.vosk_model_path);
    read_string("MICROPHONE_NAME", config.microphone_name);
    read_string("VIRTUAL_OUTPUT_NAME", config.virtual_output_name);
    read_string("VIRTUAL_INPUT_NAME", config.virtual_input_name);
    read_string("BOT_OUTPUT_DEVICE", config.bot_output_device);

    std::string audio_dir;
    read_string("AUDIO_OUTPUT_DIR", audio_dir);
    if (!audio_dir.empty()) config.audio_output_dir = audio_dir;

    config.debug = parse_env_bool(std::getenv("DEBUG"), false);

    Status status;
    unsigned long value = config.microphone_sample_rate;
    if (!read_unsigned("MICROPHONE_SAMPLE_RATE", 384000, value, status)) return status;
    config.microphone_sample_rate = static_cast<unsigned>(value);

    value = config.bridge_input_block;
    if (!read_unsigned("BRIDGE_INPUT_BLOCK", 1u << 20, value, status)) return status;
    config.bridge_input_block = static_cast<unsigned>(value);

    value = config.bridge_output_block;
    if (!read_unsigned("BRIDGE_OUTPUT_BLOCK", 1u << 20, value, status)) return status;
    config.bridge_output_block = static_cast<unsigned>(value);

    value = config.bridge_queue_capacity;
    if (!read_unsigned("BRIDGE_QUEUE_CAPACITY", 100000, value, status)) return status;
    config.bridge_queue_capacity = value;

    value = static_cast<unsigned long>(config.silence_threshold);
    if (!read_unsigned("SILENCE_THRESHOLD", 32768, value, status)) return status;
    config.silence_threshold = static_cast<float>(value);

    if (config.bridge_input_block == 0 || config.bridge_output_block == 0 || config.bridge_queue_capacity == 0) {
        return Status::error(ErrorKind::ConfigurationError, "bridge block sizes and queue capacity must be positive");
    }

    config.transcription_backend = to_lower(config.transcription_backend);
    if (config.transcription_backend != "openai" && config.transcription_backend != "vosk") {
        return Status::error(ErrorKind::ConfigurationError,
                             "TRANSCRIPTION_BACKEND must be 'openai' or 'vosk', got '" +
                                 config.transcription_backend + "'");
    }

    config.openai.tts_format = to_lower(config.openai.tts_format);
    if (config.openai.tts_format != "wav") {
        return Status::error(ErrorKind::ConfigurationError,
                             "OPENAI_TTS_OUTPUT_FORMAT must be 'wav' (prompt playback reads PCM WAV), got '" +
                                 config.openai.tts_format + "'");
    }
    return Status::ok();
}
