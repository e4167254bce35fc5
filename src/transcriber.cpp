#include "transcriber.hpp"

#include "json_util.hpp"
#include "utils.hpp"
#include "wav_file.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#if defined(VOICEPROBE_WITH_VOSK)
#include <vosk_api.h>
#endif

struct VoskTranscriber::Impl {
#if defined(VOICEPROBE_WITH_VOSK)
    VoskModel* model{nullptr};
    VoskRecognizer* recognizer{nullptr};
    int recognizer_rate{0};

    explicit Impl(const std::string& model_path) {
        model = vosk_model_new(model_path.c_str());
        if (!model) {
            throw std::runtime_error("Failed to load Vosk model at " + model_path);
        }
    }

    ~Impl() {
        release_recognizer();
        if (model) {
            vosk_model_free(model);
            model = nullptr;
        }
    }

    void release_recognizer() {
        if (recognizer) {
            vosk_recognizer_free(recognizer);
            recognizer = nullptr;
        }
    }

    void ensure_recognizer(int sample_rate) {
        if (recognizer && recognizer_rate == sample_rate) return;
        release_recognizer();
        recognizer = vosk_recognizer_new(model, static_cast<float>(sample_rate));
        if (!recognizer) {
            throw std::runtime_error("Failed to create Vosk recognizer");
        }
        vosk_recognizer_set_max_alternatives(recognizer, 0);
        vosk_recognizer_set_partial_words(recognizer, false);
        recognizer_rate = sample_rate;
    }

    void feed(const int16_t* data, std::size_t samples) {
        if (!recognizer) return;
        vosk_recognizer_accept_waveform(recognizer,
                                        reinterpret_cast<const char*>(data),
                                        static_cast<int>(samples * sizeof(int16_t)));
    }

    std::string flush() {
        if (!recognizer) return {};
        const char* raw = vosk_recognizer_final_result(recognizer);
        std::string json = raw ? raw : "";
        vosk_recognizer_reset(recognizer);
        return json_string_field(json, "text").value_or("");
    }
#else
    explicit Impl(const std::string&) {
        throw std::runtime_error("Vosk support not enabled; rebuild with VOICEPROBE_ENABLE_VOSK=ON");
    }

    void ensure_recognizer(int) {}
    void feed(const int16_t*, std::size_t) {}
    std::string flush() { return {}; }
#endif
};

VoskTranscriber::VoskTranscriber(const std::string& model_path)
    : impl_(std::make_unique<Impl>(model_path)) {}

VoskTranscriber::~VoskTranscriber() = default;

std::string VoskTranscriber::transcribe(const std::filesystem::path& audio_file) {
    WavData wav = read_wav(audio_file);
    std::vector<int16_t> mono = wav.mono();

    impl_->ensure_recognizer(static_cast<int>(wav.sample_rate));
    constexpr std::size_t kChunk = 4096;
    for (std::size_t offset = 0; offset < mono.size(); offset += kChunk) {
        std::size_t n = std::min(kChunk, mono.size() - offset);
        impl_->feed(mono.data() + offset, n);
    }
    return trim(impl_->flush());
}
