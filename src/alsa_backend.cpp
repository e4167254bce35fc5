#include "alsa_backend.hpp"

#include "logging.hpp"

#include <alsa/asoundlib.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr unsigned kPeriodsPerBuffer = 4;
constexpr int kMaxReportedChannels = 32;

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

// Opens and configures a mono PCM. Adjusts params to what the driver
// actually granted; throws std::runtime_error on rejection.
snd_pcm_t* open_pcm(StreamParams& params, snd_pcm_stream_t stream, snd_pcm_format_t format) {
    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, params.device_name.c_str(), stream, 0);
    if (err < 0) {
        throw std::runtime_error(alsa_error(err, "snd_pcm_open(" + params.device_name + ")"));
    }

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    if (!hw_params) {
        snd_pcm_close(handle);
        throw std::runtime_error("Failed to allocate ALSA hw params");
    }

    auto fail = [&](int code, const char* context) {
        snd_pcm_hw_params_free(hw_params);
        snd_pcm_close(handle);
        throw std::runtime_error(alsa_error(code, context));
    };

    snd_pcm_hw_params_any(handle, hw_params);

    err = snd_pcm_hw_params_set_access(handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_access");

    err = snd_pcm_hw_params_set_format(handle, hw_params, format);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_format");

    err = snd_pcm_hw_params_set_channels(handle, hw_params, params.channels);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_channels");

    unsigned int rate = params.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(handle, hw_params, &rate, nullptr);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_rate_near");
    if (rate != params.sample_rate) {
        log_warn("ALSA", params.device_name + ": sample rate adjusted to " + std::to_string(rate) + " Hz");
        params.sample_rate = rate;
    }

    snd_pcm_uframes_t frames = params.block_size;
    err = snd_pcm_hw_params_set_period_size_near(handle, hw_params, &frames, nullptr);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_period_size_near");
    params.block_size = static_cast<unsigned>(frames);

    snd_pcm_uframes_t buffer_frames = frames * kPeriodsPerBuffer;
    err = snd_pcm_hw_params_set_buffer_size_near(handle, hw_params, &buffer_frames);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_buffer_size_near");

    err = snd_pcm_hw_params(handle, hw_params);
    snd_pcm_hw_params_free(hw_params);
    if (err < 0) {
        snd_pcm_close(handle);
        throw std::runtime_error(alsa_error(err, "snd_pcm_hw_params"));
    }

    err = snd_pcm_prepare(handle);
    if (err < 0) {
        snd_pcm_close(handle);
        throw std::runtime_error(alsa_error(err, "snd_pcm_prepare"));
    }
    return handle;
}

void probe_stream(const char* name, snd_pcm_stream_t stream, int& max_channels, int& rate) {
    snd_pcm_t* pcm = nullptr;
    if (snd_pcm_open(&pcm, name, stream, SND_PCM_NONBLOCK) < 0) return;

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    if (hw_params && snd_pcm_hw_params_any(pcm, hw_params) >= 0) {
        unsigned int channels = 0;
        if (snd_pcm_hw_params_get_channels_max(hw_params, &channels) >= 0) {
            max_channels = std::min(static_cast<int>(channels), kMaxReportedChannels);
        }
        unsigned int near = 48000;
        if (snd_pcm_hw_params_set_rate_near(pcm, hw_params, &near, nullptr) >= 0) {
            rate = static_cast<int>(near);
        }
    }
    if (hw_params) snd_pcm_hw_params_free(hw_params);
    snd_pcm_close(pcm);
}

std::string hint_field(void* hint, const char* id) {
    char* value = snd_device_name_get_hint(hint, id);
    if (!value) return {};
    std::string out(value);
    std::free(value);
    return out;
}

class AlsaCallbackStream : public AudioStream {
public:
    AlsaCallbackStream(snd_pcm_t* handle, const StreamParams& params,
                       InputHandler* input, OutputHandler* output)
        : handle_(handle), params_(params), input_(input), output_(output) {}

    ~AlsaCallbackStream() override { close(); }

    void start() override {
        if (!handle_) throw std::runtime_error("stream is closed");
        if (running_) return;
        if (input_) {
            int err = snd_pcm_start(handle_);
            if (err < 0) throw std::runtime_error(alsa_error(err, "snd_pcm_start"));
        }
        running_ = true;
        worker_ = std::thread([this] { run(); });
    }

    void stop() override {
        running_ = false;
        if (worker_.joinable()) worker_.join();
        if (handle_) snd_pcm_drop(handle_);
    }

    void close() override {
        stop();
        if (handle_) {
            snd_pcm_close(handle_);
            handle_ = nullptr;
            if (xruns_ > 0) {
                log_warn("ALSA", params_.device_name + ": recovered from " + std::to_string(xruns_.load()) + " xruns");
            }
        }
    }

    bool active() const override { return running_ && !failed_; }

private:
    // Driver thread. Nothing escapes it: recoverable xruns are counted,
    // anything else marks the stream failed and ends the loop.
    void run() {
        std::vector<float> block(params_.block_size, 0.0f);
        while (running_) {
            int ready = snd_pcm_wait(handle_, kPollTimeoutMs);
            if (ready == 0) continue;
            if (ready < 0) {
                if (snd_pcm_recover(handle_, ready, 1) < 0) {
                    failed_ = true;
                    return;
                }
                ++xruns_;
                continue;
            }
            if (input_) {
                snd_pcm_sframes_t frames = snd_pcm_readi(handle_, block.data(), params_.block_size);
                if (frames < 0) {
                    if (snd_pcm_recover(handle_, static_cast<int>(frames), 1) < 0) {
                        failed_ = true;
                        return;
                    }
                    ++xruns_;
                    continue;
                }
                if (frames > 0) input_->on_input(block.data(), static_cast<std::size_t>(frames));
            } else {
                output_->on_output(block.data(), block.size());
                if (!write_block(block)) return;
            }
        }
    }

    bool write_block(const std::vector<float>& block) {
        std::size_t offset = 0;
        while (offset < block.size() && running_) {
            snd_pcm_sframes_t written = snd_pcm_writei(handle_, block.data() + offset, block.size() - offset);
            if (written < 0) {
                if (snd_pcm_recover(handle_, static_cast<int>(written), 1) < 0) {
                    failed_ = true;
                    return false;
                }
                ++xruns_;
                continue;
            }
            offset += static_cast<std::size_t>(written);
        }
        return true;
    }

    snd_pcm_t* handle_;
    StreamParams params_;
    InputHandler* input_;
    OutputHandler* output_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<unsigned long> xruns_{0};
};

class AlsaPcmReader : public PcmReader {
public:
    AlsaPcmReader(snd_pcm_t* handle, const StreamParams& params) : handle_(handle), params_(params) {}

    ~AlsaPcmReader() override {
        if (handle_) {
            snd_pcm_drop(handle_);
            snd_pcm_close(handle_);
            handle_ = nullptr;
        }
    }

    std::size_t read(std::vector<int16_t>& out) override {
        if (!handle_) return 0;

        out.resize(static_cast<std::size_t>(params_.block_size) * params_.channels);
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, out.data(), params_.block_size);
        if (frames < 0) {
            frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        }
        if (frames < 0) {
            throw std::runtime_error(alsa_error(static_cast<int>(frames), "snd_pcm_readi"));
        }
        if (frames == 0) {
            out.clear();
            return 0;
        }

        std::size_t samples = static_cast<std::size_t>(frames) * params_.channels;
        out.resize(samples);
        return samples;
    }

private:
    snd_pcm_t* handle_;
    StreamParams params_;
};

class AlsaPcmWriter : public PcmWriter {
public:
    explicit AlsaPcmWriter(snd_pcm_t* handle) : handle_(handle) {}

    ~AlsaPcmWriter() override {
        if (handle_) {
            snd_pcm_drop(handle_);
            snd_pcm_close(handle_);
            handle_ = nullptr;
        }
    }

    void write(const int16_t* samples, std::size_t count) override {
        std::size_t offset = 0;
        while (offset < count) {
            snd_pcm_sframes_t written = snd_pcm_writei(handle_, samples + offset, count - offset);
            if (written < 0) {
                written = snd_pcm_recover(handle_, static_cast<int>(written), 1);
                if (written < 0) {
                    throw std::runtime_error(alsa_error(static_cast<int>(written), "snd_pcm_writei"));
                }
                continue;
            }
            offset += static_cast<std::size_t>(written);
        }
    }

    void drain() override {
        int err = snd_pcm_drain(handle_);
        if (err < 0) throw std::runtime_error(alsa_error(err, "snd_pcm_drain"));
    }

private:
    snd_pcm_t* handle_;
};

} // namespace

std::vector<AudioDevice> AlsaBackend::list_devices() {
    std::vector<AudioDevice> devices;

    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0) {
        throw std::runtime_error(alsa_error(err, "snd_device_name_hint"));
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        std::string name = hint_field(*hint, "NAME");
        if (name.empty() || name == "null") continue;

        std::string ioid = hint_field(*hint, "IOID");
        std::string desc = hint_field(*hint, "DESC");
        std::replace(desc.begin(), desc.end(), '\n', ' ');

        AudioDevice device;
        device.name = name;
        device.description = desc;
        int rate = 0;
        if (ioid.empty() || ioid == "Input") {
            probe_stream(name.c_str(), SND_PCM_STREAM_CAPTURE, device.max_input_channels, rate);
        }
        if (ioid.empty() || ioid == "Output") {
            probe_stream(name.c_str(), SND_PCM_STREAM_PLAYBACK, device.max_output_channels, rate);
        }
        if (device.max_input_channels == 0 && device.max_output_channels == 0) continue;
        if (rate > 0) device.default_sample_rate = rate;

        device.index = static_cast<int>(devices.size());
        devices.push_back(device);
    }
    snd_device_name_free_hint(hints);

    log_debug("ALSA", "enumerated " + std::to_string(devices.size()) + " PCM devices");
    return devices;
}

std::unique_ptr<AudioStream> AlsaBackend::open_input_stream(const StreamParams& params,
                                                            InputHandler& handler) {
    StreamParams granted = params;
    snd_pcm_t* handle = open_pcm(granted, SND_PCM_STREAM_CAPTURE, SND_PCM_FORMAT_FLOAT_LE);
    return std::make_unique<AlsaCallbackStream>(handle, granted, &handler, nullptr);
}

std::unique_ptr<AudioStream> AlsaBackend::open_output_stream(const StreamParams& params,
                                                             OutputHandler& handler) {
    StreamParams granted = params;
    snd_pcm_t* handle = open_pcm(granted, SND_PCM_STREAM_PLAYBACK, SND_PCM_FORMAT_FLOAT_LE);
    return std::make_unique<AlsaCallbackStream>(handle, granted, nullptr, &handler);
}

std::unique_ptr<PcmReader> AlsaBackend::open_reader(const StreamParams& params) {
    StreamParams granted = params;
    snd_pcm_t* handle = open_pcm(granted, SND_PCM_STREAM_CAPTURE, SND_PCM_FORMAT_S16_LE);
    return std::make_unique<AlsaPcmReader>(handle, granted);
}

std::unique_ptr<PcmWriter> AlsaBackend::open_writer(const StreamParams& params) {
    StreamParams granted = params;
    snd_pcm_t* handle = open_pcm(granted, SND_PCM_STREAM_PLAYBACK, SND_PCM_FORMAT_S16_LE);
    return std::make_unique<AlsaPcmWriter>(handle);
}
