#include "audio_player.hpp"

#include "logging.hpp"
#include "wav_file.hpp"

#include <algorithm>

Status AudioPlayer::play(const std::filesystem::path& path, const RoutingContext& routing, CancellationToken& cancel) {
    if (!std::filesystem::exists(path)) {
        return Status::error(ErrorKind::IoError, "Audio file does not exist: " + path.string());
    }
    const AudioDevice* device = routing.default_output ? directory_.device(*routing.default_output) : nullptr;
    if (!device) {
        return Status::error(ErrorKind::ConfigurationError, "No output device routed for playback");
    }

    WavData wav;
    try {
        wav = read_wav(path);
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::IoError, e.what());
    }
    std::vector<int16_t> samples = wav.mono();

    StreamParams params;
    params.device_index = device->index;
    params.device_name = device->name;
    params.sample_rate = wav.sample_rate;
    params.block_size = block_size_;

    log_info("AudioPlayer", "playing " + path.filename().string() + " on " + device->name);
    try {
        auto writer = backend_.open_writer(params);
        std::size_t offset = 0;
        while (offset < samples.size()) {
            if (cancel.cancelled()) {
                return Status::error(ErrorKind::Cancelled, "Playback interrupted");
            }
            std::size_t n = std::min<std::size_t>(block_size_, samples.size() - offset);
            writer->write(samples.data() + offset, n);
            offset += n;
        }
        writer->drain();
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::DeviceOpenFailure,
                             "Error occurred while playing audio: " + std::string(e.what()));
    }
    return Status::ok();
}
