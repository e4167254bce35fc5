#include "wav_file.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

#pragma pack(push, 1)
struct WavHeader {
    char riff_header[4];
    uint32_t wav_size;
    char wave_header[4];
    char fmt_header[4];
    uint32_t fmt_chunk_size;
    uint16_t audio_format;
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
    char data_header[4];
    uint32_t data_bytes;
};

struct ChunkHeader {
    char id[4];
    uint32_t size;
};
#pragma pack(pop)

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatExtensible = 0xFFFE;

} // namespace

std::vector<int16_t> WavData::mono() const {
    if (channels <= 1) return samples;
    std::vector<int16_t> out(samples.size() / channels);
    for (std::size_t frame = 0; frame < out.size(); ++frame) {
        int acc = 0;
        for (unsigned ch = 0; ch < channels; ++ch) acc += samples[frame * channels + ch];
        out[frame] = static_cast<int16_t>(acc / static_cast<int>(channels));
    }
    return out;
}

void write_wav(const std::filesystem::path& path, const std::vector<int16_t>& samples,
               unsigned sample_rate, unsigned channels) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw std::runtime_error("Cannot open " + path.string() + " for writing");

    WavHeader header = {};
    std::memcpy(header.riff_header, "RIFF", 4);
    std::memcpy(header.wave_header, "WAVE", 4);
    std::memcpy(header.fmt_header, "fmt ", 4);
    header.fmt_chunk_size = 16;
    header.audio_format = kFormatPcm;
    header.num_channels = static_cast<uint16_t>(channels);
    header.sample_rate = sample_rate;
    header.byte_rate = sample_rate * channels * 2; // 16-bit
    header.block_align = static_cast<uint16_t>(channels * 2);
    header.bits_per_sample = 16;
    std::memcpy(header.data_header, "data", 4);
    header.data_bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    header.wav_size = header.data_bytes + 36;

    file.write(reinterpret_cast<const char*>(&header), sizeof(header));
    file.write(reinterpret_cast<const char*>(samples.data()),
               static_cast<std::streamsize>(samples.size() * sizeof(int16_t)));
    if (!file) throw std::runtime_error("Failed writing " + path.string());
}

WavData read_wav(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Cannot open " + path.string());

    char riff[12];
    if (!file.read(riff, sizeof(riff)) || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        throw std::runtime_error(path.string() + " is not a RIFF/WAVE file");
    }

    WavData wav;
    bool have_format = false;
    ChunkHeader chunk{};
    while (file.read(reinterpret_cast<char*>(&chunk), sizeof(chunk))) {
        if (std::memcmp(chunk.id, "fmt ", 4) == 0) {
            std::vector<char> fmt(chunk.size);
            if (!file.read(fmt.data(), static_cast<std::streamsize>(fmt.size())) || fmt.size() < 16) {
                throw std::runtime_error(path.string() + ": truncated fmt chunk");
            }
            uint16_t format = 0;
            uint16_t channels = 0;
            uint32_t rate = 0;
            uint16_t bits = 0;
            std::memcpy(&format, fmt.data(), 2);
            std::memcpy(&channels, fmt.data() + 2, 2);
            std::memcpy(&rate, fmt.data() + 4, 4);
            std::memcpy(&bits, fmt.data() + 14, 2);
            if ((format != kFormatPcm && format != kFormatExtensible) || bits != 16 || channels == 0) {
                throw std::runtime_error(path.string() + ": only 16-bit PCM WAV is supported");
            }
            wav.channels = channels;
            wav.sample_rate = rate;
            have_format = true;
            if (chunk.size & 1u) file.seekg(1, std::ios::cur);
        } else if (std::memcmp(chunk.id, "data", 4) == 0) {
            if (!have_format) throw std::runtime_error(path.string() + ": data chunk before fmt chunk");
            // Streamed WAVs may carry a placeholder size; read what is there.
            std::vector<char> bytes;
            char buffer[8192];
            uint64_t remaining = chunk.size;
            while (remaining > 0) {
                file.read(buffer, sizeof(buffer));
                std::streamsize got = file.gcount();
                if (got <= 0) break;
                auto take = std::min<uint64_t>(static_cast<uint64_t>(got), remaining);
                bytes.insert(bytes.end(), buffer, buffer + take);
                remaining -= take;
            }
            wav.samples.resize(bytes.size() / sizeof(int16_t));
            std::memcpy(wav.samples.data(), bytes.data(), wav.samples.size() * sizeof(int16_t));
            return wav;
        } else {
            file.seekg(chunk.size + (chunk.size & 1u), std::ios::cur);
        }
    }
    throw std::runtime_error(path.string() + ": no data chunk");
}
