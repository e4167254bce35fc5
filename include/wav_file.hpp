#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

struct WavData {
    unsigned sample_rate = 0;
    unsigned channels = 0;
    std::vector<int16_t> samples;   // interleaved

    // Averages interleaved channels into one.
    std::vector<int16_t> mono() const;
};

// 16-bit PCM only. Both throw std::runtime_error on I/O or format errors.
void write_wav(const std::filesystem::path& path, const std::vector<int16_t>& samples,
               unsigned sample_rate, unsigned channels = 1);
WavData read_wav(const std::filesystem::path& path);
