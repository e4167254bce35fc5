#pragma once

#include "audio_backend.hpp"
#include "audio_routing.hpp"
#include "cancellation.hpp"
#include "device_directory.hpp"
#include "status.hpp"

#include <filesystem>

// Plays a 16-bit PCM WAV file on the routed default output device, mixed
// down to mono. Checks the cancellation token between blocks.
class AudioPlayer {
public:
    AudioPlayer(AudioBackend& backend, const DeviceDirectory& directory, unsigned block_size = 1024)
        : backend_(backend), directory_(directory), block_size_(block_size) {}

    Status play(const std::filesystem::path& path, const RoutingContext& routing, CancellationToken& cancel);

private:
    AudioBackend& backend_;
    const DeviceDirectory& directory_;
    unsigned block_size_;
};
