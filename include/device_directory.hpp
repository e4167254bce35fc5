#pragma once

#include "audio_backend.hpp"
#include "audio_device.hpp"
#include "status.hpp"

#include <optional>
#include <string>
#include <vector>

// Snapshot of the devices from one enumeration call. Lookups return the
// lowest index that matches; enumeration order is never re-sorted.
class DeviceDirectory {
public:
    DeviceDirectory() = default;
    explicit DeviceDirectory(std::vector<AudioDevice> devices);

    static DeviceDirectory enumerate(AudioBackend& backend);

    const std::vector<AudioDevice>& list_devices() const { return devices_; }
    const AudioDevice* device(int index) const;

    // Case-insensitive, whitespace-trimmed equality on the name.
    std::optional<int> find_exact(const std::string& name, Direction direction) const;
    // Case-insensitive substring match on the name.
    std::optional<int> find_contains(const std::string& name, Direction direction) const;

    bool has_device_named(const std::string& name) const;

    std::string describe() const;
    Status not_found_status(const std::string& what, const std::string& name, Direction direction) const;

private:
    std::vector<AudioDevice> devices_;
};
