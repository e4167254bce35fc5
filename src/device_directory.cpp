#include "device_directory.hpp"

#include "utils.hpp"

#include <sstream>

namespace {

template <typename Pred>
std::optional<int> first_match(const std::vector<AudioDevice>& devices, Direction direction, Pred pred) {
    for (const auto& dev : devices) {
        if (dev.supports(direction) && pred(dev)) return dev.index;
    }
    return std::nullopt;
}

} // namespace

DeviceDirectory::DeviceDirectory(std::vector<AudioDevice> devices) : devices_(std::move(devices)) {
    for (std::size_t i = 0; i < devices_.size(); ++i) {
        devices_[i].index = static_cast<int>(i);
    }
}

DeviceDirectory DeviceDirectory::enumerate(AudioBackend& backend) {
    return DeviceDirectory(backend.list_devices());
}

const AudioDevice* DeviceDirectory::device(int index) const {
    if (index < 0 || static_cast<std::size_t>(index) >= devices_.size()) return nullptr;
    return &devices_[static_cast<std::size_t>(index)];
}

std::optional<int> DeviceDirectory::find_exact(const std::string& name, Direction direction) const {
    const std::string wanted = to_lower(trim(name));
    if (wanted.empty()) return std::nullopt;
    return first_match(devices_, direction, [&](const AudioDevice& dev) {
        return to_lower(trim(dev.name)) == wanted;
    });
}

std::optional<int> DeviceDirectory::find_contains(const std::string& name, Direction direction) const {
    const std::string wanted = to_lower(name);
    if (wanted.empty()) return std::nullopt;
    return first_match(devices_, direction, [&](const AudioDevice& dev) {
        return to_lower(dev.name).find(wanted) != std::string::npos;
    });
}

bool DeviceDirectory::has_device_named(const std::string& name) const {
    const std::string wanted = to_lower(name);
    if (wanted.empty()) return false;
    for (const auto& dev : devices_) {
        if (to_lower(dev.name) == wanted) return true;
    }
    return false;
}

std::string DeviceDirectory::describe() const {
    std::ostringstream oss;
    for (const auto& dev : devices_) {
        oss << dev.index << ": " << dev.name;
        if (!dev.description.empty()) oss << " [" << dev.description << "]";
        oss << " (in=" << dev.max_input_channels << ", out=" << dev.max_output_channels
            << ", " << dev.default_sample_rate << " Hz)\n";
    }
    return oss.str();
}

Status DeviceDirectory::not_found_status(const std::string& what, const std::string& name,
                                         Direction direction) const {
    std::ostringstream oss;
    oss << what << " '" << name << "' not found as " << direction_name(direction) << " device!\n"
        << "Available devices:\n"
        << describe();
    return Status::error(ErrorKind::DeviceNotFound, oss.str());
}
