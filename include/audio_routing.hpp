#pragma once

#include "device_directory.hpp"
#include "status.hpp"

#include <optional>
#include <string>

// The session's default device pair. Passed explicitly to whoever plays or
// records "on the default device" instead of living in global state.
struct RoutingContext {
    std::optional<int> default_input;
    std::optional<int> default_output;
};

// Resolves device names by substring and updates one coordinate of a
// RoutingContext. One session at a time per context; callers serialize.
class AudioRoutingService {
public:
    explicit AudioRoutingService(const DeviceDirectory& directory) : directory_(directory) {}

    Status route_input(RoutingContext& ctx, const std::string& name) const;
    Status route_output(RoutingContext& ctx, const std::string& name) const;

private:
    const DeviceDirectory& directory_;
};
