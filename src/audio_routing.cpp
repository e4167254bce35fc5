#include "audio_routing.hpp"

#include "logging.hpp"

Status AudioRoutingService::route_input(RoutingContext& ctx, const std::string& name) const {
    auto idx = directory_.find_contains(name, Direction::Input);
    if (!idx) return directory_.not_found_status("Audio input device", name, Direction::Input);

    ctx.default_input = *idx;
    log_info("AudioRoutingService", "default input -> " + directory_.device(*idx)->name +
                                        " (index " + std::to_string(*idx) + ")");
    return Status::ok();
}

Status AudioRoutingService::route_output(RoutingContext& ctx, const std::string& name) const {
    auto idx = directory_.find_contains(name, Direction::Output);
    if (!idx) return directory_.not_found_status("Audio output device", name, Direction::Output);

    ctx.default_output = *idx;
    log_info("AudioRoutingService", "default output -> " + directory_.device(*idx)->name +
                                         " (index " + std::to_string(*idx) + ")");
    return Status::ok();
}
