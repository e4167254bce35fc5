#include "duplex_bridge.hpp"

#include "device_directory.hpp"
#include "logging.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {

const char* kTag = "DuplexBridge";

std::string index_or_none(const std::optional<int>& idx) {
    return idx ? std::to_string(*idx) : std::string("None");
}

} // namespace

const char* bridge_state_name(BridgeState state) {
    switch (state) {
    case BridgeState::Idle: return "Idle";
    case BridgeState::Initializing: return "Initializing";
    case BridgeState::Running: return "Running";
    case BridgeState::Stopped: return "Stopped";
    }
    return "Unknown";
}

DuplexBridge::DuplexBridge(AudioBackend& backend, BridgeConfig config)
    : backend_(backend), config_(std::move(config)), queue_(config_.queue_capacity) {}

DuplexBridge::~DuplexBridge() { stop(); }

Status DuplexBridge::start() {
    if (state_ == BridgeState::Running) return Status::ok();
    state_ = BridgeState::Initializing;

    DeviceDirectory directory;
    try {
        directory = DeviceDirectory::enumerate(backend_);
    } catch (const std::exception& e) {
        state_ = BridgeState::Idle;
        return Status::error(ErrorKind::DeviceOpenFailure,
                             std::string("Could not enumerate audio devices: ") + e.what());
    }

    auto input = directory.find_exact(config_.microphone_name, Direction::Input);
    auto output = directory.find_exact(config_.virtual_output_name, Direction::Output);
    if (!input || !output) {
        state_ = BridgeState::Idle;
        std::ostringstream oss;
        oss << "Could not initialize audio bridge. Input index: " << index_or_none(input)
            << " ('" << config_.microphone_name << "'), Output index: " << index_or_none(output)
            << " ('" << config_.virtual_output_name << "')\nAvailable devices:\n"
            << directory.describe();
        return Status::error(ErrorKind::DeviceNotFound, oss.str());
    }

    input_index_ = *input;
    output_index_ = *output;
    const AudioDevice* mic = directory.device(input_index_);
    const AudioDevice* cable = directory.device(output_index_);
    sample_rate_ = config_.sample_rate ? config_.sample_rate : static_cast<unsigned>(mic->default_sample_rate);

    StreamParams in_params;
    in_params.device_index = input_index_;
    in_params.device_name = mic->name;
    in_params.sample_rate = sample_rate_;
    in_params.block_size = config_.input_block_size;

    StreamParams out_params;
    out_params.device_index = output_index_;
    out_params.device_name = cable->name;
    out_params.sample_rate = sample_rate_;
    out_params.block_size = config_.output_block_size;

    queue_.clear();
    overflow_count_ = 0;
    underrun_count_ = 0;
    lost_remainders_ = 0;
    frames_enqueued_ = 0;

    try {
        input_stream_ = backend_.open_input_stream(in_params, *this);
        output_stream_ = backend_.open_output_stream(out_params, *this);
        input_stream_->start();
        output_stream_->start();
    } catch (const std::exception& e) {
        close_streams();
        state_ = BridgeState::Idle;
        return Status::error(ErrorKind::DeviceOpenFailure,
                             std::string("Failed to start microphone bridge: ") + e.what());
    }

    state_ = BridgeState::Running;
    log_info(kTag, "forwarding " + mic->name + " (index " + std::to_string(input_index_) + ") -> " +
                       cable->name + " (index " + std::to_string(output_index_) + ") at " +
                       std::to_string(sample_rate_) + " Hz");
    return Status::ok();
}

void DuplexBridge::stop() {
    close_streams();
    BridgeState previous = state_.exchange(BridgeState::Stopped);
    if (previous == BridgeState::Running) {
        log_info(kTag, "stopped; frames enqueued " + std::to_string(frames_enqueued_.load()) +
                           ", dropped " + std::to_string(overflow_count_.load()) + ", underruns " +
                           std::to_string(underrun_count_.load()));
    }
}

bool DuplexBridge::streams_healthy() const {
    return input_stream_ && output_stream_ && input_stream_->active() && output_stream_->active();
}

void DuplexBridge::close_streams() {
    for (auto* stream : {&input_stream_, &output_stream_}) {
        if (!*stream) continue;
        try {
            (*stream)->stop();
            (*stream)->close();
        } catch (const std::exception& e) {
            log_warn(kTag, std::string("error while closing stream: ") + e.what());
        }
        stream->reset();
    }
}

void DuplexBridge::on_input(const float* samples, std::size_t count) noexcept {
    if (!samples || count == 0) return;
    try {
        if (queue_.push_back(AudioFrame(samples, count))) {
            ++frames_enqueued_;
        } else {
            ++overflow_count_;
        }
    } catch (const std::exception&) {
        ++overflow_count_;
    }
}

void DuplexBridge::on_output(float* samples, std::size_t count) noexcept {
    std::size_t filled = 0;
    try {
        while (filled < count) {
            auto frame = queue_.pop_front();
            if (!frame) break;

            const std::size_t needed = count - filled;
            const std::size_t available = frame->sample_count();
            if (available > needed) {
                auto parts = frame->split(needed);
                std::copy_n(parts.first.data(), needed, samples + filled);
                if (!queue_.push_front(std::move(parts.second))) ++lost_remainders_;
                filled = count;
            } else {
                std::copy_n(frame->data(), available, samples + filled);
                filled += available;
            }
        }
    } catch (const std::exception&) {
        // allocation failure while splitting; pad what is left below
    }

    if (filled < count) {
        std::fill(samples + filled, samples + count, 0.0f);
        ++underrun_count_;
    }
}
