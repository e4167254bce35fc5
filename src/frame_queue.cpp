#include "frame_queue.hpp"

#include <algorithm>
#include <stdexcept>

AudioFrame::AudioFrame(const float* samples, std::size_t count) : samples_(samples, samples + count) {}

AudioFrame::AudioFrame(std::vector<float> samples) : samples_(std::move(samples)) {}

std::pair<AudioFrame, AudioFrame> AudioFrame::split(std::size_t n) const {
    n = std::min(n, samples_.size());
    auto mid = samples_.begin() + static_cast<std::ptrdiff_t>(n);
    return {AudioFrame(std::vector<float>(samples_.begin(), mid)),
            AudioFrame(std::vector<float>(mid, samples_.end()))};
}

FrameQueue::FrameQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("FrameQueue capacity must be positive");
    }
}

bool FrameQueue::push_back(AudioFrame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.size() >= capacity_) return false;
    frames_.push_back(std::move(frame));
    return true;
}

std::optional<AudioFrame> FrameQueue::pop_front() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty()) return std::nullopt;
    AudioFrame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

bool FrameQueue::push_front(AudioFrame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.size() > capacity_) return false;
    frames_.push_front(std::move(frame));
    return true;
}

std::size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

bool FrameQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty();
}

std::size_t FrameQueue::total_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& frame : frames_) total += frame.sample_count();
    return total;
}

void FrameQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
}
