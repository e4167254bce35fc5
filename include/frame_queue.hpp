#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// A run of mono float samples. Never modified after construction.
class AudioFrame {
public:
    AudioFrame() = default;
    AudioFrame(const float* samples, std::size_t count);
    explicit AudioFrame(std::vector<float> samples);

    std::size_t sample_count() const { return samples_.size(); }
    const float* data() const { return samples_.data(); }
    const std::vector<float>& samples() const { return samples_; }

    // First `n` samples and the rest, as two new frames.
    std::pair<AudioFrame, AudioFrame> split(std::size_t n) const;

private:
    std::vector<float> samples_;
};

// Bounded FIFO between one producer (capture callback) and one consumer
// (playback callback). Neither side ever waits for the other: push_back
// refuses when full and pop_front returns nothing when empty. The lock is
// held only for the deque operation itself.
//
// push_front is the consumer's way to hand back an unconsumed remainder. It
// may use one slot past capacity, so a remainder is never lost because the
// producer refilled the queue between the pop and the push_front.
class FrameQueue {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit FrameQueue(std::size_t capacity = kDefaultCapacity);

    std::size_t capacity() const { return capacity_; }

    bool push_back(AudioFrame frame);
    std::optional<AudioFrame> pop_front();
    bool push_front(AudioFrame frame);

    std::size_t size() const;
    bool empty() const;
    std::size_t total_samples() const;
    void clear();

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<AudioFrame> frames_;
};
