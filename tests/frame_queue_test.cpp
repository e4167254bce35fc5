#include "frame_queue.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {

AudioFrame frame_of(std::vector<float> samples) { return AudioFrame(std::move(samples)); }

} // namespace

TEST(FrameQueueTest, PopsInPushOrder) {
    FrameQueue queue(4);
    ASSERT_TRUE(queue.push_back(frame_of({1.0f})));
    ASSERT_TRUE(queue.push_back(frame_of({2.0f, 2.5f})));
    ASSERT_TRUE(queue.push_back(frame_of({3.0f})));
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.total_samples(), 4u);

    EXPECT_EQ(queue.pop_front()->samples(), std::vector<float>({1.0f}));
    EXPECT_EQ(queue.pop_front()->samples(), std::vector<float>({2.0f, 2.5f}));
    EXPECT_EQ(queue.pop_front()->samples(), std::vector<float>({3.0f}));
    EXPECT_FALSE(queue.pop_front().has_value());
    EXPECT_TRUE(queue.empty());
}

TEST(FrameQueueTest, FullQueueRefusesNewestFrame) {
    FrameQueue queue(2);
    EXPECT_TRUE(queue.push_back(frame_of({1.0f})));
    EXPECT_TRUE(queue.push_back(frame_of({2.0f})));
    EXPECT_FALSE(queue.push_back(frame_of({3.0f})));
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop_front()->samples()[0], 1.0f);
    EXPECT_EQ(queue.pop_front()->samples()[0], 2.0f);
}

TEST(FrameQueueTest, PushFrontGoesToHead) {
    FrameQueue queue(3);
    queue.push_back(frame_of({2.0f}));
    queue.push_back(frame_of({3.0f}));
    EXPECT_TRUE(queue.push_front(frame_of({1.0f})));
    EXPECT_EQ(queue.pop_front()->samples()[0], 1.0f);
    EXPECT_EQ(queue.pop_front()->samples()[0], 2.0f);
}

TEST(FrameQueueTest, PushFrontMayUseOneSlotPastCapacity) {
    FrameQueue queue(2);
    queue.push_back(frame_of({1.0f}));
    queue.push_back(frame_of({2.0f}));
    EXPECT_TRUE(queue.push_front(frame_of({0.5f})));
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_FALSE(queue.push_front(frame_of({0.25f})));
    EXPECT_FALSE(queue.push_back(frame_of({3.0f})));
}

TEST(FrameQueueTest, RemainderReturnedToFullQueueStaysAhead) {
    FrameQueue queue(2);
    queue.push_back(frame_of({1.0f, 2.0f}));
    queue.push_back(frame_of({3.0f}));
    auto head = queue.pop_front();
    ASSERT_TRUE(head.has_value());

    // the producer refills the queue before the remainder goes back
    ASSERT_TRUE(queue.push_back(frame_of({4.0f})));
    auto parts = head->split(1);
    ASSERT_TRUE(queue.push_front(std::move(parts.second)));
    EXPECT_FALSE(queue.push_back(frame_of({5.0f})));

    EXPECT_EQ(queue.pop_front()->samples(), std::vector<float>({2.0f}));
    EXPECT_EQ(queue.pop_front()->samples(), std::vector<float>({3.0f}));
    EXPECT_EQ(queue.pop_front()->samples(), std::vector<float>({4.0f}));
    EXPECT_TRUE(queue.empty());
}

TEST(FrameQueueTest, ClearEmptiesQueue) {
    FrameQueue queue(2);
    queue.push_back(frame_of({1.0f}));
    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.total_samples(), 0u);
}

TEST(FrameQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW({ FrameQueue queue(0); }, std::invalid_argument);
}

TEST(AudioFrameTest, SplitKeepsAllSamples) {
    AudioFrame frame = frame_of({1.0f, 2.0f, 3.0f, 4.0f, 5.0f});
    auto parts = frame.split(2);
    EXPECT_EQ(parts.first.samples(), std::vector<float>({1.0f, 2.0f}));
    EXPECT_EQ(parts.second.samples(), std::vector<float>({3.0f, 4.0f, 5.0f}));
    EXPECT_EQ(frame.sample_count(), 5u);
}

TEST(AudioFrameTest, SplitPastEndLeavesEmptyRemainder) {
    AudioFrame frame = frame_of({1.0f, 2.0f});
    auto parts = frame.split(10);
    EXPECT_EQ(parts.first.sample_count(), 2u);
    EXPECT_EQ(parts.second.sample_count(), 0u);
}
