#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <vector>

#include "core/buffer/interleave.hpp"
#include "core/errors.hpp"

using namespace apollo::core;
using namespace apollo::core::buffer;
using namespace testing;

class InterleaveTest : public ::testing::Test {
protected:
    void SetUp() override {
        channels_.assign(2, std::vector<float>(frames_, 0.0f));
        buffer_.bind(channels_);
    }

    static constexpr size_t frames_ = 4;
    std::vector<std::vector<float>> channels_;
    SampleBuffer buffer_;
};

TEST_F(InterleaveTest, DeinterleaveSplitsFramesIntoChannels) {
    const std::vector<float> interleaved = {1.0f, -1.0f, 2.0f, -2.0f, 3.0f, -3.0f, 4.0f, -4.0f};

    EXPECT_EQ(deinterleave(interleaved.data(), frames_, buffer_), frames_);

    EXPECT_THAT(channels_[0], ElementsAre(1.0f, 2.0f, 3.0f, 4.0f));
    EXPECT_THAT(channels_[1], ElementsAre(-1.0f, -2.0f, -3.0f, -4.0f));
}

TEST_F(InterleaveTest, InterleaveMergesChannelsIntoFrames) {
    channels_[0] = {0.5f, 0.6f, 0.7f, 0.8f};
    channels_[1] = {-0.5f, -0.6f, -0.7f, -0.8f};
    buffer_.bind(channels_);

    std::vector<float> interleaved(frames_ * 2);
    EXPECT_EQ(interleave(buffer_, interleaved.data()), frames_);

    EXPECT_THAT(interleaved, ElementsAre(0.5f, -0.5f, 0.6f, -0.6f, 0.7f, -0.7f, 0.8f, -0.8f));
}

TEST_F(InterleaveTest, FrameCountMismatchThrows) {
    const std::vector<float> interleaved(10, 0.0f);

    EXPECT_THROW(deinterleave(interleaved.data(), 5, buffer_), ShapeMismatchError);
}

TEST_F(InterleaveTest, UnboundBufferCopiesNothing) {
    SampleBuffer unbound;
    std::vector<float> interleaved(8, 1.0f);

    EXPECT_EQ(deinterleave(interleaved.data(), 0, unbound), 0u);
    EXPECT_EQ(interleave(unbound, interleaved.data()), 0u);
    EXPECT_FLOAT_EQ(interleaved[0], 1.0f);
}
