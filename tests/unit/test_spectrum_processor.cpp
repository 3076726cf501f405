#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <vector>
#include <cmath>
#include <string>

#include "core/spectrum_processor.hpp"

using namespace apollo;
using namespace apollo::core;
using namespace apollo::core::buffer;
using namespace testing;

class SpectrumProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        stereo_ = AudioIOLayout{2, 2};
        config_.sampleRate = 48000.0f;
        config_.maxBufferSize = 512;
        config_.processMode = ProcessMode::REALTIME;

        audio_.assign(2, std::vector<float>(512, 0.0f));
    }

    SpectrumProcessor processor_;
    AudioIOLayout stereo_;
    BufferConfig config_;
    std::vector<std::vector<float>> audio_;
    SampleBuffer buffer_;
};

TEST_F(SpectrumProcessorTest, Metadata) {
    EXPECT_STREQ(SpectrumProcessor::NAME, "Apollo Spectrum Analyzer");
    EXPECT_STREQ(SpectrumProcessor::VENDOR, "Apollo Digital Audio Workbench");
    EXPECT_FALSE(std::string(SpectrumProcessor::getVersion()).empty());
}

TEST_F(SpectrumProcessorTest, SupportedLayouts) {
    const auto& layouts = SpectrumProcessor::getAudioIOLayouts();

    ASSERT_EQ(layouts.size(), 2u);
    EXPECT_EQ(layouts[0], (AudioIOLayout{2, 2}));
    EXPECT_EQ(layouts[1], (AudioIOLayout{1, 1}));

    EXPECT_TRUE(SpectrumProcessor::isLayoutSupported(AudioIOLayout{1, 1}));
    EXPECT_FALSE(SpectrumProcessor::isLayoutSupported(AudioIOLayout{2, 1}));
    EXPECT_FALSE(SpectrumProcessor::isLayoutSupported(AudioIOLayout{6, 6}));
}

TEST_F(SpectrumProcessorTest, InitializeCreatesAnalyzer) {
    EXPECT_FALSE(processor_.isInitialized());
    EXPECT_EQ(processor_.getAnalyzer(), nullptr);

    ASSERT_TRUE(processor_.initialize(stereo_, config_));

    EXPECT_TRUE(processor_.isInitialized());
    ASSERT_NE(processor_.getAnalyzer(), nullptr);
    EXPECT_FLOAT_EQ(processor_.getAnalyzer()->getSampleRate(), 48000.0f);
    EXPECT_EQ(processor_.getLayout(), stereo_);
    EXPECT_EQ(processor_.getBufferConfig().maxBufferSize, 512u);
}

TEST_F(SpectrumProcessorTest, RejectsUnsupportedLayout) {
    EXPECT_FALSE(processor_.initialize(AudioIOLayout{4, 4}, config_));
    EXPECT_FALSE(processor_.isInitialized());
}

TEST_F(SpectrumProcessorTest, RejectsInvalidBufferConfig) {
    BufferConfig badRate = config_;
    badRate.sampleRate = 0.0f;
    EXPECT_FALSE(processor_.initialize(stereo_, badRate));

    BufferConfig badMax = config_;
    badMax.maxBufferSize = 0;
    EXPECT_FALSE(processor_.initialize(stereo_, badMax));

    BufferConfig badMin = config_;
    badMin.minBufferSize = 1024;
    EXPECT_FALSE(processor_.initialize(stereo_, badMin));

    EXPECT_FALSE(processor_.isInitialized());
}

TEST_F(SpectrumProcessorTest, ReinitializeKeepsAnalyzerAndUpdatesRate) {
    ASSERT_TRUE(processor_.initialize(stereo_, config_));
    auto* analyzer = processor_.getAnalyzer();

    config_.sampleRate = 96000.0f;
    ASSERT_TRUE(processor_.initialize(AudioIOLayout{1, 1}, config_));

    EXPECT_EQ(processor_.getAnalyzer(), analyzer);
    EXPECT_FLOAT_EQ(analyzer->getSampleRate(), 96000.0f);
}

TEST_F(SpectrumProcessorTest, ProcessBeforeInitializeFails) {
    buffer_.bind(audio_);

    EXPECT_EQ(processor_.process(buffer_), ProcessStatus::ERROR);
    EXPECT_TRUE(processor_.getLatestResults().empty());
}

TEST_F(SpectrumProcessorTest, ProcessPublishesResults) {
    ASSERT_TRUE(processor_.initialize(stereo_, config_));

    // 3000 Hz at 48 kHz over 512 samples is exactly bin 32
    for (size_t i = 0; i < 512; ++i) {
        audio_[1][i] = static_cast<float>(std::sin(2.0 * 3.14159265358979323846 * 32.0 * i / 512.0));
    }
    buffer_.bind(audio_);

    ASSERT_EQ(processor_.process(buffer_), ProcessStatus::NORMAL);

    const auto& results = processor_.getLatestResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].magnitudes.size(), 256u);
    EXPECT_NEAR(results[1].magnitudes[32], 256.0f, 0.05f);
    EXPECT_FLOAT_EQ(results[1].frequencies[32], 3000.0f);
    EXPECT_EQ(processor_.getBlocksProcessed(), 1u);
}

TEST_F(SpectrumProcessorTest, FailedBlockKeepsPreviousSnapshot) {
    ASSERT_TRUE(processor_.initialize(stereo_, config_));
    buffer_.bind(audio_);
    ASSERT_EQ(processor_.process(buffer_), ProcessStatus::NORMAL);

    std::vector<std::vector<float>> empty(2);
    buffer_.bind(empty);

    EXPECT_EQ(processor_.process(buffer_), ProcessStatus::ERROR);
    EXPECT_EQ(processor_.getBlocksFailed(), 1u);
    ASSERT_EQ(processor_.getLatestResults().size(), 2u);
    EXPECT_EQ(processor_.getLatestResults()[0].magnitudes.size(), 256u);
}

TEST_F(SpectrumProcessorTest, OversizedBlockStillAnalyzed) {
    ASSERT_TRUE(processor_.initialize(stereo_, config_));
    std::vector<std::vector<float>> large(2, std::vector<float>(2048, 0.0f));
    buffer_.bind(large);

    EXPECT_EQ(processor_.process(buffer_), ProcessStatus::NORMAL);
    EXPECT_EQ(processor_.getLatestResults()[0].magnitudes.size(), 1024u);
}

TEST_F(SpectrumProcessorTest, ResetAndDeactivate) {
    ASSERT_TRUE(processor_.initialize(stereo_, config_));
    buffer_.bind(audio_);
    ASSERT_EQ(processor_.process(buffer_), ProcessStatus::NORMAL);

    processor_.reset();
    EXPECT_TRUE(processor_.getLatestResults().empty());
    EXPECT_TRUE(processor_.isInitialized());

    processor_.deactivate();
    EXPECT_FALSE(processor_.isInitialized());
    EXPECT_EQ(processor_.process(buffer_), ProcessStatus::ERROR);
}

TEST_F(SpectrumProcessorTest, ProcessModeNames) {
    EXPECT_EQ(processModeToString(ProcessMode::OFFLINE), "offline");

    ProcessMode mode = ProcessMode::REALTIME;
    EXPECT_TRUE(parseProcessMode("buffered", mode));
    EXPECT_EQ(mode, ProcessMode::BUFFERED);
    EXPECT_FALSE(parseProcessMode("turbo", mode));
    EXPECT_EQ(mode, ProcessMode::BUFFERED);
}
