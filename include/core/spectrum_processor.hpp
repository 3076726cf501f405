#pragma once

#include <vector>
#include <string>
#include <memory>
#include <cstdint>

#include "audio_types.hpp"
#include "core/buffer/sample_buffer.hpp"
#include "core/dsp/spectrum_analyzer.hpp"

namespace apollo::core {

/**
 * @brief Block-processing front end for the spectrum analyzer
 *
 * Drives a SpectrumAnalyzer from host callbacks: initialize() receives the
 * channel layout and block configuration, process() is called once per
 * block with the bound buffer. Audio passes through unmodified; the
 * analysis of the last successful block is published alongside it through
 * getLatestResults().
 *
 * Analysis errors never escape process(): they are logged and reported as
 * ProcessStatus::ERROR, and the previous snapshot is kept.
 */
class SpectrumProcessor {
public:
    static constexpr const char* NAME = "Apollo Spectrum Analyzer";
    static constexpr const char* VENDOR = "Apollo Digital Audio Workbench";
    static constexpr const char* URL = "https://github.com/apollo-daw";
    static constexpr const char* EMAIL = "jhoeflaken@live.nl";
    static const char* getVersion();

    /**
     * Supported layouts; the first (stereo) is the default
     */
    static const std::vector<AudioIOLayout>& getAudioIOLayouts();
    static bool isLayoutSupported(const AudioIOLayout& layout);

    SpectrumProcessor();
    ~SpectrumProcessor();

    /**
     * Prepare for processing
     * @return false if the layout is unsupported or the block configuration invalid
     */
    bool initialize(const AudioIOLayout& layout, const BufferConfig& bufferConfig);

    /**
     * Analyze one block
     */
    ProcessStatus process(buffer::SampleBuffer& buffer);

    /**
     * Drop the published snapshot
     */
    void reset();

    /**
     * Stop processing until the next initialize()
     */
    void deactivate();

    bool isInitialized() const { return initialized_; }

    const std::vector<dsp::AnalyzerResult>& getLatestResults() const { return latestResults_; }
    uint64_t getBlocksProcessed() const { return blocksProcessed_; }
    uint64_t getBlocksFailed() const { return blocksFailed_; }

    const AudioIOLayout& getLayout() const { return layout_; }
    const BufferConfig& getBufferConfig() const { return bufferConfig_; }

    /**
     * Analyzer in use; null before the first successful initialize()
     */
    dsp::SpectrumAnalyzer* getAnalyzer() const { return analyzer_.get(); }

private:
    static bool validateBufferConfig(const BufferConfig& config, std::string& reason);

    bool initialized_;
    AudioIOLayout layout_;
    BufferConfig bufferConfig_;
    std::unique_ptr<dsp::SpectrumAnalyzer> analyzer_;

    std::vector<dsp::AnalyzerResult> latestResults_;
    uint64_t blocksProcessed_;
    uint64_t blocksFailed_;
};

} // namespace apollo::core
