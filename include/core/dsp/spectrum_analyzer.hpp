#pragma once

#include <vector>
#include <complex>
#include <string>
#include <cstdint>

#include "core/buffer/sample_buffer.hpp"
#include "core/dsp/fft_planner.hpp"

namespace apollo::core::dsp {

/**
 * Spectrum of one channel for one block
 *
 * Both vectors hold N/2 entries for a block of N samples and are
 * index-aligned: magnitudes[i] is the bin at frequencies[i] Hz.
 */
struct AnalyzerResult {
    std::vector<float> frequencies;     // Ascending, spaced sampleRate / N, starting at 0 Hz
    std::vector<float> magnitudes;      // Raw |X[k]|, no window, no 1/N normalization
};

/**
 * Per-block spectrum analyzer
 *
 * Runs a forward DFT over every channel of a bound SampleBuffer and
 * reports the lower half of the spectrum (bins 0 .. N/2 - 1) as raw,
 * unnormalized magnitudes together with their bin frequencies.
 *
 * Plans are cached by transform length and the complex work buffers are
 * kept between calls, so blocks of a constant size only allocate the
 * returned result vectors. Not thread-safe; one analyzer per audio thread.
 */
class SpectrumAnalyzer {
public:
    /**
     * @param sampleRate Sample rate in Hz, must be positive and finite
     * @throws InvalidConfigurationError on an invalid sample rate
     */
    explicit SpectrumAnalyzer(float sampleRate);
    ~SpectrumAnalyzer();

    float getSampleRate() const { return sampleRate_; }

    /**
     * Takes effect on the next process() call and only changes the
     * frequency axis.
     * @throws InvalidConfigurationError on an invalid sample rate
     */
    void setSampleRate(float sampleRate);

    /**
     * Analyze every channel of the buffer
     *
     * The channel samples are copied into complex scratch storage before
     * the in-place transform; the bound storage is never written.
     *
     * @return One result per channel, in channel order; empty when the
     *         buffer has no channels
     * @throws InvalidBufferLengthError if channels are bound with zero samples.
     *         Nothing is returned when any channel fails.
     */
    std::vector<AnalyzerResult> process(buffer::SampleBuffer& buffer);

    /**
     * Bin spacing in Hz for a given transform length
     */
    double getFrequencyResolution(size_t transformLength) const;

    size_t getCachedPlanCount() const { return planner_.getCachedPlanCount(); }

    /**
     * Complex values currently reserved for the transform work area
     */
    size_t getScratchCapacity() const { return fftBuffer_.capacity() + fftScratch_.capacity(); }

    uint64_t getBlocksProcessed() const { return totalBlocksProcessed_; }

    /**
     * Get performance statistics as a JSON object string. Timing figures
     * come from the Logger's metrics and read zero while logging is not
     * initialized.
     */
    std::string getPerformanceStats() const;

    /**
     * Operation name under which process() reports to Logger::updatePerformanceMetrics
     */
    static constexpr const char* METRICS_OPERATION = "SpectrumAnalyzer::process";
    void resetStatistics();

private:
    static void validateSampleRate(float sampleRate);

    void ensureScratch(const FFTPlan& plan);
    void analyzeChannel(const buffer::ChannelSlice& channel, const FFTPlan& plan, AnalyzerResult& result);

    float sampleRate_;
    FFTPlanner planner_;

    // Length-indexed work area, grown on demand and reused across blocks
    std::vector<std::complex<float>> fftBuffer_;
    std::vector<std::complex<float>> fftScratch_;

    // Performance tracking
    uint64_t totalBlocksProcessed_;
    uint64_t totalChannelsProcessed_;
};

} // namespace apollo::core::dsp
