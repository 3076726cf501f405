#include "core/dsp/spectrum_analyzer.hpp"
#include "core/errors.hpp"
#include "system/logger.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>

namespace apollo::core::dsp {

SpectrumAnalyzer::SpectrumAnalyzer(float sampleRate)
    : sampleRate_(sampleRate)
    , totalBlocksProcessed_(0)
    , totalChannelsProcessed_(0) {
    validateSampleRate(sampleRate);
    LOG_DEBUG("SpectrumAnalyzer created at {} Hz", sampleRate_);
}

SpectrumAnalyzer::~SpectrumAnalyzer() {
    if (totalBlocksProcessed_ > 0) {
        LOG_DEBUG("SpectrumAnalyzer stats: {}", getPerformanceStats());
    }
}

void SpectrumAnalyzer::validateSampleRate(float sampleRate) {
    if (!(sampleRate > 0.0f) || !std::isfinite(sampleRate)) {
        throw InvalidConfigurationError("Sample rate must be positive and finite, got " +
                                        std::to_string(sampleRate));
    }
}

void SpectrumAnalyzer::setSampleRate(float sampleRate) {
    validateSampleRate(sampleRate);
    if (sampleRate != sampleRate_) {
        LOG_INFO("SpectrumAnalyzer sample rate changed: {} Hz -> {} Hz", sampleRate_, sampleRate);
    }
    sampleRate_ = sampleRate;
}

double SpectrumAnalyzer::getFrequencyResolution(size_t transformLength) const {
    if (transformLength == 0) {
        return 0.0;
    }
    return static_cast<double>(sampleRate_) / static_cast<double>(transformLength);
}

std::vector<AnalyzerResult> SpectrumAnalyzer::process(buffer::SampleBuffer& buffer) {
    std::vector<AnalyzerResult> results;

    const size_t channelCount = buffer.getChannelCount();
    if (channelCount == 0) {
        return results;
    }

    const size_t sampleCount = buffer.getSampleCount();
    if (sampleCount == 0) {
        Logger::updatePerformanceMetrics(METRICS_OPERATION, 0.0, false);
        throw InvalidBufferLengthError("Transform length must be positive");
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    std::shared_ptr<const FFTPlan> plan = planner_.planForward(sampleCount);
    ensureScratch(*plan);

    results.resize(channelCount);
    for (size_t ch = 0; ch < channelCount; ++ch) {
        analyzeChannel(buffer.getChannel(ch), *plan, results[ch]);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    double processingTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    totalBlocksProcessed_++;
    totalChannelsProcessed_ += channelCount;

    Logger::updatePerformanceMetrics(METRICS_OPERATION, processingTimeMs, true);
    Logger::logAudioProcessing(METRICS_OPERATION, sampleCount * channelCount, processingTimeMs);
    return results;
}

void SpectrumAnalyzer::ensureScratch(const FFTPlan& plan) {
    if (fftBuffer_.size() < plan.getLength()) {
        fftBuffer_.resize(plan.getLength());
    }
    if (fftScratch_.size() < plan.getScratchLength()) {
        fftScratch_.resize(plan.getScratchLength());
    }
}

void SpectrumAnalyzer::analyzeChannel(const buffer::ChannelSlice& channel, const FFTPlan& plan,
                                      AnalyzerResult& result) {
    const size_t fftSize = plan.getLength();

    // The transform runs in place, so work on a complex copy of the samples
    std::complex<float>* data = fftBuffer_.data();
    for (size_t i = 0; i < fftSize; ++i) {
        data[i] = std::complex<float>(channel[i], 0.0f);
    }

    plan.process(data, fftScratch_.empty() ? nullptr : fftScratch_.data());

    const size_t numBins = fftSize / 2;
    const float binWidth = sampleRate_ / static_cast<float>(fftSize);

    result.magnitudes.resize(numBins);
    result.frequencies.resize(numBins);
    for (size_t bin = 0; bin < numBins; ++bin) {
        const float re = data[bin].real();
        const float im = data[bin].imag();
        result.magnitudes[bin] = std::sqrt(re * re + im * im);
        result.frequencies[bin] = static_cast<float>(bin) * sampleRate_ / static_cast<float>(fftSize);
    }

    LOG_TRACE("Channel analyzed: {} bins, {:.3f} Hz per bin", numBins, binWidth);
}

std::string SpectrumAnalyzer::getPerformanceStats() const {
    Logger::PerformanceMetrics timing = Logger::getPerformanceMetrics(METRICS_OPERATION);

    char buffer[448];
    snprintf(buffer, sizeof(buffer),
        "{"
        "\"total_blocks_processed\":%llu,"
        "\"total_channels_processed\":%llu,"
        "\"average_processing_time_ms\":%.3f,"
        "\"max_processing_time_ms\":%.3f,"
        "\"error_rate\":%.3f,"
        "\"cached_plans\":%zu,"
        "\"sample_rate\":%.1f"
        "}",
        static_cast<unsigned long long>(totalBlocksProcessed_),
        static_cast<unsigned long long>(totalChannelsProcessed_),
        timing.avgLatency,
        timing.maxLatency,
        timing.errorRate,
        planner_.getCachedPlanCount(),
        static_cast<double>(sampleRate_)
    );

    return std::string(buffer);
}

void SpectrumAnalyzer::resetStatistics() {
    totalBlocksProcessed_ = 0;
    totalChannelsProcessed_ = 0;
    Logger::resetPerformanceMetrics(METRICS_OPERATION);
}

} // namespace apollo::core::dsp
