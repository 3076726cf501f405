#include "core/spectrum_processor.hpp"
#include "core/errors.hpp"
#include "system/logger.hpp"

#include <cmath>

#ifndef APOLLO_VERSION
#define APOLLO_VERSION "0.1.0"
#endif

namespace apollo::core {

const char* SpectrumProcessor::getVersion() {
    return APOLLO_VERSION;
}

const std::vector<AudioIOLayout>& SpectrumProcessor::getAudioIOLayouts() {
    static const std::vector<AudioIOLayout> layouts = {
        AudioIOLayout{2, 2},
        AudioIOLayout{1, 1},
    };
    return layouts;
}

bool SpectrumProcessor::isLayoutSupported(const AudioIOLayout& layout) {
    for (const auto& supported : getAudioIOLayouts()) {
        if (supported == layout) {
            return true;
        }
    }
    return false;
}

SpectrumProcessor::SpectrumProcessor()
    : initialized_(false)
    , blocksProcessed_(0)
    , blocksFailed_(0) {
}

SpectrumProcessor::~SpectrumProcessor() {
    deactivate();
}

bool SpectrumProcessor::validateBufferConfig(const BufferConfig& config, std::string& reason) {
    if (!(config.sampleRate > 0.0f) || !std::isfinite(config.sampleRate)) {
        reason = "sample rate must be positive";
        return false;
    }
    if (config.maxBufferSize == 0) {
        reason = "maximum buffer size must be positive";
        return false;
    }
    if (config.minBufferSize && *config.minBufferSize > config.maxBufferSize) {
        reason = "minimum buffer size exceeds maximum buffer size";
        return false;
    }
    return true;
}

bool SpectrumProcessor::initialize(const AudioIOLayout& layout, const BufferConfig& bufferConfig) {
    if (!isLayoutSupported(layout)) {
        LOG_ERROR("{}: unsupported layout {} in / {} out", NAME,
                  layout.mainInputChannels, layout.mainOutputChannels);
        return false;
    }

    std::string reason;
    if (!validateBufferConfig(bufferConfig, reason)) {
        LOG_ERROR("{}: invalid buffer configuration: {}", NAME, reason);
        return false;
    }

    try {
        if (analyzer_) {
            analyzer_->setSampleRate(bufferConfig.sampleRate);
        } else {
            analyzer_ = std::make_unique<dsp::SpectrumAnalyzer>(bufferConfig.sampleRate);
        }
    } catch (const AnalysisError& e) {
        LOG_ERROR("{}: failed to configure analyzer: {}", NAME, e.what());
        return false;
    }

    layout_ = layout;
    bufferConfig_ = bufferConfig;

    latestResults_.clear();
    latestResults_.reserve(layout.mainInputChannels);

    initialized_ = true;
    LOG_INFO("{} {} initialized: {} channels, {} Hz, max block {} samples, {} mode",
             NAME, getVersion(), layout.mainInputChannels, bufferConfig.sampleRate,
             bufferConfig.maxBufferSize, processModeToString(bufferConfig.processMode));
    return true;
}

ProcessStatus SpectrumProcessor::process(buffer::SampleBuffer& buffer) {
    if (!initialized_) {
        LOG_ERROR("{}: process called before initialize", NAME);
        blocksFailed_++;
        return ProcessStatus::ERROR;
    }

    if (buffer.getSampleCount() > bufferConfig_.maxBufferSize) {
        LOG_WARN("{}: block of {} samples exceeds announced maximum of {}",
                 NAME, buffer.getSampleCount(), bufferConfig_.maxBufferSize);
    }

    try {
        latestResults_ = analyzer_->process(buffer);
    } catch (const AnalysisError& e) {
        LOG_ERROR("{}: block analysis failed ({}): {}", NAME, errorCodeToString(e.getCode()), e.what());
        blocksFailed_++;
        return ProcessStatus::ERROR;
    }

    blocksProcessed_++;
    return ProcessStatus::NORMAL;
}

void SpectrumProcessor::reset() {
    latestResults_.clear();
}

void SpectrumProcessor::deactivate() {
    if (!initialized_) {
        return;
    }
    initialized_ = false;
    LOG_INFO("{} deactivated after {} blocks ({} failed)", NAME, blocksProcessed_, blocksFailed_);
}

} // namespace apollo::core
