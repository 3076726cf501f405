#include <iostream>
#include <fstream>
#include <vector>
#include <memory>
#include <csignal>
#include <atomic>
#include <cmath>
#include <algorithm>
#include <iterator>

#include "audio_types.hpp"
#include "core/buffer/sample_buffer.hpp"
#include "core/buffer/interleave.hpp"
#include "core/spectrum_processor.hpp"
#include "system/logger.hpp"
#include "system/config_manager.hpp"

using namespace apollo;
using namespace apollo::core;

namespace {

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

constexpr double kPi = 3.14159265358979323846;
constexpr float kTestToneHz = 440.0f;

/**
 * One second of interleaved test tones, channel c at 440 Hz * (c + 1)
 */
std::vector<float> synthesizeTestTone(const AnalyzerSettings& settings) {
    const size_t frames = static_cast<size_t>(settings.sampleRate);
    std::vector<float> interleaved(frames * settings.channels);

    for (size_t i = 0; i < frames; ++i) {
        double t = static_cast<double>(i) / settings.sampleRate;
        for (uint32_t ch = 0; ch < settings.channels; ++ch) {
            double frequency = kTestToneHz * (ch + 1);
            interleaved[i * settings.channels + ch] = static_cast<float>(0.5 * std::sin(2.0 * kPi * frequency * t));
        }
    }
    return interleaved;
}

bool readInterleavedInput(const std::string& path, uint32_t channels, std::vector<float>& interleaved) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open input file: {}", path);
        return false;
    }

    std::streamsize bytes = file.tellg();
    file.seekg(0, std::ios::beg);

    const size_t frameBytes = sizeof(float) * channels;
    size_t frames = static_cast<size_t>(bytes) / frameBytes;
    if (static_cast<size_t>(bytes) % frameBytes != 0) {
        LOG_WARN("Input file {} ends with a partial frame, ignoring trailing bytes", path);
    }

    interleaved.resize(frames * channels);
    if (!file.read(reinterpret_cast<char*>(interleaved.data()),
                   static_cast<std::streamsize>(frames * frameBytes))) {
        LOG_ERROR("Failed to read input file: {}", path);
        return false;
    }

    LOG_INFO("Read {} frames ({} channels) from {}", frames, channels, path);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Console logging until the configuration says otherwise
        Logger::initialize();

        ConfigManager configManager;
        if (argc > 1 && !configManager.loadFromFile(argv[1])) {
            LOG_CRITICAL("Failed to load configuration from {}", argv[1]);
            Logger::shutdown();
            return 1;
        }
        const AnalyzerSettings& settings = configManager.getSettings();

        if (!Logger::initialize(settings.logFile, settings.logLevel, settings.consoleLogging)) {
            std::cerr << "Failed to initialize logging" << std::endl;
            return 1;
        }
        Logger::setMaxFileSize(settings.logMaxFileSize);
        Logger::setMaxBackupFiles(settings.logMaxBackupFiles);
        LOG_INFO("{} {} starting", SpectrumProcessor::NAME, SpectrumProcessor::getVersion());

        SpectrumProcessor processor;
        AudioIOLayout layout{settings.channels, settings.channels};
        if (!processor.initialize(layout, configManager.toBufferConfig())) {
            LOG_ERROR("Failed to initialize processor");
            Logger::shutdown();
            return 1;
        }

        std::vector<float> interleaved;
        if (settings.inputFile.empty()) {
            interleaved = synthesizeTestTone(settings);
            LOG_INFO("No input file configured, analyzing synthesized test tones");
        } else if (!readInterleavedInput(settings.inputFile, settings.channels, interleaved)) {
            Logger::shutdown();
            return 1;
        }

        // Host-side channel storage, reused for every block
        const size_t totalFrames = interleaved.size() / settings.channels;
        std::vector<std::vector<float>> channelData(settings.channels, std::vector<float>(settings.blockSize));
        std::vector<float*> channelPointers(settings.channels);
        for (uint32_t ch = 0; ch < settings.channels; ++ch) {
            channelPointers[ch] = channelData[ch].data();
        }

        buffer::SampleBuffer sampleBuffer;
        size_t blockIndex = 0;
        size_t failedBlocks = 0;

        for (size_t offset = 0; offset < totalFrames && !g_shutdown_requested; offset += settings.blockSize) {
            size_t frames = std::min<size_t>(settings.blockSize, totalFrames - offset);

            sampleBuffer.bind(channelPointers.data(), channelPointers.size(), frames);
            buffer::deinterleave(interleaved.data() + offset * settings.channels, frames, sampleBuffer);

            if (processor.process(sampleBuffer) != ProcessStatus::NORMAL) {
                failedBlocks++;
            } else {
                const auto& results = processor.getLatestResults();
                for (size_t ch = 0; ch < results.size(); ++ch) {
                    const auto& magnitudes = results[ch].magnitudes;
                    if (magnitudes.empty()) {
                        continue;
                    }
                    auto peak = std::max_element(magnitudes.begin(), magnitudes.end());
                    size_t bin = static_cast<size_t>(std::distance(magnitudes.begin(), peak));
                    LOG_INFO("Block {} channel {}: peak {:.1f} Hz (magnitude {:.3f})",
                             blockIndex, ch, results[ch].frequencies[bin], *peak);
                }
            }

            sampleBuffer.unbind();
            blockIndex++;
        }

        LOG_INFO("Analyzed {} blocks, {} failed", blockIndex, failedBlocks);
        LOG_INFO("Analyzer stats: {}", processor.getAnalyzer()->getPerformanceStats());

        processor.deactivate();
        Logger::shutdown();
        return failedBlocks == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        Logger::shutdown();
        return 1;
    }
}
