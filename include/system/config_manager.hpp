#pragma once

#include "audio_types.hpp"
#include "system/logger.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace apollo {

/**
 * @brief Settings for the analyzer processor and the standalone runner
 */
struct AnalyzerSettings {
    // Block configuration
    float sampleRate = 44100.0f;
    std::optional<uint32_t> minBufferSize;
    uint32_t maxBufferSize = 1024;
    ProcessMode processMode = ProcessMode::REALTIME;
    uint32_t channels = 2;

    // Logging
    Logger::Level logLevel = Logger::Level::Info;
    std::string logFile;
    bool consoleLogging = true;
    size_t logMaxFileSize = 10 * 1024 * 1024;   // Rotate after this many bytes; 0 disables rotation
    size_t logMaxBackupFiles = 5;

    // Standalone runner
    std::string inputFile;          // Interleaved float32 PCM; empty = synthesized test tone
    uint32_t blockSize = 1024;
};

/**
 * @brief Loads, validates and serializes AnalyzerSettings as JSON
 *
 * Missing keys keep their defaults and unknown keys are ignored. A load
 * or update that fails validation logs every problem and leaves the
 * current settings untouched.
 */
class ConfigManager {
public:
    ConfigManager();

    // Configuration loading
    bool loadFromFile(const std::string& filePath);
    bool loadFromString(const std::string& json);

    // Configuration saving
    bool saveToFile(const std::string& filePath) const;
    std::string saveToString() const;

    // Configuration access
    const AnalyzerSettings& getSettings() const { return m_settings; }
    bool updateSettings(const AnalyzerSettings& settings);
    const std::string& getConfigFilePath() const { return m_configFilePath; }

    /**
     * Block configuration to hand to SpectrumProcessor::initialize
     */
    BufferConfig toBufferConfig() const;

    // Validation
    static bool validateSettings(const AnalyzerSettings& settings, std::vector<std::string>& errors);

    static AnalyzerSettings createDefaultSettings();

    static constexpr uint32_t MAX_CHANNELS = 64;

private:
    bool parseSettingsJson(const std::string& json, AnalyzerSettings& settings) const;

    AnalyzerSettings m_settings;
    std::string m_configFilePath;
};

} // namespace apollo
