#include "system/config_manager.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace apollo {

using json = nlohmann::json;

ConfigManager::ConfigManager()
    : m_settings(createDefaultSettings()) {
}

AnalyzerSettings ConfigManager::createDefaultSettings() {
    return AnalyzerSettings{};
}

bool ConfigManager::loadFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open configuration file: {}", filePath);
        return false;
    }

    std::stringstream contents;
    contents << file.rdbuf();

    if (!loadFromString(contents.str())) {
        LOG_ERROR("Configuration file rejected: {}", filePath);
        return false;
    }

    m_configFilePath = filePath;
    LOG_INFO("Configuration loaded from {}", filePath);
    return true;
}

bool ConfigManager::loadFromString(const std::string& text) {
    AnalyzerSettings settings = m_settings;
    if (!parseSettingsJson(text, settings)) {
        return false;
    }
    return updateSettings(settings);
}

bool ConfigManager::parseSettingsJson(const std::string& text, AnalyzerSettings& settings) const {
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            LOG_ERROR("Configuration root must be a JSON object");
            return false;
        }

        if (root.contains("audio")) {
            const json& audio = root.at("audio");
            if (audio.contains("sampleRate")) {
                settings.sampleRate = audio.at("sampleRate").get<float>();
            }
            if (audio.contains("minBufferSize")) {
                if (audio.at("minBufferSize").is_null()) {
                    settings.minBufferSize.reset();
                } else {
                    settings.minBufferSize = audio.at("minBufferSize").get<uint32_t>();
                }
            }
            if (audio.contains("maxBufferSize")) {
                settings.maxBufferSize = audio.at("maxBufferSize").get<uint32_t>();
            }
            if (audio.contains("processMode")) {
                std::string mode = audio.at("processMode").get<std::string>();
                if (!parseProcessMode(mode, settings.processMode)) {
                    LOG_ERROR("Unknown process mode: {}", mode);
                    return false;
                }
            }
            if (audio.contains("channels")) {
                settings.channels = audio.at("channels").get<uint32_t>();
            }
        }

        if (root.contains("logging")) {
            const json& logging = root.at("logging");
            if (logging.contains("level")) {
                std::string level = logging.at("level").get<std::string>();
                if (!Logger::parseLevel(level, settings.logLevel)) {
                    LOG_ERROR("Unknown log level: {}", level);
                    return false;
                }
            }
            if (logging.contains("file")) {
                settings.logFile = logging.at("file").get<std::string>();
            }
            if (logging.contains("console")) {
                settings.consoleLogging = logging.at("console").get<bool>();
            }
            if (logging.contains("maxFileSize")) {
                settings.logMaxFileSize = logging.at("maxFileSize").get<size_t>();
            }
            if (logging.contains("maxBackupFiles")) {
                settings.logMaxBackupFiles = logging.at("maxBackupFiles").get<size_t>();
            }
        }

        if (root.contains("runner")) {
            const json& runner = root.at("runner");
            if (runner.contains("inputFile")) {
                settings.inputFile = runner.at("inputFile").get<std::string>();
            }
            if (runner.contains("blockSize")) {
                settings.blockSize = runner.at("blockSize").get<uint32_t>();
            }
        }
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse configuration: {}", e.what());
        return false;
    }

    return true;
}

std::string ConfigManager::saveToString() const {
    json root;
    root["audio"]["sampleRate"] = m_settings.sampleRate;
    if (m_settings.minBufferSize) {
        root["audio"]["minBufferSize"] = *m_settings.minBufferSize;
    } else {
        root["audio"]["minBufferSize"] = nullptr;
    }
    root["audio"]["maxBufferSize"] = m_settings.maxBufferSize;
    root["audio"]["processMode"] = processModeToString(m_settings.processMode);
    root["audio"]["channels"] = m_settings.channels;

    std::string level = Logger::levelToString(m_settings.logLevel);
    for (auto& c : level) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    root["logging"]["level"] = level;
    root["logging"]["file"] = m_settings.logFile;
    root["logging"]["console"] = m_settings.consoleLogging;
    root["logging"]["maxFileSize"] = m_settings.logMaxFileSize;
    root["logging"]["maxBackupFiles"] = m_settings.logMaxBackupFiles;

    root["runner"]["inputFile"] = m_settings.inputFile;
    root["runner"]["blockSize"] = m_settings.blockSize;

    return root.dump(4);
}

bool ConfigManager::saveToFile(const std::string& filePath) const {
    std::ofstream file(filePath, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open configuration file for writing: {}", filePath);
        return false;
    }
    file << saveToString() << '\n';
    return file.good();
}

bool ConfigManager::updateSettings(const AnalyzerSettings& settings) {
    std::vector<std::string> errors;
    if (!validateSettings(settings, errors)) {
        for (const auto& error : errors) {
            LOG_ERROR("Invalid configuration: {}", error);
        }
        return false;
    }

    m_settings = settings;
    return true;
}

BufferConfig ConfigManager::toBufferConfig() const {
    BufferConfig config;
    config.sampleRate = m_settings.sampleRate;
    config.minBufferSize = m_settings.minBufferSize;
    config.maxBufferSize = m_settings.maxBufferSize;
    config.processMode = m_settings.processMode;
    return config;
}

bool ConfigManager::validateSettings(const AnalyzerSettings& settings, std::vector<std::string>& errors) {
    errors.clear();

    if (!(settings.sampleRate > 0.0f) || !std::isfinite(settings.sampleRate)) {
        errors.push_back("sampleRate must be positive and finite");
    }
    if (settings.maxBufferSize == 0) {
        errors.push_back("maxBufferSize must be positive");
    }
    if (settings.minBufferSize && *settings.minBufferSize > settings.maxBufferSize) {
        errors.push_back("minBufferSize must not exceed maxBufferSize");
    }
    if (settings.channels == 0 || settings.channels > MAX_CHANNELS) {
        errors.push_back("channels must be between 1 and " + std::to_string(MAX_CHANNELS));
    }
    if (settings.blockSize == 0) {
        errors.push_back("blockSize must be positive");
    }

    return errors.empty();
}

} // namespace apollo
