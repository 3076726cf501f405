#include "system/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace apollo {

std::unique_ptr<Logger> Logger::s_instance;
std::atomic<Logger::Level> Logger::s_currentLevel{Logger::Level::Info};
std::atomic<bool> Logger::s_consoleEnabled{true};
std::atomic<bool> Logger::s_fileEnabled{false};
std::atomic<bool> Logger::s_initialized{false};

Logger::Logger() = default;

Logger::~Logger() {
    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool Logger::initialize(const std::string& logFile, Level minLevel, bool enableConsole) {
    if (s_initialized.load()) {
        shutdown();
    }

    auto instance = std::make_unique<Logger>();
    bool fileEnabled = false;

    if (!logFile.empty()) {
        instance->m_logFile.open(logFile, std::ios::out | std::ios::app);
        if (!instance->m_logFile.is_open()) {
            std::cerr << "Logger: unable to open log file " << logFile << std::endl;
            return false;
        }
        instance->m_logFilePath = logFile;
        instance->m_logFile.seekp(0, std::ios::end);
        instance->m_currentFileSize = static_cast<size_t>(std::max<std::streamoff>(0, instance->m_logFile.tellp()));
        fileEnabled = true;
    }

    s_instance = std::move(instance);
    s_currentLevel.store(minLevel);
    s_consoleEnabled.store(enableConsole);
    s_fileEnabled.store(fileEnabled);
    s_initialized.store(true);
    return true;
}

void Logger::shutdown() {
    if (!s_initialized.exchange(false)) {
        return;
    }
    flush();
    s_instance.reset();
    s_fileEnabled.store(false);
}

bool Logger::isInitialized() {
    return s_initialized.load();
}

void Logger::setLevel(Level level) {
    s_currentLevel.store(level);
}

Logger::Level Logger::getLevel() {
    return s_currentLevel.load();
}

void Logger::setMaxFileSize(size_t maxSize) {
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        s_instance->m_maxFileSize = maxSize;
    }
}

void Logger::setMaxBackupFiles(size_t maxBackups) {
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        s_instance->m_maxBackupFiles = maxBackups;
    }
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        level = Level::Trace;
    } else if (lower == "debug") {
        level = Level::Debug;
    } else if (lower == "info") {
        level = Level::Info;
    } else if (lower == "warn" || lower == "warning") {
        level = Level::Warning;
    } else if (lower == "error") {
        level = Level::Error;
    } else if (lower == "critical") {
        level = Level::Critical;
    } else {
        return false;
    }
    return true;
}

void Logger::write(Level level, const std::string& message) {
    if (!s_instance) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&time, &localTime);

    std::ostringstream line;
    line << "[" << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    line << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    line << "[" << levelToString(level) << "] " << message;

    std::lock_guard<std::mutex> lock(s_instance->m_mutex);

    if (s_consoleEnabled.load()) {
        writeToConsole(level, line.str());
    }
    if (s_fileEnabled.load() && s_instance->m_logFile.is_open()) {
        writeToFile(line.str());
    }
}

void Logger::writeToConsole(Level level, const std::string& line) {
    if (level >= Level::Warning) {
        std::cerr << line << '\n';
    } else {
        std::cout << line << '\n';
    }
}

void Logger::writeToFile(const std::string& line) {
    s_instance->m_logFile << line << '\n';
    s_instance->m_currentFileSize += line.size() + 1;

    if (s_instance->m_maxFileSize > 0 && s_instance->m_currentFileSize >= s_instance->m_maxFileSize) {
        rotateLogFile();
    }
}

// Caller holds m_mutex.
void Logger::rotateLogFile() {
    Logger& self = *s_instance;
    self.m_logFile.close();

    if (self.m_maxBackupFiles > 0) {
        std::string oldest = self.m_logFilePath + "." + std::to_string(self.m_maxBackupFiles);
        std::remove(oldest.c_str());
        for (size_t i = self.m_maxBackupFiles; i > 1; --i) {
            std::string from = self.m_logFilePath + "." + std::to_string(i - 1);
            std::string to = self.m_logFilePath + "." + std::to_string(i);
            std::rename(from.c_str(), to.c_str());
        }
        std::string first = self.m_logFilePath + ".1";
        std::rename(self.m_logFilePath.c_str(), first.c_str());
    }

    self.m_logFile.open(self.m_logFilePath, std::ios::out | std::ios::trunc);
    self.m_currentFileSize = 0;
    if (!self.m_logFile.is_open()) {
        s_fileEnabled.store(false);
        std::cerr << "Logger: unable to reopen log file " << self.m_logFilePath << std::endl;
    }
}

void Logger::logAudioProcessing(const std::string& operation, uint64_t samplesProcessed,
                                double processingTimeMs) {
    trace("{}: {} samples in {:.3f} ms", operation, samplesProcessed, processingTimeMs);
}

void Logger::updatePerformanceMetrics(const std::string& operation, double latencyMs, bool success) {
    if (!s_instance) {
        return;
    }

    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    OperationMetrics& metrics = s_instance->m_metrics[operation];

    if (metrics.operationCount == 0) {
        metrics.minLatency = latencyMs;
        metrics.maxLatency = latencyMs;
    } else {
        metrics.minLatency = std::min(metrics.minLatency, latencyMs);
        metrics.maxLatency = std::max(metrics.maxLatency, latencyMs);
    }
    metrics.totalLatency += latencyMs;
    metrics.operationCount++;
    if (!success) {
        metrics.errorCount++;
    }
}

Logger::PerformanceMetrics Logger::getPerformanceMetrics(const std::string& operation) {
    PerformanceMetrics result;
    if (!s_instance) {
        return result;
    }

    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    auto it = s_instance->m_metrics.find(operation);
    if (it == s_instance->m_metrics.end() || it->second.operationCount == 0) {
        return result;
    }

    const OperationMetrics& metrics = it->second;
    result.totalOperations = metrics.operationCount;
    result.avgLatency = metrics.totalLatency / static_cast<double>(metrics.operationCount);
    result.minLatency = metrics.minLatency;
    result.maxLatency = metrics.maxLatency;
    result.errorRate = static_cast<double>(metrics.errorCount) / static_cast<double>(metrics.operationCount);
    return result;
}

void Logger::resetPerformanceMetrics(const std::string& operation) {
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    s_instance->m_metrics.erase(operation);
}

void Logger::flush() {
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_mutex);
    std::cout.flush();
    if (s_instance->m_logFile.is_open()) {
        s_instance->m_logFile.flush();
    }
}

} // namespace apollo
