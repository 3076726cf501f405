#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <unordered_map>
#include <utility>
#include <cstdint>

namespace apollo {

/**
 * @brief Lightweight logging facade for the analyzer core and its tools
 *
 * Messages use `{}` placeholders (optionally `{:.Nf}` for fixed precision).
 * Until initialize() is called every logging call is a no-op, so the core
 * library can be embedded without any logging setup.
 */
class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Critical = 5
    };

    Logger();
    ~Logger();

    // Initialization
    static bool initialize(const std::string& logFile = "",
                          Level minLevel = Level::Info,
                          bool enableConsole = true);
    static void shutdown();
    static bool isInitialized();

    // Configuration
    static void setLevel(Level level);
    static Level getLevel();
    static void setMaxFileSize(size_t maxSize);
    static void setMaxBackupFiles(size_t maxBackups);

    static std::string levelToString(Level level);
    static bool parseLevel(const std::string& name, Level& level);

    // Logging methods
    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warning(const std::string& format, Args&&... args) {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(Level::Error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }

    // Performance logging
    static void logAudioProcessing(const std::string& operation, uint64_t samplesProcessed,
                                  double processingTimeMs);

    struct PerformanceMetrics {
        double avgLatency = 0.0;
        double maxLatency = 0.0;
        double minLatency = 0.0;
        uint64_t totalOperations = 0;
        double errorRate = 0.0;
    };

    static void updatePerformanceMetrics(const std::string& operation, double latencyMs, bool success);
    static PerformanceMetrics getPerformanceMetrics(const std::string& operation);
    static void resetPerformanceMetrics(const std::string& operation);

    static void flush();

    /**
     * Substitute `{}` placeholders in order. Extra placeholders are kept
     * verbatim, extra arguments are ignored.
     */
    template<typename... Args>
    static std::string formatMessage(const std::string& format, Args&&... args) {
        std::ostringstream out;
        size_t pos = 0;
        appendFormatted(out, format, pos, std::forward<Args>(args)...);
        out << format.substr(pos);
        return out.str();
    }

private:
    template<typename... Args>
    static void log(Level level, const std::string& format, Args&&... args) {
        if (!s_initialized.load() || level < s_currentLevel.load()) {
            return;
        }

        std::string message;
        try {
            message = formatMessage(format, std::forward<Args>(args)...);
        } catch (const std::exception& e) {
            message = format + " (format error: " + e.what() + ")";
        }
        write(level, message);
    }

    static void appendFormatted(std::ostringstream&, const std::string&, size_t&) {}

    template<typename T, typename... Rest>
    static void appendFormatted(std::ostringstream& out, const std::string& format, size_t& pos,
                                T&& value, Rest&&... rest) {
        size_t open = format.find('{', pos);
        if (open == std::string::npos) {
            return;
        }
        size_t close = format.find('}', open);
        if (close == std::string::npos) {
            return;
        }

        out << format.substr(pos, open - pos);

        // "{:.3f}" style fixed precision
        std::string spec = format.substr(open + 1, close - open - 1);
        std::ios::fmtflags flags = out.flags();
        std::streamsize precision = out.precision();
        size_t dot = spec.find('.');
        if (!spec.empty() && spec[0] == ':' && dot != std::string::npos) {
            out << std::fixed << std::setprecision(std::stoi(spec.substr(dot + 1)));
        }
        out << std::forward<T>(value);
        out.flags(flags);
        out.precision(precision);

        pos = close + 1;
        appendFormatted(out, format, pos, std::forward<Rest>(rest)...);
    }

    static void write(Level level, const std::string& message);
    static void writeToConsole(Level level, const std::string& line);
    static void writeToFile(const std::string& line);
    static void rotateLogFile();

    // Instance data
    std::mutex m_mutex;
    std::ofstream m_logFile;
    std::string m_logFilePath;
    size_t m_currentFileSize = 0;
    size_t m_maxFileSize = 10 * 1024 * 1024; // 10MB default
    size_t m_maxBackupFiles = 5;

    struct OperationMetrics {
        double totalLatency = 0.0;
        double maxLatency = 0.0;
        double minLatency = 0.0;
        uint64_t operationCount = 0;
        uint64_t errorCount = 0;
    };

    std::unordered_map<std::string, OperationMetrics> m_metrics;
    mutable std::mutex m_metricsMutex;

    // Static instance and configuration
    static std::unique_ptr<Logger> s_instance;
    static std::atomic<Level> s_currentLevel;
    static std::atomic<bool> s_consoleEnabled;
    static std::atomic<bool> s_fileEnabled;
    static std::atomic<bool> s_initialized;
};

// Convenience macros for performance-critical code
#define LOG_TRACE(...) ::apollo::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::apollo::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...) ::apollo::Logger::info(__VA_ARGS__)
#define LOG_WARN(...) ::apollo::Logger::warning(__VA_ARGS__)
#define LOG_ERROR(...) ::apollo::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::apollo::Logger::critical(__VA_ARGS__)

} // namespace apollo
