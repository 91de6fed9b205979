// =================================================================
// include/Tempo/Logger.hpp
// =================================================================
// Header for structured component logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Tempo {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger shared by every Tempo component
 *
 * Writes colored lines to the console and, once a log directory has been
 * configured, to size-rotated files. All public methods may be called
 * from any thread.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files, empty for console only
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = "",
                    size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                    size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a cache eviction
     * @param fingerprint Fingerprint of the evicted entry
     * @param analysis_type Analysis type of the evicted entry
     * @param score Retention score the entry had when it lost
     */
    void logCacheEviction(const std::string& fingerprint, const std::string& analysis_type, double score);

    /**
     * @brief Log a fired performance alert
     * @param severity "info", "warning" or "critical"
     * @param metric Metric that breached its threshold
     * @param value Observed value
     * @param threshold Configured threshold
     */
    void logAlert(const std::string& severity, const std::string& metric,
                  double value, double threshold);

    /**
     * @brief Log the outcome of one optimized request
     * @param session_id Session that issued the request
     * @param cache_hit Whether the result came from the cache
     * @param duration_ms End-to-end duration in milliseconds
     * @param success Whether the request produced a result
     */
    void logRequestOutcome(const std::string& session_id, bool cache_hit,
                           long duration_ms, bool success);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name as used in configuration files
     * @param name Case-insensitive level name
     * @return Parsed level, INFO when the name is unknown
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex m_mutex;
    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    bool ensureLogDirectory();
    std::string generateLogFilename();
};

} // namespace Tempo
