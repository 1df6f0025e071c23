// =================================================================
// include/CodeSharer/Logger.hpp
// =================================================================
// Header for console and file logging.

#pragma once

#include <chrono>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>

namespace CodeSharer {

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
 * @brief Process-wide logger writing to the console and, optionally, to files
 *
 * Console output is always available. File output starts only once
 * enableFileLogging() has been called, so running the tool never leaves
 * log files behind unless asked to.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Start writing log files
     * @param log_dir Directory for log files, created if missing
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep, the current one
     *        included. Rotation only removes files named by isLogFileName().
     */
    void enableFileLogging(const std::string& log_dir,
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
     * @brief Log the outcome of a tree walk
     * @param directories Directories listed in the structure
     * @param files Files listed in the structure
     * @param issues Non-fatal problems met while walking
     */
    void logWalkSummary(size_t directories, size_t files, size_t issues);

    /**
     * @brief Log content extraction statistics
     * @param total_files Files handed to the extractor
     * @param truncated_files Files cut to the character budget
     * @param failed_files Files that could not be read
     */
    void logExtraction(size_t total_files, size_t truncated_files, size_t failed_files);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param target Path the command works on
     */
    void logSessionStart(const std::string& command, const std::string& target);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

    /// Prefix of the files written by enableFileLogging()
    static constexpr const char* LOG_FILE_PREFIX = "codesharer_";

    /**
     * @brief Check whether a file name is one of our rotated log files
     * @param file_name Bare file name, without directory
     * @return True for "codesharer_*.log"
     */
    static bool isLogFileName(const std::string& file_name);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 0;
    size_t m_max_log_files = 0;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param for_console Colored level without timestamp, else the file format
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool for_console = false) const;

    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) const;
    std::string generateLogFilename() const;
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    CodeSharer::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    CodeSharer::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    CodeSharer::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    CodeSharer::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    CodeSharer::Logger::getInstance().critical(component, message)

} // namespace CodeSharer
