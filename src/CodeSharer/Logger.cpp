// =================================================================
// src/CodeSharer/Logger.cpp
// =================================================================
// Implementation for console and file logging.

#include "CodeSharer/Logger.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace CodeSharer {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::enableFileLogging(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": "
                  << ec.message() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[ERROR] Cannot open log file " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
    }

    info("Logger", "File logging enabled", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logWalkSummary(size_t directories, size_t files, size_t issues) {
    std::ostringstream context;
    context << "Directories: " << directories << ", ";
    context << "Files: " << files << ", ";
    context << "Issues: " << issues;

    info("TreeWalker", "Project walk completed", context.str());

    if (issues > 0) {
        warning("TreeWalker", "Some entries could not be listed",
                "Issues: " + std::to_string(issues));
    }
}

void Logger::logExtraction(size_t total_files, size_t truncated_files, size_t failed_files) {
    std::ostringstream context;
    context << "Total: " << total_files << ", ";
    context << "Truncated: " << truncated_files << ", ";
    context << "Failed: " << failed_files;

    if (failed_files == 0) {
        info("ContentExtractor", "Content extraction completed", context.str());
    } else {
        warning("ContentExtractor", "Content extraction completed with unreadable files", context.str());
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& target) {
    info("Session", "Session started", "Command: " + command + ", Target: " + target);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // Diagnostics go to stderr so stdout stays usable for the tool's own output
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1;

    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool for_console) const {
    std::ostringstream formatted;

    // Console lines carry no timestamp
    if (for_console) {
        formatted << getLevelColor(entry.level) << getLevelName(entry.level) << "\033[0m ";
    } else {
        formatted << formatTimestamp(entry.timestamp) << " [" << getLevelName(entry.level) << "] ";
    }

    formatted << entry.component << ": " << entry.message;
    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Log rotation failed: cannot open " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    try {
        // Only codesharer_*.log files take part in rotation
        std::vector<std::filesystem::path> log_files;
        std::string current = std::filesystem::path(m_current_log_filename).filename().string();
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && isLogFileName(name) && name != current) {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                  });

        size_t keep = m_max_log_files > 0 ? m_max_log_files - 1 : 0;
        for (size_t i = keep; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

bool Logger::isLogFileName(const std::string& file_name) {
    const std::string prefix = LOG_FILE_PREFIX;
    const std::string suffix = ".log";
    return file_name.size() > prefix.size() + suffix.size() &&
           file_name.compare(0, prefix.size(), prefix) == 0 &&
           file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::generateLogFilename() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream filename;
    filename << m_log_dir << "/" << LOG_FILE_PREFIX;
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(3) << ms.count();
    filename << ".log";

    return filename.str();
}

} // namespace CodeSharer
