#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace lanmeet {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Process-wide logger shared by every session component.
 * Console output is always on unless disabled; file output mirrors the
 * console lines (without colors) into an append-only meeting log.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    void set_console_logging_enabled(bool enabled);
    bool is_console_logging_enabled() const;

    /**
     * Set the meeting log path. Takes effect on the next line written.
     * @param file_path Path of the log file (appended to, never truncated)
     */
    void set_log_file_path(const std::string& file_path);
    std::string get_log_file_path() const;

    void set_file_logging_enabled(bool enabled);
    bool is_file_logging_enabled() const;

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

    /**
     * Parse "DEBUG", "INFO", "WARN"/"WARNING" or "ERROR" (any case).
     * @return true if the string named a level
     */
    static bool parse_log_level(const std::string& level_str, LogLevel& out);

private:
    Logger();
    ~Logger();

    std::string get_level_string(LogLevel level) const;
    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;
    static uint32_t hash_string(const std::string& str);

    bool open_log_file_unlocked();

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    bool console_enabled_;
    bool file_enabled_;
    std::string log_file_path_;
    std::ofstream log_file_;
};

} // namespace lanmeet

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        lanmeet::Logger::getInstance().log(lanmeet::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        lanmeet::Logger::getInstance().log(lanmeet::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        lanmeet::Logger::getInstance().log(lanmeet::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        lanmeet::Logger::getInstance().log(lanmeet::LogLevel::ERROR, module, oss.str()); \
    } while(0)
