#include "logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace lanmeet {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true),
      is_terminal_(false), console_enabled_(true), file_enabled_(false) {
    // Check if we're outputting to a terminal
    is_terminal_ = isatty(fileno(stdout));

    // On Windows, enable ANSI color codes
#ifdef _WIN32
    if (is_terminal_) {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        GetConsoleMode(hOut, &dwMode);
        dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        SetConsoleMode(hOut, dwMode);
    }
#endif
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

void Logger::set_console_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

bool Logger::is_console_logging_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_enabled_;
}

void Logger::set_log_file_path(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_path == log_file_path_) {
        return;
    }
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_path_ = file_path;
}

std::string Logger::get_log_file_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_path_;
}

void Logger::set_file_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_enabled_ = enabled;
    if (!enabled && log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

bool Logger::is_file_logging_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_enabled_;
}

bool Logger::open_log_file_unlocked() {
    if (log_file_.is_open()) {
        return true;
    }
    if (log_file_path_.empty()) {
        return false;
    }
    log_file_.open(log_file_path_, std::ios::out | std::ios::app);
    return log_file_.is_open();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::ostringstream prefix;

    // Add timestamp if enabled
    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif
        prefix << "[" << std::put_time(&tm_buf, "%H:%M:%S");
        prefix << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (console_enabled_) {
        std::ostringstream oss;
        oss << prefix.str();

        if (colors_enabled_ && is_terminal_) {
            oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
        } else {
            oss << "[" << get_level_string(level) << "]";
        }

        if (!module.empty()) {
            if (colors_enabled_ && is_terminal_) {
                oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
            } else {
                oss << " [" << module << "]";
            }
        }

        oss << " " << message << std::endl;

        if (level >= LogLevel::ERROR) {
            std::cerr << oss.str();
            std::cerr.flush();
        } else {
            std::cout << oss.str();
            std::cout.flush();
        }
    }

    if (file_enabled_ && open_log_file_unlocked()) {
        log_file_ << prefix.str() << "[" << get_level_string(level) << "]";
        if (!module.empty()) {
            log_file_ << " [" << module << "]";
        }
        log_file_ << " " << message << "\n";
        log_file_.flush();
    }
}

bool Logger::parse_log_level(const std::string& level_str, LogLevel& out) {
    std::string upper_level = level_str;
    std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_level == "DEBUG") {
        out = LogLevel::DEBUG;
    } else if (upper_level == "INFO") {
        out = LogLevel::INFO;
    } else if (upper_level == "WARN" || upper_level == "WARNING") {
        out = LogLevel::WARN;
    } else if (upper_level == "ERROR") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Logger::get_level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::get_module_color(const std::string& module) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
        "\033[38;5;51m"   // Turquoise
    };

    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

std::string Logger::get_reset_code() const {
    if (!colors_enabled_ || !is_terminal_) return "";
    return "\033[0m";
}

// djb2
uint32_t Logger::hash_string(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return hash;
}

} // namespace lanmeet
