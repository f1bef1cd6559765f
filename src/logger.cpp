#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace peerdrop {

LogLevel parse_log_level(const std::string& level_str, LogLevel fallback) {
    std::string upper_level = level_str;
    std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_level == "DEBUG") return LogLevel::DEBUG;
    if (upper_level == "INFO") return LogLevel::INFO;
    if (upper_level == "WARN" || upper_level == "WARNING") return LogLevel::WARN;
    if (upper_level == "ERROR") return LogLevel::ERROR;
    return fallback;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default: return "info";
    }
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true),
      console_enabled_(true) {
    // Check if we're outputting to a terminal
    is_terminal_ = isatty(fileno(stdout));

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

bool Logger::set_log_file_path(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_path_ = file_path;

    if (file_path.empty()) {
        return true;
    }

    log_file_.open(file_path, std::ios::out | std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "[ERROR] [logger] Failed to open log file: " << file_path << std::endl;
        log_file_path_.clear();
        return false;
    }
    return true;
}

std::string Logger::get_log_file_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_path_;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string timestamp = timestamps_enabled_ ? format_timestamp() : std::string();
    bool colored = colors_enabled_ && is_terminal_;

    if (console_enabled_) {
        std::ostringstream oss;
        oss << timestamp;
        if (colored) {
            oss << get_color_code(level) << "[" << get_level_string(level) << "]" << "\033[0m";
        } else {
            oss << "[" << get_level_string(level) << "]";
        }

        if (!module.empty()) {
            if (colored) {
                oss << " " << get_module_color(module) << "[" << module << "]" << "\033[0m";
            } else {
                oss << " [" << module << "]";
            }
        }
        oss << " " << message << "\n";

        if (level >= LogLevel::ERROR) {
            std::cerr << oss.str();
            std::cerr.flush();
        } else {
            std::cout << oss.str();
            std::cout.flush();
        }
    }

    if (log_file_.is_open()) {
        log_file_ << timestamp << "[" << get_level_string(level) << "]";
        if (!module.empty()) {
            log_file_ << " [" << module << "]";
        }
        log_file_ << " " << message << "\n";
        log_file_.flush();
    }
}

std::string Logger::format_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    std::ostringstream oss;
    oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    return oss.str();
}

const char* Logger::get_level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* Logger::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

const char* Logger::get_module_color(const std::string& module) const {
    static const char* colors[] = {
        "\033[35m",       // Magenta
        "\033[94m",       // Bright Blue
        "\033[95m",       // Bright Magenta
        "\033[96m",       // Bright Cyan
        "\033[93m",       // Bright Yellow
        "\033[92m",       // Bright Green
        "\033[34m",       // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
        "\033[38;5;51m"   // Bright Turquoise
    };

    // djb2
    uint32_t hash = 5381;
    for (char c : module) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
}

} // namespace peerdrop
