#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
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

namespace peerdrop {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "INFO", "warning", ...)
 * @param level_str Level name, case-insensitive
 * @param fallback Level returned when the name is not recognised
 */
LogLevel parse_log_level(const std::string& level_str, LogLevel fallback = LogLevel::INFO);
std::string log_level_to_string(LogLevel level);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    // Console output can be silenced independently of the file sink
    void set_console_logging_enabled(bool enabled);
    bool is_console_logging_enabled() const;

    /**
     * Mirror every log line into a file (appended, no colors)
     * @param file_path Path of the log file, empty string closes the sink
     * @return true if the file could be opened
     */
    bool set_log_file_path(const std::string& file_path);
    std::string get_log_file_path() const;

    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string format_timestamp() const;
    const char* get_level_string(LogLevel level) const;
    const char* get_color_code(LogLevel level) const;
    const char* get_module_color(const std::string& module) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool console_enabled_;
    bool is_terminal_;
    std::string log_file_path_;
    std::ofstream log_file_;
};

} // namespace peerdrop

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerdrop::Logger::getInstance().log(peerdrop::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerdrop::Logger::getInstance().log(peerdrop::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerdrop::Logger::getInstance().log(peerdrop::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerdrop::Logger::getInstance().log(peerdrop::LogLevel::ERROR, module, oss.str()); \
    } while(0)
