#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// ANSI color codes for terminal output
namespace sztune::color {
inline constexpr const char* RESET = "\033[0m";
inline constexpr const char* GREEN = "\033[0;32m";
inline constexpr const char* BOLD_GREEN = "\033[1;32m";
}  // namespace sztune::color

// Usage: LOGI(COLORED(GREEN, "Best dict size:"), " 4m")
#define COLORED(color_arg, text) \
    sztune::color::color_arg, text, sztune::color::RESET

#ifndef SZTUNE_PROJECT_ROOT
#define SZTUNE_PROJECT_ROOT ""
#define SZTUNE_PROJECT_ROOT_LENGTH 0
#endif

#define SZTUNE_RELATIVE_FILEPATH                                             \
    (strncmp(__FILE__, SZTUNE_PROJECT_ROOT, SZTUNE_PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[SZTUNE_PROJECT_ROOT_LENGTH])                           \
         : __FILE__)

enum class LogLevel {
    NONE = -1,  // Special level to disable all logging
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect output (nullptr restores std::cout / std::cerr)
    static void
    set_output_stream(std::ostream* output_stream);

    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;

        // Format before taking the lock
        std::ostringstream oss;
        oss << format_timestamp();

        switch (level)
        {
            case LogLevel::ERROR:
                oss << "[ERROR] ";
                break;
            case LogLevel::WARNING:
                oss << "[WARN]  ";
                break;
            case LogLevel::INFO:
                oss << "[INFO]  ";
                break;
            case LogLevel::DEBUG:
                oss << "[DEBUG] ";
                break;
            case LogLevel::NONE:
                return;
        }

        (oss << ... << args);

        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream& out = (level <= LogLevel::WARNING)
            ? (error_stream_ ? *error_stream_ : std::cerr)
            : (output_stream_ ? *output_stream_ : std::cout);
        out << oss.str() << std::endl;
    }
};

#define LOGE(...)                 \
    Logger::log(                  \
        LogLevel::ERROR,          \
        __VA_ARGS__,              \
        " (",                     \
        SZTUNE_RELATIVE_FILEPATH, \
        ":",                      \
        __LINE__,                 \
        ")")
#define LOGW(...)                                     \
    do                                                \
    {                                                 \
        if (Logger::get_level() >= LogLevel::WARNING) \
            Logger::log(                              \
                LogLevel::WARNING,                    \
                __VA_ARGS__,                          \
                " (",                                 \
                SZTUNE_RELATIVE_FILEPATH,             \
                ":",                                  \
                __LINE__,                             \
                ")");                                 \
    } while (0)
#define LOGI(...)                                  \
    do                                             \
    {                                              \
        if (Logger::get_level() >= LogLevel::INFO) \
            Logger::log(                           \
                LogLevel::INFO,                    \
                __VA_ARGS__,                       \
                " (",                              \
                SZTUNE_RELATIVE_FILEPATH,          \
                ":",                               \
                __LINE__,                          \
                ")");                              \
    } while (0)
#define LOGD(...)                                   \
    do                                              \
    {                                               \
        if (Logger::get_level() >= LogLevel::DEBUG) \
            Logger::log(                            \
                LogLevel::DEBUG,                    \
                __VA_ARGS__,                        \
                " (",                               \
                SZTUNE_RELATIVE_FILEPATH,           \
                ":",                                \
                __LINE__,                           \
                ")");                               \
    } while (0)
