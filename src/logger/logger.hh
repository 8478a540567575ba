#pragma once

#include "logger.types.h"

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

class Logger
{
  public:
    static void set_log_level(LogLevel level);
    static LogLevel get_log_level();

    /**
     * @brief Format a log line and print it if @p level is enabled.
     * @details Lines carry the id of the logging thread, since part uploads
     * log from worker threads.
     * @return The formatted line, even when it was not printed.
     */
    template<typename... Args>
    static std::string log(LogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        std::ostringstream ss;
        write_prefix_(ss, level, file, line, func);
        (ss << ... << std::forward<Args>(args));

        std::string message = ss.str();
        if (level >= current_level_.load()) {
            print_(level, message);
        }

        return message;
    }

  private:
    static std::atomic<LogLevel> current_level_;
    static std::mutex output_mutex_;

    static void write_prefix_(std::ostream& ss,
                              LogLevel level,
                              const char* file,
                              int line,
                              const char* func);
    static void print_(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(LogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(LogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(LogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(LogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
