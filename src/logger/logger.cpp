#include "logger.hh"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <thread>

namespace {
const char*
level_name(LogLevel level)
{
    switch (level) {
        case LogLevel_Debug:
            return "DEBUG";
        case LogLevel_Info:
            return "INFO";
        case LogLevel_Warning:
            return "WARNING";
        default:
            return "ERROR";
    }
}

void
write_timestamp(std::ostream& ss)
{
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                    1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count() << std::setfill(' ');
}
} // namespace

std::atomic<LogLevel> Logger::current_level_{ LogLevel_Info };
std::mutex Logger::output_mutex_{};

void
Logger::set_log_level(LogLevel level)
{
    current_level_.store(level);
}

LogLevel
Logger::get_log_level()
{
    return current_level_.load();
}

void
Logger::write_prefix_(std::ostream& ss,
                      LogLevel level,
                      const char* file,
                      int line,
                      const char* func)
{
    write_timestamp(ss);
    ss << " [" << level_name(level) << "] [" << std::this_thread::get_id()
       << "] " << std::filesystem::path(file).filename().string() << ":"
       << line << " " << func << ": ";
}

void
Logger::print_(LogLevel level, const std::string& message)
{
    auto& stream = level >= LogLevel_Warning ? std::cerr : std::cout;

    std::scoped_lock lock(output_mutex_);
    stream << message << std::endl;
}
