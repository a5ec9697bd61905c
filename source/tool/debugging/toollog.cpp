#include <std_include.hpp>
#include "toollog.hpp"
#include "utilities/string.hpp"

#include <glog/logging.h>

#include <cstdarg>
#include <ctime>
#include <iomanip>

namespace logger
{
    namespace
    {
        const char* LogLevelNames[] =
        {
            "DEBUG",
            "INFO",
            "WARN",
            "ERROR",
            "CRITICAL",
        };

        const char* LogLabelNames[] =
        {
            "INITIALIZER",
            "CONFIG",
            "ARGUMENTS",
            "SPLIT",
            "TRANSFORM",
            "STRIP",
            "OUTPUT",
        };

        std::mutex log_mutex;
        LogLevel min_level = LOG_LEVEL_WARN;
        std::string log_file;
        bool console_output = true;
    }

    void set_min_level(const LogLevel level)
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        min_level = level;
    }

    LogLevel get_min_level()
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        return min_level;
    }

    void set_log_file(const std::string& path)
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        log_file = path;
    }

    void set_console_output(const bool enabled)
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_output = enabled;
    }

    bool parse_log_level(const std::string& name, LogLevel& level)
    {
        const auto upper = utils::string::to_upper(utils::string::trim(name));
        for (size_t i = 0; i < std::size(LogLevelNames); ++i)
        {
            if (upper == LogLevelNames[i])
            {
                level = static_cast<LogLevel>(i);
                return true;
            }
        }

        if (upper == "WARNING")
        {
            level = LOG_LEVEL_WARN;
            return true;
        }

        return false;
    }

    const char* get_log_level_str(const LogLevel lvl)
    {
        if (static_cast<size_t>(lvl) >= std::size(LogLevelNames)) return "UNKNOWN";
        return LogLevelNames[lvl];
    }

    const char* get_log_label_str(const LogLabel lbl)
    {
        if (static_cast<size_t>(lbl) >= std::size(LogLabelNames)) return "UNKNOWN";
        return LogLabelNames[lbl];
    }

    void write(const LogLevel level, const LogLabel label, const char* fmt, ...)
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (level < min_level) return;

        char buffer[4096];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        const auto now = std::chrono::system_clock::now();
        const auto now_time = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << "[" << std::put_time(std::localtime(&now_time), "%Y-%m-%d %H:%M:%S") << "] ";
        ss << "[" << get_log_level_str(level) << "] ";
        ss << "[" << get_log_label_str(label) << "] ";
        ss << buffer;

        // stdout carries command results, diagnostics go to stderr
        if (console_output)
        {
            std::cerr << ss.str() << std::endl;
        }

        if (!log_file.empty())
        {
            std::ofstream logfile(log_file, std::ios::app);
            if (logfile.is_open())
            {
                logfile << ss.str() << std::endl;
            }
        }

        if (level >= LOG_LEVEL_ERROR)
        {
            LOG(ERROR) << "[" << get_log_label_str(label) << "] " << buffer;
        }
    }
}
