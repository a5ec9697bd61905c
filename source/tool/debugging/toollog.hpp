#pragma once

#include <string>

namespace logger
{
    enum LogLevel
    {
        LOG_LEVEL_DEBUG,
        LOG_LEVEL_INFO,
        LOG_LEVEL_WARN,
        LOG_LEVEL_ERROR,
        LOG_LEVEL_CRITICAL,
    };

    enum LogLabel
    {
        LOG_LABEL_INITIALIZER,
        LOG_LABEL_CONFIG,
        LOG_LABEL_ARGUMENTS,
        LOG_LABEL_SPLIT,
        LOG_LABEL_TRANSFORM,
        LOG_LABEL_STRIP,
        LOG_LABEL_OUTPUT,
    };

    // Messages below the minimum level are dropped. Default is LOG_LEVEL_WARN.
    void set_min_level(LogLevel level);
    LogLevel get_min_level();

    // Empty path disables the file sink.
    void set_log_file(const std::string& path);
    void set_console_output(bool enabled);

    bool parse_log_level(const std::string& name, LogLevel& level);
    const char* get_log_level_str(LogLevel lvl);
    const char* get_log_label_str(LogLabel lbl);

    void write(LogLevel level, LogLabel label, const char* fmt, ...);
}
