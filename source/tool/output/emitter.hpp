#pragma once

#include "manip/command.hpp"

#include <string>

namespace string_manip::output
{
    enum class format
    {
        plain,
        cmake,
        json,
    };

    bool parse_format(const std::string& name, format& fmt);
    const char* get_format_name(format fmt);

    // plain: the value as is
    // cmake: set(<name> "<value>"), ready to include() from a CMake script
    // json:  {"<name>": <value>}, list results become arrays
    std::string emit(const assignment& result, format fmt, unsigned int json_indent = 0);

    std::string escape_cmake_argument(const std::string& value);
}
