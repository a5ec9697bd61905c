#pragma once

#include <string>
#include <vector>

namespace utils::string
{
    // String manipulation functions
    std::string to_lower(const std::string& text);
    std::string to_upper(const std::string& text);
    std::vector<std::string> split(const std::string& text, char delimiter);
    std::string join(const std::vector<std::string>& items, const std::string& separator);
    bool starts_with(const std::string& text, const std::string& substring);
    std::string trim(const std::string& text);
    std::string replace_all(std::string text, const std::string& from, const std::string& to);

    // Same rule as CMake's string(MAKE_C_IDENTIFIER)
    std::string make_c_identifier(const std::string& text);
}
