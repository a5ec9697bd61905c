#include "string.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace utils::string
{
    std::string to_lower(const std::string& text)
    {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::string to_upper(const std::string& text)
    {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    std::vector<std::string> split(const std::string& s, const char delim)
    {
        std::vector<std::string> result;
        std::stringstream ss(s);
        std::string item;

        while (std::getline(ss, item, delim))
        {
            if (!item.empty())
            {
                result.push_back(item);
            }
        }

        return result;
    }

    std::string join(const std::vector<std::string>& items, const std::string& separator)
    {
        std::string result;
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0) result += separator;
            result += items[i];
        }
        return result;
    }

    bool starts_with(const std::string& text, const std::string& substring)
    {
        return text.rfind(substring, 0) == 0;
    }

    std::string trim(const std::string& text)
    {
        const auto start = text.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return {};

        const auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(start, end - start + 1);
    }

    std::string replace_all(std::string str, const std::string& from, const std::string& to)
    {
        if (from.empty()) return str;

        size_t pos = 0;
        while ((pos = str.find(from, pos)) != std::string::npos)
        {
            str.replace(pos, from.length(), to);
            pos += to.length();
        }

        return str;
    }

    std::string make_c_identifier(const std::string& text)
    {
        std::string result;
        result.reserve(text.size() + 1);

        if (!text.empty() && std::isdigit(static_cast<unsigned char>(text.front())))
        {
            result.push_back('_');
        }

        for (unsigned char ch : text)
        {
            result.push_back(std::isalnum(ch) || ch == '_' ? static_cast<char>(ch) : '_');
        }

        return result;
    }
}
