#include <std_include.hpp>
#include "string_manip.hpp"
#include "utilities/string.hpp"

#include <regex>

namespace string_manip
{
    token_list split(const std::string& input)
    {
        static const std::regex word_pattern(R"([^_][^A-Z_]*)");

        const auto identifier = utils::string::make_c_identifier(input);

        token_list tokens;
        for (std::sregex_iterator it(identifier.begin(), identifier.end(), word_pattern), end; it != end; ++it)
        {
            tokens.push_back(it->str());
        }

        return tokens;
    }

    std::string start_case_word(std::string word)
    {
        if (word.empty()) return word;

        word = utils::string::to_lower(word);
        word.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(word.front())));
        return word;
    }

    token_list start_case(const token_list& words)
    {
        token_list result;
        start_case(words, result);
        return result;
    }

    void start_case(const token_list& words, token_list& output)
    {
        token_list result;
        result.reserve(words.size());
        for (const auto& word : words)
        {
            result.push_back(start_case_word(word));
        }

        // output may alias words
        output = std::move(result);
    }

    void start_case_in_place(token_list& words)
    {
        for (auto& word : words)
        {
            word = start_case_word(std::move(word));
        }
    }

    std::string start_case(const std::string& input)
    {
        auto words = split(input);
        if (words.size() == 1)
        {
            return start_case_word(std::move(words.front()));
        }

        start_case_in_place(words);
        return utils::string::join(words, "");
    }

    void start_case(const std::string& input, std::string& output)
    {
        output = start_case(input);
    }

    std::string strip_interfaces(const std::string& input)
    {
        static const std::regex interface_pattern(
            R"(;?\$<BUILD_INTERFACE:[^>]+>|;?\$<INSTALL_INTERFACE:[^>]+>)");

        auto result = std::regex_replace(input, interface_pattern, "");

        if (!result.empty() && result.front() == STRING_MANIP_LIST_SEPARATOR
            && (input.empty() || input.front() != STRING_MANIP_LIST_SEPARATOR))
        {
            result.erase(0, 1);
        }

        return result;
    }

    void strip_interfaces(const std::string& input, std::string& output)
    {
        output = strip_interfaces(input);
    }
}
