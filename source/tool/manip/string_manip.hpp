#pragma once

#include <string>
#include <vector>

namespace string_manip
{
    using token_list = std::vector<std::string>;

    // Splits wherever a non-alphanumeric character or an upper-case letter is found.
    // The input is first made C-identifier safe (anything outside [A-Za-z0-9_] becomes '_'),
    // then every run matching [^_][^A-Z_]* is a token. Empty input gives an empty list.
    token_list split(const std::string& input);

    // Lower-case the word, then upper-case its first character.
    std::string start_case_word(std::string word);

    // List form: every element is start-cased, order and length preserved.
    token_list start_case(const token_list& words);
    void start_case(const token_list& words, token_list& output);
    void start_case_in_place(token_list& words);

    // String form: split, start-case every token and concatenate them.
    std::string start_case(const std::string& input);
    void start_case(const std::string& input, std::string& output);

    // Removes $<BUILD_INTERFACE:...> and $<INSTALL_INTERFACE:...> together with the ';'
    // that precedes them. A ';' left at the front by removing a leading marker is dropped too.
    std::string strip_interfaces(const std::string& input);
    void strip_interfaces(const std::string& input, std::string& output);
}
