#pragma once

#include <string>
#include <vector>

namespace utils::flags
{
        // Entries are stored without the leading '-'. Everything after "--" is an argument.
        void parse_flags(std::vector<std::string>& flags, int argc, char* argv[]);
        void parse_arguments(std::vector<std::string>& arguments, int argc, char* argv[]);

        bool has_flag(const std::string& flag);
        std::string get_flag_value(const std::string& flag, const std::string& default_value = {});
        std::vector<std::string> get_prefixed_flags(const std::string& prefix);
        const std::vector<std::string>& get_arguments();

        void set_flags(int argc, char* argv[]);
}
