#pragma once

#include "arguments.hpp"
#include "string_manip.hpp"

#include <map>
#include <string>
#include <vector>

namespace string_manip
{
    // Caller-owned variables. An undefined variable reads as the empty string.
    class variable_scope
    {
    public:
        void set(const std::string& name, std::string value);
        std::string get(const std::string& name) const;
        bool is_defined(const std::string& name) const;
        void unset(const std::string& name);

    private:
        std::map<std::string, std::string> variables_;
    };

    struct assignment
    {
        std::string name;
        std::string value;
        bool is_list = false;
    };

    // CMake list encoding. Empty elements are skipped when decoding.
    token_list decode_list(const std::string& value);
    std::string encode_list(const token_list& items);

    assignment execute(const invocation& call, variable_scope& scope);
    assignment run(const std::vector<std::string>& args, variable_scope& scope);
}
