#include <std_include.hpp>
#include "command.hpp"
#include "debugging/toollog.hpp"
#include "utilities/string.hpp"

namespace string_manip
{
    void variable_scope::set(const std::string& name, std::string value)
    {
        this->variables_[name] = std::move(value);
    }

    std::string variable_scope::get(const std::string& name) const
    {
        const auto it = this->variables_.find(name);
        if (it == this->variables_.end()) return {};
        return it->second;
    }

    bool variable_scope::is_defined(const std::string& name) const
    {
        return this->variables_.find(name) != this->variables_.end();
    }

    void variable_scope::unset(const std::string& name)
    {
        this->variables_.erase(name);
    }

    token_list decode_list(const std::string& value)
    {
        return utils::string::split(value, STRING_MANIP_LIST_SEPARATOR);
    }

    std::string encode_list(const token_list& items)
    {
        return utils::string::join(items, std::string(1, STRING_MANIP_LIST_SEPARATOR));
    }

    namespace
    {
        assignment execute_split(const invocation& call)
        {
            const auto tokens = split(call.input);

            logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_SPLIT,
                "\"%s\" -> %zu token(s)", call.input.c_str(), tokens.size());

            return { call.output_variable, encode_list(tokens), true };
        }

        assignment execute_transform(const invocation& call, const variable_scope& scope)
        {
            const auto items = decode_list(scope.get(call.input));

            // A single element is treated as a string to split, anything else as a word list
            if (items.size() == 1)
            {
                logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_TRANSFORM,
                    "START_CASE on string variable %s", call.input.c_str());
                return { call.output_variable, start_case(items.front()), false };
            }

            logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_TRANSFORM,
                "START_CASE on list variable %s (%zu element(s))", call.input.c_str(), items.size());
            return { call.output_variable, encode_list(start_case(items)), true };
        }

        assignment execute_strip_interfaces(const invocation& call, const variable_scope& scope)
        {
            const auto value = scope.get(call.input);
            auto stripped = strip_interfaces(value);

            logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_STRIP,
                "%s: %zu -> %zu character(s)", call.input.c_str(), value.size(), stripped.size());

            return { call.output_variable, std::move(stripped), false };
        }
    }

    assignment execute(const invocation& call, variable_scope& scope)
    {
        assignment result;
        switch (call.op)
        {
        case operation::split:
            result = execute_split(call);
            break;
        case operation::transform:
            result = execute_transform(call, scope);
            break;
        case operation::strip_interfaces:
            result = execute_strip_interfaces(call, scope);
            break;
        }

        scope.set(result.name, result.value);
        return result;
    }

    assignment run(const std::vector<std::string>& args, variable_scope& scope)
    {
        return execute(parse_arguments(args), scope);
    }
}
