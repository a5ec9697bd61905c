#include <std_include.hpp>
#include "arguments.hpp"
#include "debugging/toollog.hpp"
#include "utilities/string.hpp"

#include <optional>

namespace string_manip
{
    namespace
    {
        enum class keyword
        {
            none,
            start_case,
            transform,
            strip_interfaces,
            output_variable,
            split,
        };

        // Result of the keyword scan, before any validation.
        struct parsed_keywords
        {
            bool start_case = false;
            bool split_seen = false;
            std::vector<std::string> split_values;
            bool transform_seen = false;
            std::optional<std::string> transform;
            bool strip_seen = false;
            std::optional<std::string> strip_interfaces;
            bool output_seen = false;
            std::optional<std::string> output_variable;
            std::vector<std::string> unparsed;
        };

        keyword to_keyword(const std::string& arg)
        {
            if (arg == "START_CASE") return keyword::start_case;
            if (arg == "TRANSFORM") return keyword::transform;
            if (arg == "STRIP_INTERFACES") return keyword::strip_interfaces;
            if (arg == "OUTPUT_VARIABLE") return keyword::output_variable;
            if (arg == "SPLIT") return keyword::split;
            return keyword::none;
        }

        std::optional<std::string>* one_value_slot(parsed_keywords& parsed, const keyword kw)
        {
            switch (kw)
            {
            case keyword::transform:
                return &parsed.transform;
            case keyword::strip_interfaces:
                return &parsed.strip_interfaces;
            case keyword::output_variable:
                return &parsed.output_variable;
            default:
                return nullptr;
            }
        }

        // Same rules as cmake_parse_arguments: a keyword collects the values that follow it,
        // a one-value keyword takes a single value, a repeated keyword replaces the earlier one.
        parsed_keywords scan(const std::vector<std::string>& args)
        {
            parsed_keywords parsed;
            auto current = keyword::none;

            for (const auto& arg : args)
            {
                const auto kw = to_keyword(arg);
                switch (kw)
                {
                case keyword::start_case:
                    parsed.start_case = true;
                    current = keyword::none;
                    continue;
                case keyword::split:
                    parsed.split_seen = true;
                    parsed.split_values.clear();
                    current = kw;
                    continue;
                case keyword::transform:
                    parsed.transform_seen = true;
                    break;
                case keyword::strip_interfaces:
                    parsed.strip_seen = true;
                    break;
                case keyword::output_variable:
                    parsed.output_seen = true;
                    break;
                case keyword::none:
                    if (current == keyword::split)
                    {
                        parsed.split_values.push_back(arg);
                    }
                    else if (auto* slot = one_value_slot(parsed, current))
                    {
                        *slot = arg;
                        current = keyword::none;
                    }
                    else
                    {
                        parsed.unparsed.push_back(arg);
                    }
                    continue;
                }

                one_value_slot(parsed, kw)->reset();
                current = kw;
            }

            return parsed;
        }

        [[noreturn]] void fail(const std::string& message)
        {
            logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_ARGUMENTS, "%s", message.c_str());
            throw argument_error(message);
        }

        [[noreturn]] void fail_unrecognized(const std::vector<std::string>& unparsed)
        {
            fail("Unrecognized arguments: \"" + utils::string::join(unparsed, ";") + "\"");
        }

        bool has_value(const std::optional<std::string>& value)
        {
            return value.has_value() && !value->empty();
        }
    }

    const char* get_operation_keyword(const operation op)
    {
        switch (op)
        {
        case operation::split:
            return "SPLIT";
        case operation::transform:
            return "TRANSFORM";
        case operation::strip_interfaces:
            return "STRIP_INTERFACES";
        }
        return "UNKNOWN";
    }

    invocation parse_arguments(const std::vector<std::string>& args)
    {
        const auto parsed = scan(args);

        if (!parsed.unparsed.empty())
        {
            fail_unrecognized(parsed.unparsed);
        }

        std::vector<std::string> operations;
        if (parsed.split_seen) operations.emplace_back("SPLIT");
        if (parsed.transform_seen) operations.emplace_back("TRANSFORM");
        if (parsed.strip_seen) operations.emplace_back("STRIP_INTERFACES");

        if (operations.empty())
        {
            fail("Operation argument is missing");
        }
        if (operations.size() > 1)
        {
            fail("Only one operation argument is allowed, got: \"" + utils::string::join(operations, ";") + "\"");
        }

        if (parsed.output_seen && !has_value(parsed.output_variable))
        {
            fail("OUTPUT_VARIABLE argument is missing");
        }

        invocation result;

        if (parsed.split_seen)
        {
            std::vector<std::string> extra;
            if (parsed.start_case) extra.emplace_back("START_CASE");
            if (parsed.output_seen)
            {
                extra.emplace_back("OUTPUT_VARIABLE");
                extra.push_back(*parsed.output_variable);
            }
            if (!extra.empty())
            {
                fail_unrecognized(extra);
            }

            if (parsed.split_values.size() != 2 || parsed.split_values[1].empty())
            {
                fail("SPLIT argument is missing or wrong");
            }

            result.op = operation::split;
            result.input = parsed.split_values[0];
            result.output_variable = parsed.split_values[1];
        }
        else if (parsed.transform_seen)
        {
            if (!has_value(parsed.transform))
            {
                fail("TRANSFORM argument is missing");
            }
            if (!parsed.start_case)
            {
                fail("START_CASE argument is missing");
            }

            result.op = operation::transform;
            result.input = *parsed.transform;
            result.start_case = true;
            result.output_variable = parsed.output_seen ? *parsed.output_variable : result.input;
        }
        else
        {
            if (parsed.start_case)
            {
                fail_unrecognized({ "START_CASE" });
            }
            if (!has_value(parsed.strip_interfaces))
            {
                fail("STRIP_INTERFACES argument is missing");
            }

            result.op = operation::strip_interfaces;
            result.input = *parsed.strip_interfaces;
            result.output_variable = parsed.output_seen ? *parsed.output_variable : result.input;
        }

        logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_ARGUMENTS, "%s %s -> %s",
            get_operation_keyword(result.op), result.input.c_str(), result.output_variable.c_str());

        return result;
    }
}
