#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace string_manip
{
    class argument_error : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    enum class operation
    {
        split,
        transform,
        strip_interfaces,
    };

    const char* get_operation_keyword(operation op);

    // One validated call. For SPLIT, input is the literal string to split; for TRANSFORM and
    // STRIP_INTERFACES it names the variable to read. output_variable is always resolved.
    struct invocation
    {
        operation op = operation::split;
        std::string input;
        std::string output_variable;
        bool start_case = false;
    };

    /*
     * Accepted forms:
     *   SPLIT <string> <output_list_var>
     *   TRANSFORM <string_var> START_CASE [OUTPUT_VARIABLE <output_var>]
     *   STRIP_INTERFACES <string_var> [OUTPUT_VARIABLE <output_var>]
     *
     * Keywords may appear in any order. Throws argument_error on unrecognized arguments,
     * a missing operation, more than one operation, or a missing or malformed value.
     */
    invocation parse_arguments(const std::vector<std::string>& args);
}
