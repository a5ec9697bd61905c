#include <std_include.hpp>
#include "emitter.hpp"
#include "debugging/toollog.hpp"
#include "utilities/string.hpp"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace string_manip::output
{
    namespace
    {
        std::string emit_json(const assignment& result, const unsigned int json_indent)
        {
            rapidjson::Document doc;
            doc.SetObject();
            auto& allocator = doc.GetAllocator();

            rapidjson::Value value;
            if (result.is_list)
            {
                value.SetArray();
                for (const auto& item : decode_list(result.value))
                {
                    value.PushBack(rapidjson::Value(item.c_str(), static_cast<rapidjson::SizeType>(item.size()), allocator), allocator);
                }
            }
            else
            {
                value.SetString(result.value.c_str(), static_cast<rapidjson::SizeType>(result.value.size()), allocator);
            }

            doc.AddMember(rapidjson::Value(result.name.c_str(), static_cast<rapidjson::SizeType>(result.name.size()), allocator),
                value, allocator);

            rapidjson::StringBuffer buffer;
            if (json_indent > 0)
            {
                rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
                writer.SetIndent(' ', json_indent);
                doc.Accept(writer);
            }
            else
            {
                rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
                doc.Accept(writer);
            }

            return buffer.GetString();
        }
    }

    bool parse_format(const std::string& name, format& fmt)
    {
        const auto lower = utils::string::to_lower(utils::string::trim(name));
        if (lower == "plain")
        {
            fmt = format::plain;
            return true;
        }
        if (lower == "cmake")
        {
            fmt = format::cmake;
            return true;
        }
        if (lower == "json")
        {
            fmt = format::json;
            return true;
        }
        return false;
    }

    const char* get_format_name(const format fmt)
    {
        switch (fmt)
        {
        case format::plain:
            return "plain";
        case format::cmake:
            return "cmake";
        case format::json:
            return "json";
        }
        return "unknown";
    }

    std::string escape_cmake_argument(const std::string& value)
    {
        auto escaped = utils::string::replace_all(value, "\\", "\\\\");
        escaped = utils::string::replace_all(escaped, "\"", "\\\"");
        return utils::string::replace_all(escaped, "$", "\\$");
    }

    std::string emit(const assignment& result, const format fmt, const unsigned int json_indent)
    {
        logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_OUTPUT, "Emitting %s as %s",
            result.name.c_str(), get_format_name(fmt));

        switch (fmt)
        {
        case format::cmake:
            return "set(" + result.name + " \"" + escape_cmake_argument(result.value) + "\")";
        case format::json:
            return emit_json(result, json_indent);
        case format::plain:
            break;
        }
        return result.value;
    }
}
