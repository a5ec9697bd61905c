#include "std_include.hpp"
#include "tool_startup.hpp"
#include "debugging/toollog.hpp"
#include "manip/command.hpp"
#include "output/emitter.hpp"
#include "utilities/configuration.hpp"
#include "utilities/flags.hpp"
#include "utilities/io.hpp"

namespace tool
{
    namespace
    {
        const char* LOGGING_SECTION = "Logging";
        const char* OUTPUT_SECTION = "Output";

        struct tool_settings
        {
            string_manip::output::format format = string_manip::output::format::plain;
            unsigned int json_indent = 0;
            std::string config_path;
        };

        void load_configuration(tool_settings& settings)
        {
            settings.config_path = utils::flags::get_flag_value("config", STRING_MANIP_CONFIG_FILE);

            if (utils::io::file_exists(settings.config_path))
            {
                if (!utils::configuration::Load(settings.config_path))
                {
                    logger::write(logger::LOG_LEVEL_WARN, logger::LOG_LABEL_CONFIG,
                        "Failed to parse %s, using defaults", settings.config_path.c_str());
                }
            }
            else if (settings.config_path != STRING_MANIP_CONFIG_FILE)
            {
                logger::write(logger::LOG_LEVEL_WARN, logger::LOG_LABEL_CONFIG,
                    "Configuration file %s not found, using defaults", settings.config_path.c_str());
            }
        }

        void apply_logging_settings()
        {
            std::string level_name = utils::configuration::ReadString(LOGGING_SECTION, "Level", "WARN");
            if (utils::flags::has_flag("verbose"))
            {
                level_name = "DEBUG";
            }

            logger::LogLevel level = logger::LOG_LEVEL_WARN;
            if (!logger::parse_log_level(level_name, level))
            {
                logger::write(logger::LOG_LEVEL_WARN, logger::LOG_LABEL_CONFIG,
                    "Unknown log level \"%s\", using WARN", level_name.c_str());
                level_name = "WARN";
            }
            logger::set_min_level(level);

            const std::string log_file = utils::configuration::ReadString(LOGGING_SECTION, "LogFile", "");
            logger::set_log_file(log_file);

            const bool console = utils::configuration::ReadBoolean(LOGGING_SECTION, "Console", true);
            logger::set_console_output(console);

            // Write back so a saved configuration lists every key
            utils::configuration::WriteString(LOGGING_SECTION, "Level", level_name);
            utils::configuration::WriteString(LOGGING_SECTION, "LogFile", log_file);
            utils::configuration::WriteBoolean(LOGGING_SECTION, "Console", console);
        }

        void apply_output_settings(tool_settings& settings)
        {
            std::string format_name = utils::configuration::ReadString(OUTPUT_SECTION, "Format", "plain");
            if (utils::flags::has_flag("json")) format_name = "json";
            else if (utils::flags::has_flag("cmake")) format_name = "cmake";
            else if (utils::flags::has_flag("plain")) format_name = "plain";

            if (!string_manip::output::parse_format(format_name, settings.format))
            {
                logger::write(logger::LOG_LEVEL_WARN, logger::LOG_LABEL_CONFIG,
                    "Unknown output format \"%s\", using plain", format_name.c_str());
                settings.format = string_manip::output::format::plain;
            }

            settings.json_indent = utils::configuration::ReadUnsignedInteger(OUTPUT_SECTION, "JsonIndent", 0);

            utils::configuration::WriteString(OUTPUT_SECTION, "Format", string_manip::output::get_format_name(settings.format));
            utils::configuration::WriteUnsignedInteger(OUTPUT_SECTION, "JsonIndent", settings.json_indent);
        }

        string_manip::variable_scope build_scope()
        {
            string_manip::variable_scope scope;
            for (const auto& definition : utils::flags::get_prefixed_flags("D"))
            {
                const auto separator = definition.find('=');
                if (separator == std::string::npos || separator == 0)
                {
                    throw string_manip::argument_error("Invalid definition \"-D" + definition + "\", expected -D<name>=<value>");
                }

                scope.set(definition.substr(0, separator), definition.substr(separator + 1));
                logger::write(logger::LOG_LEVEL_DEBUG, logger::LOG_LABEL_INITIALIZER,
                    "Defined %s", definition.substr(0, separator).c_str());
            }
            return scope;
        }
    }

    void print_usage()
    {
        std::cout
            << "string_manip " << STRING_MANIP_VERSION << "\n"
            << "Usage:\n"
            << "  string_manip [options] SPLIT <string> <output_list_var>\n"
            << "  string_manip [options] TRANSFORM <string_list_var> START_CASE [OUTPUT_VARIABLE <output_var>]\n"
            << "  string_manip [options] STRIP_INTERFACES <string_var> [OUTPUT_VARIABLE <output_var>]\n"
            << "Options:\n"
            << "  -D<name>=<value>    define a variable\n"
            << "  -plain|-cmake|-json output format (default from configuration, else plain)\n"
            << "  -output=<file>      write the result to <file> instead of stdout\n"
            << "  -config=<file>      configuration file (default " STRING_MANIP_CONFIG_FILE ")\n"
            << "  -save-config        write the effective configuration back\n"
            << "  -verbose            log at DEBUG level\n"
            << "  --                  treat every following argument as an operation argument\n";
    }

    int run(int argc, char* argv[])
    {
        utils::flags::set_flags(argc, argv);

        if (utils::flags::has_flag("help") || utils::flags::has_flag("h"))
        {
            print_usage();
            return 0;
        }

        tool_settings settings;
        load_configuration(settings);
        apply_logging_settings();
        apply_output_settings(settings);

        logger::write(logger::LOG_LEVEL_INFO, logger::LOG_LABEL_INITIALIZER,
            "string_manip %s, output format %s", STRING_MANIP_VERSION,
            string_manip::output::get_format_name(settings.format));

        if (utils::flags::has_flag("save-config"))
        {
            if (!utils::configuration::Save(settings.config_path))
            {
                logger::write(logger::LOG_LEVEL_ERROR, logger::LOG_LABEL_CONFIG,
                    "Failed to write configuration to %s", settings.config_path.c_str());
                return 2;
            }
            logger::write(logger::LOG_LEVEL_INFO, logger::LOG_LABEL_CONFIG,
                "Configuration saved to %s", settings.config_path.c_str());
        }

        auto scope = build_scope();
        const auto result = string_manip::run(utils::flags::get_arguments(), scope);
        const auto text = string_manip::output::emit(result, settings.format, settings.json_indent);

        const auto output_file = utils::flags::get_flag_value("output");
        if (output_file.empty())
        {
            std::cout << text << std::endl;
            return 0;
        }

        if (!utils::io::write_file(output_file, text + "\n"))
        {
            logger::write(logger::LOG_LEVEL_ERROR, logger::LOG_LABEL_OUTPUT,
                "Failed to write %s", output_file.c_str());
            return 2;
        }

        logger::write(logger::LOG_LEVEL_INFO, logger::LOG_LABEL_OUTPUT, "Wrote %s to %s",
            result.name.c_str(), output_file.c_str());
        return 0;
    }
}
