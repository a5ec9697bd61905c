#include "flags.hpp"
#include "string.hpp"

namespace utils::flags
{
        namespace
        {
                std::vector<std::string> enabled_flags;
                std::vector<std::string> plain_arguments;
                bool parsed = false;

                bool is_flag(const std::string& arg)
                {
                        return arg.size() > 1 && arg[0] == '-';
                }

                void ensure_parsed()
                {
                        if (!parsed)
                        {
                                // Default to empty flags if not explicitly initialized
                                enabled_flags.clear();
                                plain_arguments.clear();
                                parsed = true;
                        }
                }
        }

        void parse_flags(std::vector<std::string>& flags, int argc, char* argv[])
        {
                flags.clear();
                for (int i = 1; i < argc; ++i)
                {
                        std::string arg(argv[i]);
                        if (arg == "--") break;

                        if (is_flag(arg))
                        {
                                flags.emplace_back(arg.substr(1));
                        }
                }
        }

        void parse_arguments(std::vector<std::string>& arguments, int argc, char* argv[])
        {
                arguments.clear();
                bool only_arguments = false;
                for (int i = 1; i < argc; ++i)
                {
                        std::string arg(argv[i]);
                        if (!only_arguments && arg == "--")
                        {
                                only_arguments = true;
                                continue;
                        }

                        if (only_arguments || !is_flag(arg))
                        {
                                arguments.emplace_back(std::move(arg));
                        }
                }
        }

        bool has_flag(const std::string& flag)
        {
                ensure_parsed();

                for (const auto& entry : enabled_flags)
                {
                        if (string::to_lower(entry) == string::to_lower(flag))
                        {
                                return true;
                        }
                }

                return false;
        }

        std::string get_flag_value(const std::string& flag, const std::string& default_value)
        {
                ensure_parsed();

                const auto key = string::to_lower(flag) + "=";
                for (const auto& entry : enabled_flags)
                {
                        if (string::starts_with(string::to_lower(entry), key))
                        {
                                return entry.substr(key.size());
                        }
                }

                return default_value;
        }

        std::vector<std::string> get_prefixed_flags(const std::string& prefix)
        {
                ensure_parsed();

                std::vector<std::string> result;
                for (const auto& entry : enabled_flags)
                {
                        if (entry.size() > prefix.size() && string::starts_with(entry, prefix))
                        {
                                result.emplace_back(entry.substr(prefix.size()));
                        }
                }

                return result;
        }

        const std::vector<std::string>& get_arguments()
        {
                ensure_parsed();
                return plain_arguments;
        }

        void set_flags(int argc, char* argv[])
        {
                parse_flags(enabled_flags, argc, argv);
                parse_arguments(plain_arguments, argc, argv);
                parsed = true;
        }
}
