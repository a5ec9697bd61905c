#include "configuration.hpp"
#include "io.hpp"
#include "string.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <map>
#include <mutex>
#include <sstream>

namespace utils::configuration
{
	namespace
	{
		using section_map = std::map<std::string, std::map<std::string, std::string>>;

		std::mutex config_mutex;
		section_map sections;
		std::string config_path;

		std::string strip_comment(const std::string& value)
		{
			for (size_t i = 0; i < value.size(); ++i)
			{
				if ((value[i] == ';' || value[i] == '#') && (i == 0 || value[i - 1] == ' ' || value[i - 1] == '\t'))
				{
					return value.substr(0, i);
				}
			}
			return value;
		}

		bool parse(const std::string& text, section_map& out)
		{
			std::string current_section;
			std::istringstream stream(text);
			std::string line;

			while (std::getline(stream, line))
			{
				line = string::trim(line);
				if (line.empty() || line[0] == ';' || line[0] == '#') continue;

				if (line.front() == '[')
				{
					if (line.back() != ']') return false;
					current_section = string::trim(line.substr(1, line.size() - 2));
					out[current_section];
					continue;
				}

				const auto separator = line.find('=');
				if (separator == std::string::npos || separator == 0) return false;

				const auto key = string::trim(line.substr(0, separator));
				const auto value = string::trim(strip_comment(line.substr(separator + 1)));
				out[current_section][key] = value;
			}

			return true;
		}

		bool find_value(const std::string& section, const std::string& key, std::string& value)
		{
			std::lock_guard<std::mutex> lock(config_mutex);

			const auto section_it = sections.find(section);
			if (section_it == sections.end()) return false;

			const auto key_it = section_it->second.find(key);
			if (key_it == section_it->second.end()) return false;

			value = key_it->second;
			return true;
		}
	}

	bool Load(const std::string& path)
	{
		std::string data;
		if (!io::read_file(path, &data)) return false;

		section_map parsed;
		if (!parse(data, parsed)) return false;

		std::lock_guard<std::mutex> lock(config_mutex);
		sections = std::move(parsed);
		config_path = path;
		return true;
	}

	bool Save(const std::string& path)
	{
		std::ostringstream out;
		std::string target;
		{
			std::lock_guard<std::mutex> lock(config_mutex);
			target = path.empty() ? config_path : path;

			for (const auto& [section, values] : sections)
			{
				if (!section.empty()) out << "[" << section << "]\n";
				for (const auto& [key, value] : values)
				{
					out << key << "=" << value << "\n";
				}
				out << "\n";
			}
		}

		if (target.empty()) return false;
		return io::write_file(target, out.str());
	}

	void Reset()
	{
		std::lock_guard<std::mutex> lock(config_mutex);
		sections.clear();
		config_path.clear();
	}

	std::string GetPath()
	{
		std::lock_guard<std::mutex> lock(config_mutex);
		return config_path;
	}

	bool HasValue(const std::string& section, const std::string& key)
	{
		std::string value;
		return find_value(section, key, value);
	}

	std::string ReadString(const std::string& section, const std::string& key, const std::string& default_value)
	{
		std::string value;
		if (!find_value(section, key, value)) return default_value;
		return value;
	}

	bool ReadBoolean(const std::string& section, const std::string& key, const bool default_value)
	{
		std::string value;
		if (!find_value(section, key, value)) return default_value;

		value = string::to_lower(value);
		if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
		if (value == "false" || value == "0" || value == "no" || value == "off") return false;
		return default_value;
	}

	unsigned int ReadUnsignedInteger(const std::string& section, const std::string& key, const unsigned int default_value)
	{
		std::string value;
		if (!find_value(section, key, value) || value.empty() || value[0] == '-') return default_value;

		errno = 0;
		char* end = nullptr;
		const unsigned long result = std::strtoul(value.c_str(), &end, 10);
		if (errno != 0 || *end != '\0' || result > UINT_MAX) return default_value;

		return static_cast<unsigned int>(result);
	}

	void WriteString(const std::string& section, const std::string& key, const std::string& value)
	{
		std::lock_guard<std::mutex> lock(config_mutex);
		sections[section][key] = value;
	}

	void WriteBoolean(const std::string& section, const std::string& key, const bool value)
	{
		WriteString(section, key, value ? "true" : "false");
	}

	void WriteUnsignedInteger(const std::string& section, const std::string& key, const unsigned int value)
	{
		WriteString(section, key, std::to_string(value));
	}
}
