#pragma once

#include <string>

namespace utils::configuration
{
	// INI store shared by the whole process. Keys are case-sensitive.
	bool Load(const std::string& path);
	bool Save(const std::string& path = {});
	void Reset();
	std::string GetPath();

	bool HasValue(const std::string& section, const std::string& key);

	std::string ReadString(const std::string& section, const std::string& key, const std::string& default_value);
	bool ReadBoolean(const std::string& section, const std::string& key, bool default_value);
	unsigned int ReadUnsignedInteger(const std::string& section, const std::string& key, unsigned int default_value);

	void WriteString(const std::string& section, const std::string& key, const std::string& value);
	void WriteBoolean(const std::string& section, const std::string& key, bool value);
	void WriteUnsignedInteger(const std::string& section, const std::string& key, unsigned int value);
}
