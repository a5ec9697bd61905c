#pragma once

#include <string>

namespace utils::io
{
	bool read_file(const std::string& file, std::string* data);
	bool write_file(const std::string& file, const std::string& data, bool append = false);
	bool file_exists(const std::string& file);
}
