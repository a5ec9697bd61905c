#include "io.hpp"
#include <fstream>
#include <filesystem>

namespace utils::io
{
	bool read_file(const std::string& file, std::string* data)
	{
		if (!data) return false;

		std::ifstream stream(file, std::ios::binary);
		if (!stream.is_open()) return false;

		stream.seekg(0, std::ios::end);
		const auto size = stream.tellg();
		stream.seekg(0, std::ios::beg);

		if (size == -1) return false;

		data->resize(static_cast<size_t>(size));
		stream.read(data->data(), size);

		return static_cast<bool>(stream);
	}

	bool write_file(const std::string& file, const std::string& data, const bool append)
	{
		std::ofstream stream(file,
			std::ios::binary |
			(append ? std::ios::app : std::ios::out));

		if (!stream.is_open()) return false;

		stream.write(data.data(), static_cast<std::streamsize>(data.size()));
		return static_cast<bool>(stream);
	}

	bool file_exists(const std::string& file)
	{
		std::error_code ec;
		return std::filesystem::is_regular_file(file, ec);
	}
}
