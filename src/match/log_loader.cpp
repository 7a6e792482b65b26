/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_loader.cpp implementation.*/

#include "log_loader.hpp"

#include "../shared/logger.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

namespace q3log {

/*
=============
LoadLogLines
=============
*/
bool LoadLogLines(const std::filesystem::path& path, std::vector<std::string>& lines, std::string& error)
{
	std::error_code status;
	if (std::filesystem::is_directory(path, status)) {
		error = fmt::format("failed to open '{}': is a directory", path.string());
		return false;
	}

	std::ifstream file(path, std::ifstream::binary);
	if (!file.is_open()) {
		const std::error_code ec(errno, std::system_category());
		error = fmt::format("failed to open '{}': {}", path.string(), ec.message());
		return false;
	}

	lines.clear();
	std::string line;
	while (std::getline(file, line)) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		lines.push_back(std::move(line));
		line.clear();
	}

	if (file.bad()) {
		const std::error_code ec(errno, std::system_category());
		error = fmt::format("failed to read '{}': {}", path.string(), ec.message());
		lines.clear();
		return false;
	}

	Logf(LogLevel::Debug, "loaded {} lines from '{}'", lines.size(), path.string());
	return true;
}

} // namespace q3log
