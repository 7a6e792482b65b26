/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_loader.hpp declarations.*/

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace q3log {

/*
=============
LoadLogLines

Reads the whole file into `lines`, one entry per line with any trailing
carriage return removed. Returns false with `error` describing the failure
when the file cannot be opened or read.
=============
*/
bool LoadLogLines(const std::filesystem::path& path, std::vector<std::string>& lines, std::string& error);

} // namespace q3log
