/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

command_line.hpp declarations.*/

#pragma once

#include "analyzer_config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace q3log {

struct CommandLineOptions {
	std::optional<std::string> configPath;
	std::optional<std::string> jsonReportPath;
	std::optional<LogLevel> logLevel;
	bool quiet = false;
	bool help = false;
	bool version = false;
	std::string logFile;
};

/*
=============
ParseCommandLine

Parses the arguments following the program name. `--help` and `--version`
end parsing early; otherwise exactly one log file path is required.
Returns false with `error` describing the first problem found.
=============
*/
bool ParseCommandLine(const std::vector<std::string_view>& args, CommandLineOptions& options, std::string& error);

/*
=============
ApplyCommandLine

Command line values take precedence over the configuration file.
=============
*/
void ApplyCommandLine(const CommandLineOptions& options, AnalyzerConfig& config);

/*
=============
UsageText
=============
*/
std::string UsageText(std::string_view program);

} // namespace q3log
