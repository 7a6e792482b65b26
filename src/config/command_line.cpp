/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

command_line.cpp implementation.*/

#include "command_line.hpp"

#include <fmt/format.h>

namespace q3log {
namespace {

/*
=============
TakeValue

Fetches the value following option `name`, advancing `index`.
=============
*/
std::optional<std::string_view> TakeValue(const std::vector<std::string_view>& args, size_t& index, std::string_view name, std::string& error)
{
	if (index + 1 >= args.size() || args[index + 1].empty()) {
		error = fmt::format("option '{}' requires a value", name);
		return std::nullopt;
	}

	return args[++index];
}

} // namespace

/*
=============
ParseCommandLine
=============
*/
bool ParseCommandLine(const std::vector<std::string_view>& args, CommandLineOptions& options, std::string& error)
{
	bool positionalOnly = false;

	for (size_t i = 0; i < args.size(); ++i) {
		const std::string_view arg = args[i];

		if (!positionalOnly && arg.size() > 1 && arg.front() == '-') {
			if (arg == "--") {
				positionalOnly = true;
			}
			else if (arg == "-h" || arg == "--help") {
				options.help = true;
				return true;
			}
			else if (arg == "-V" || arg == "--version") {
				options.version = true;
				return true;
			}
			else if (arg == "-q" || arg == "--quiet") {
				options.quiet = true;
			}
			else if (arg == "-c" || arg == "--config") {
				const auto value = TakeValue(args, i, arg, error);
				if (!value)
					return false;
				options.configPath = std::string(*value);
			}
			else if (arg == "-j" || arg == "--json") {
				const auto value = TakeValue(args, i, arg, error);
				if (!value)
					return false;
				options.jsonReportPath = std::string(*value);
			}
			else if (arg == "-l" || arg == "--log-level") {
				const auto value = TakeValue(args, i, arg, error);
				if (!value)
					return false;
				if (!IsKnownLogLevel(*value)) {
					error = fmt::format("unknown log level '{}'", *value);
					return false;
				}
				options.logLevel = ParseLogLevel(*value);
			}
			else {
				error = fmt::format("unknown option '{}'", arg);
				return false;
			}
			continue;
		}

		if (!options.logFile.empty()) {
			error = fmt::format("unexpected extra argument '{}'", arg);
			return false;
		}
		options.logFile = std::string(arg);
	}

	if (options.logFile.empty()) {
		error = "missing log file path";
		return false;
	}

	return true;
}

/*
=============
ApplyCommandLine
=============
*/
void ApplyCommandLine(const CommandLineOptions& options, AnalyzerConfig& config)
{
	if (options.logLevel)
		config.logLevel = options.logLevel;
	if (options.jsonReportPath)
		config.jsonReportPath = options.jsonReportPath;
	if (options.quiet)
		config.report.text = false;
}

/*
=============
UsageText
=============
*/
std::string UsageText(std::string_view program)
{
	return fmt::format(
		"usage: {} [options] <log-file>\n"
		"\n"
		"Splits a Quake III Arena games log into games and reports kill statistics.\n"
		"\n"
		"options:\n"
		"  -c, --config <file>      read settings from a JSON configuration file\n"
		"  -j, --json <file>        also write the summary as JSON to <file>\n"
		"  -l, --log-level <level>  trace, debug, info, warn or error\n"
		"  -q, --quiet              do not print the text summary\n"
		"  -V, --version            print the version and exit\n"
		"  -h, --help               print this help and exit\n",
		program);
}

} // namespace q3log
