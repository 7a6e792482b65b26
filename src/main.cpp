/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

main.cpp implementation.*/

// main.cpp (q3log Command Line Entry Point)
// Loads the configuration, parses the games log given on the command line and
// prints the text summary and/or writes the JSON summary.
//
// Exit status: 0 on success, 1 when the log, the configuration or the JSON
// report cannot be read or written, 2 on usage errors.

#include "config/analyzer_config.hpp"
#include "config/command_line.hpp"
#include "match/game_segmenter.hpp"
#include "report/json_report.hpp"
#include "report/text_report.hpp"
#include "shared/logger.hpp"
#include "shared/version.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/*
=============
StderrSink

Diagnostics go to stderr so stdout only carries the report.
=============
*/
void StderrSink(std::string_view message)
{
	std::fwrite(message.data(), 1, message.size(), stderr);
}

} // namespace

/*
=============
main
=============
*/
int main(int argc, char** argv)
{
	using namespace q3log;

	InitLogger(version::kToolTitle, &StderrSink, &StderrSink);

	const std::string_view program = argc > 0 ? std::string_view(argv[0]) : version::kToolTitle;
	std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

	CommandLineOptions options;
	std::string error;
	if (!ParseCommandLine(args, options, error)) {
		std::cerr << program << ": " << error << "\n\n" << UsageText(program);
		return kExitUsage;
	}

	if (options.help) {
		std::cout << UsageText(program);
		return 0;
	}

	if (options.version) {
		std::cout << version::kToolTitle << " " << version::kToolVersion << "\n";
		return 0;
	}

	AnalyzerConfig config;
	if (options.configPath && !LoadAnalyzerConfig(*options.configPath, config, error)) {
		Log(LogLevel::Error, error);
		return kExitFailure;
	}

	ApplyCommandLine(options, config);
	if (config.logLevel) {
		SetLogLevel(*config.logLevel);
		Logf(LogLevel::Debug, "log level set to {}", LogLevelLabel(*config.logLevel));
	}

	GameSegmenter segmenter;
	if (!segmenter.ParseFile(options.logFile, error)) {
		Log(LogLevel::Error, error);
		return kExitFailure;
	}

	if (config.report.text)
		WriteTextReport(std::cout, segmenter, config.report);

	if (config.jsonReportPath && !WriteReportJson(segmenter, *config.jsonReportPath))
		return kExitFailure;

	return 0;
}
