/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

analyzer_config.hpp declarations.*/

#pragma once

#include "../report/report_options.hpp"
#include "../shared/logger.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace q3log {

struct AnalyzerConfig {
	std::optional<LogLevel> logLevel;
	std::optional<std::string> jsonReportPath;
	ReportOptions report;
};

/*
=============
ParseAnalyzerConfig

Reads a JSON configuration document from `stream` into `config`. Keys that
are absent keep their current value. Returns false with `error` set when the
document is not valid JSON or a key holds a value of the wrong type.
=============
*/
bool ParseAnalyzerConfig(std::istream& stream, AnalyzerConfig& config, std::string& error);

/*
=============
LoadAnalyzerConfig

Opens `path` and parses it with ParseAnalyzerConfig.
=============
*/
bool LoadAnalyzerConfig(const std::filesystem::path& path, AnalyzerConfig& config, std::string& error);

} // namespace q3log
