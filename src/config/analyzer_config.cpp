/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

analyzer_config.cpp implementation.*/

#include "analyzer_config.hpp"

#include <fmt/format.h>
#include <json/json.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <istream>
#include <string_view>
#include <system_error>

namespace q3log {
namespace {

struct ReportToggle {
	std::string_view key;
	bool ReportOptions::* field;
};

constexpr std::array kReportToggles{
	ReportToggle{ "text", &ReportOptions::text },
	ReportToggle{ "players", &ReportOptions::players },
	ReportToggle{ "kills_by_means", &ReportOptions::killsByMeans },
	ReportToggle{ "killers", &ReportOptions::killers },
	ReportToggle{ "ranking", &ReportOptions::ranking },
};

/*
=============
ApplyReportBlock

Copies the boolean section toggles of the "report" object.
=============
*/
bool ApplyReportBlock(const Json::Value& block, ReportOptions& report, std::string& error)
{
	if (!block.isObject()) {
		error = "'report' must be an object";
		return false;
	}

	for (const std::string& name : block.getMemberNames()) {
		const auto toggle = std::find_if(kReportToggles.begin(), kReportToggles.end(),
			[&name](const ReportToggle& entry) { return entry.key == name; });

		if (toggle == kReportToggles.end()) {
			Logf(LogLevel::Warn, "ignoring unknown config key 'report.{}'", name);
			continue;
		}

		const Json::Value& value = block[name];
		if (!value.isBool()) {
			error = fmt::format("'report.{}' must be a boolean", name);
			return false;
		}

		report.*(toggle->field) = value.asBool();
	}

	return true;
}

} // namespace

/*
=============
ParseAnalyzerConfig
=============
*/
bool ParseAnalyzerConfig(std::istream& stream, AnalyzerConfig& config, std::string& error)
{
	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;

	if (!Json::parseFromStream(builder, stream, &root, &errs)) {
		error = fmt::format("JSON parsing failed: {}", errs);
		return false;
	}

	if (!root.isObject()) {
		error = "configuration root must be an object";
		return false;
	}

	for (const std::string& name : root.getMemberNames()) {
		const Json::Value& value = root[name];

		if (name == "log_level") {
			if (!value.isString() || !IsKnownLogLevel(value.asString())) {
				error = "'log_level' must be one of trace, debug, info, warn, error";
				return false;
			}
			config.logLevel = ParseLogLevel(value.asString());
		}
		else if (name == "json_report") {
			if (!value.isString() || value.asString().empty()) {
				error = "'json_report' must be a non-empty string";
				return false;
			}
			config.jsonReportPath = value.asString();
		}
		else if (name == "report") {
			if (!ApplyReportBlock(value, config.report, error))
				return false;
		}
		else {
			Logf(LogLevel::Warn, "ignoring unknown config key '{}'", name);
		}
	}

	return true;
}

/*
=============
LoadAnalyzerConfig
=============
*/
bool LoadAnalyzerConfig(const std::filesystem::path& path, AnalyzerConfig& config, std::string& error)
{
	std::ifstream file(path, std::ifstream::binary);
	if (!file.is_open()) {
		const std::error_code ec(errno, std::system_category());
		error = fmt::format("failed to open config '{}': {}", path.string(), ec.message());
		return false;
	}

	std::string parseError;
	if (!ParseAnalyzerConfig(file, config, parseError)) {
		error = fmt::format("invalid config '{}': {}", path.string(), parseError);
		return false;
	}

	Logf(LogLevel::Debug, "loaded config '{}'", path.string());
	return true;
}

} // namespace q3log
