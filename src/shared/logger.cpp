/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.cpp implementation.*/

#include "logger.hpp"

#include <fmt/format.h>

#include <atomic>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>
#include <string_view>

namespace q3log {
namespace {

std::string g_module_name;
std::atomic<LogLevel> g_log_level = LogLevel::Info;
std::mutex g_logger_mutex;
LogSink g_print_sink;
LogSink g_error_sink;

struct LoggerConfig {
	std::string module_name;
	LogSink print_sink;
	LogSink error_sink;
};

/*
=============
LowerCopy

Return an ASCII lower-cased copy of the value.
=============
*/
std::string LowerCopy(std::string_view value)
{
	std::string lowered(value);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lowered;
}

/*
=============
EnsureSink

Call the provided sink if it exists.
=============
*/
void EnsureSink(const LogSink& sink, const std::string& message)
{
	if (sink)
		sink(message);
}

/*
=============
GetLoggerConfig

Capture current logger configuration under mutex protection.
=============
*/
LoggerConfig GetLoggerConfig()
{
	std::scoped_lock lock(g_logger_mutex);

	return { g_module_name, g_print_sink, g_error_sink };
}

} // namespace

/*
=============
ParseLogLevel

Parse the provided configuration or environment value into a LogLevel.
=============
*/
LogLevel ParseLogLevel(std::string_view value)
{
	const std::string lowered = LowerCopy(value);

	if (lowered == "trace")
		return LogLevel::Trace;
	if (lowered == "debug")
		return LogLevel::Debug;
	if (lowered == "warn" || lowered == "warning")
		return LogLevel::Warn;
	if (lowered == "error")
		return LogLevel::Error;

	return LogLevel::Info;
}

/*
=============
IsKnownLogLevel

Return whether the value names one of the supported levels.
=============
*/
bool IsKnownLogLevel(std::string_view value)
{
	const std::string lowered = LowerCopy(value);

	return lowered == "trace" || lowered == "debug" || lowered == "info" ||
		lowered == "warn" || lowered == "warning" || lowered == "error";
}

/*
=============
ReadLogLevelFromEnv

Retrieve the log level from Q3LOG_LOG_LEVEL or return the default.
=============
*/
LogLevel ReadLogLevelFromEnv()
{
	const char* env_value = std::getenv("Q3LOG_LOG_LEVEL");
	if (!env_value)
		return LogLevel::Info;

	return ParseLogLevel(env_value);
}

/*
=============
LevelWeight

Assign a numeric weight to a log level for comparison.
=============
*/
int LevelWeight(LogLevel level)
{
	switch (level) {
	case LogLevel::Trace:
		return 0;
	case LogLevel::Debug:
		return 1;
	case LogLevel::Info:
		return 2;
	case LogLevel::Warn:
		return 3;
	case LogLevel::Error:
	default:
		return 4;
	}
}

/*
=============
FormatMessage

Build a structured log message for output.
=============
*/
std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message)
{
	static constexpr std::array prefixes{ "[TRACE]", "[DEBUG]", "[INFO]", "[WARN]", "[ERROR]" };
	const size_t prefix_index = static_cast<size_t>(LevelWeight(level));
	std::string_view level_label = prefixes[std::min(prefix_index, prefixes.size() - 1)];

	std::string formatted = fmt::format("[Q3LOG][{}] {} {}", module_name, level_label, message);
	if (!formatted.empty() && formatted.back() != '\n')
		formatted.push_back('\n');

	return formatted;
}

/*
=============
InitLogger

Initialize the logger with module metadata and output sinks.
=============
*/
void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink)
{
	std::scoped_lock lock(g_logger_mutex);

	g_module_name = module_name;
	g_print_sink = std::move(print_sink);
	g_error_sink = std::move(error_sink);
	g_log_level.store(ReadLogLevelFromEnv(), std::memory_order_relaxed);
}

/*
=============
SetLogLevel

Override the current logging level programmatically.
=============
*/
void SetLogLevel(LogLevel level)
{
	g_log_level.store(level, std::memory_order_relaxed);
}

/*
=============
GetLogLevel

Fetch the currently active log level.
=============
*/
LogLevel GetLogLevel()
{
	return g_log_level.load(std::memory_order_relaxed);
}

/*
=============
IsLogLevelEnabled

Return whether the provided log level should emit output.
=============
*/
bool IsLogLevelEnabled(LogLevel level)
{
	const LogLevel current_level = g_log_level.load(std::memory_order_relaxed);
	return LevelWeight(level) >= LevelWeight(current_level);
}

/*
=============
Log

Log a pre-formatted message if the level is enabled.
=============
*/
void Log(LogLevel level, std::string_view message)
{
	if (!IsLogLevelEnabled(level))
		return;

	const LoggerConfig config = GetLoggerConfig();
	const std::string formatted = FormatMessage(level, config.module_name, message);

	if (level == LogLevel::Error && config.error_sink) {
		config.error_sink(formatted);
		return;
	}

	EnsureSink(config.print_sink, formatted);
}

/*
=============
LogLevelLabel

Provide a short string label for the supplied log level.
=============
*/
const char* LogLevelLabel(LogLevel level)
{
	switch (level) {
	case LogLevel::Trace:
		return "TRACE";
	case LogLevel::Debug:
		return "DEBUG";
	case LogLevel::Info:
		return "INFO";
	case LogLevel::Warn:
		return "WARN";
	case LogLevel::Error:
	default:
		return "ERROR";
	}
}

} // namespace q3log
