/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.hpp declarations.*/

#pragma once

#include <fmt/core.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace q3log {
	enum class LogLevel {
	Trace = 0,
	Debug,
	Info,
	Warn,
	Error
	};

	using LogSink = std::function<void(std::string_view)>;

	/*
	=============
	ParseLogLevel

	Parse the provided configuration or environment value into a LogLevel.
	=============
	*/
	LogLevel ParseLogLevel(std::string_view value);

	/*
	=============
	IsKnownLogLevel

	Return whether the value names one of the supported levels.
	=============
	*/
	bool IsKnownLogLevel(std::string_view value);

	/*
	=============
	ReadLogLevelFromEnv

	Retrieve the log level from Q3LOG_LOG_LEVEL or return the default.
	=============
	*/
	LogLevel ReadLogLevelFromEnv();

	/*
	=============
	LevelWeight

	Assign a numeric weight to a log level for comparison.
	=============
	*/
	int LevelWeight(LogLevel level);

	/*
	=============
	FormatMessage

	Build a structured log message for output.
	=============
	*/
	std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message);

	/*
	=============
	InitLogger

	Initialize the logger with module metadata and output sinks.
	=============
	*/
	void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink);

	/*
	=============
	SetLogLevel

	Override the current logging level programmatically.
	=============
	*/
	void SetLogLevel(LogLevel level);

	/*
	=============
	GetLogLevel

	Fetch the currently active log level.
	=============
	*/
	LogLevel GetLogLevel();

	/*
	=============
	IsLogLevelEnabled

	Return whether the provided log level should emit output.
	=============
	*/
	bool IsLogLevelEnabled(LogLevel level);

	/*
	=============
	Log

	Log a pre-formatted message if the level is enabled. Error messages are
	routed to the error sink when one is installed.
	=============
	*/
	void Log(LogLevel level, std::string_view message);

	/*
	=============
	Logf

	Format a message and log it if the level is enabled.
	=============
	*/
	template<typename... Args>
	inline void Logf(LogLevel level, fmt::format_string<Args...> format_str, Args &&... args)
	{
		if (!IsLogLevelEnabled(level))
			return;

		Log(level, fmt::format(format_str, std::forward<Args>(args)...));
	}

	/*
	=============
	LogLevelLabel

	Provide a short string label for the supplied log level.
	=============
	*/
	const char* LogLevelLabel(LogLevel level);

} // namespace q3log
