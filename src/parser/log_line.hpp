/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_line.hpp declarations.*/

#pragma once

#include "log_events.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace q3log {

struct LogLine {
	std::string timestamp;
	std::string content;
};

/*
=============
TokenizeLogLine

Splits a raw log line into its `m:ss` / `mm:ss` clock prefix and the text
that follows it. Blank lines and lines without a clock prefix or without
any text after it yield nothing.
=============
*/
std::optional<LogLine> TokenizeLogLine(std::string_view line);

/*
=============
ParseLogLine

Tokenizes and decodes one raw line into a GameEvent.
=============
*/
std::optional<GameEvent> ParseLogLine(std::string_view line);

} // namespace q3log
