/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_line.cpp implementation.*/

#include "log_line.hpp"

#include "action_decoder.hpp"
#include "../shared/logger.hpp"
#include "../shared/string_utils.hpp"

#include <cctype>
#include <utility>

namespace q3log {

/*
=============
TokenizeLogLine
=============
*/
std::optional<LogLine> TokenizeLogLine(std::string_view line)
{
	const std::string_view trimmed = TrimView(line);
	if (trimmed.empty())
		return std::nullopt;

	const auto isDigit = [&trimmed](size_t i) {
		return i < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[i])) != 0;
	};

	// Clock is one or two minute digits, a colon and two second digits.
	size_t colon = 0;
	while (colon < 2 && isDigit(colon))
		++colon;
	if (colon == 0 || colon >= trimmed.size() || trimmed[colon] != ':')
		return std::nullopt;
	if (!isDigit(colon + 1) || !isDigit(colon + 2))
		return std::nullopt;

	const size_t clockEnd = colon + 3;
	if (clockEnd >= trimmed.size() || kWhitespace.find(trimmed[clockEnd]) == std::string_view::npos)
		return std::nullopt;

	const size_t contentStart = trimmed.find_first_not_of(kWhitespace, clockEnd);
	if (contentStart == std::string_view::npos)
		return std::nullopt;

	const std::string_view content = trimmed.substr(contentStart);
	if (content.find_first_of("\r\n") != std::string_view::npos)
		return std::nullopt;

	return LogLine{ std::string(trimmed.substr(0, clockEnd)), std::string(content) };
}

/*
=============
ParseLogLine
=============
*/
std::optional<GameEvent> ParseLogLine(std::string_view line)
{
	std::optional<LogLine> tokens = TokenizeLogLine(line);
	if (!tokens) {
		if (!TrimView(line).empty())
			Logf(LogLevel::Trace, "skipping line without clock prefix: {}", line);
		return std::nullopt;
	}

	std::optional<Action> action = DecodeAction(tokens->content);
	if (!action) {
		Logf(LogLevel::Trace, "skipping undecodable line at {}: {}", tokens->timestamp, tokens->content);
		return std::nullopt;
	}

	return GameEvent{ std::move(tokens->timestamp), std::move(*action) };
}

} // namespace q3log
