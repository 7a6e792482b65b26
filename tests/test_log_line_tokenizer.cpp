/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_log_line_tokenizer.cpp implementation.*/

#include "parser/log_line.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <variant>

using namespace q3log;

/*
=============
main

Checks clock prefix handling and the filtering of non-event lines.
=============
*/
int main()
{
	// One and two digit minutes are both accepted; the clock text is kept verbatim.
	std::optional<LogLine> line = TokenizeLogLine("  0:00 InitGame: \\sv_hostname\\Code Miner Server");
	assert(line);
	assert(line->timestamp == "0:00");
	assert(line->content == "InitGame: \\sv_hostname\\Code Miner Server");

	line = TokenizeLogLine(" 20:37 ClientConnect: 2\r\n");
	assert(line);
	assert(line->timestamp == "20:37");
	assert(line->content == "ClientConnect: 2");

	// Several separating spaces are consumed.
	line = TokenizeLogLine("1:47    Item: 2 weapon_rocketlauncher");
	assert(line);
	assert(line->timestamp == "1:47");
	assert(line->content == "Item: 2 weapon_rocketlauncher");

	// The clock is not validated as a real time of day.
	line = TokenizeLogLine("99:99 Exit: Timelimit hit.");
	assert(line);
	assert(line->timestamp == "99:99");

	// Blank lines are filtered; separator lines still carry a clock.
	assert(!TokenizeLogLine(""));
	assert(!TokenizeLogLine("   \t  "));
	assert(TokenizeLogLine("  0:00 ------------------------------------------------------------"));

	// Malformed clocks are filtered.
	assert(!TokenizeLogLine("100:00 InitGame: x"));
	assert(!TokenizeLogLine("1:0 InitGame: x"));
	assert(!TokenizeLogLine("1:000 InitGame: x"));
	assert(!TokenizeLogLine("1-00 InitGame: x"));
	assert(!TokenizeLogLine("1:00InitGame: x"));
	assert(!TokenizeLogLine("InitGame: x"));

	// A clock with nothing after it is not an event line.
	assert(!TokenizeLogLine("12:34"));
	assert(!TokenizeLogLine("12:34    "));

	// Full line parsing: separator lines tokenize but do not decode.
	assert(!ParseLogLine("  0:00 ------------------------------------------------------------"));
	assert(!ParseLogLine("12:34"));

	std::optional<GameEvent> event = ParseLogLine(" 15:00 Exit: Timelimit hit.");
	assert(event);
	assert(event->timestamp == "15:00");
	const auto* other = std::get_if<OtherAction>(&event->action);
	assert(other);
	assert(other->actionName == "Exit");
	assert(other->details == "Timelimit hit.");

	event = ParseLogLine("  1:08 ShutdownGame:");
	assert(event);
	assert(std::holds_alternative<ShutdownGameAction>(event->action));

	// Very long lines are tokenized and decoded without a length limit.
	const std::string longDetails = "\\sv_hostname\\" + std::string(200000, 'a');
	event = ParseLogLine("  0:00 InitGame: " + longDetails);
	assert(event);
	const auto* init = std::get_if<InitGameAction>(&event->action);
	assert(init);
	assert(init->details == longDetails);

	event = ParseLogLine(" 3:10 say: " + std::string(150000, 'x'));
	assert(event);
	other = std::get_if<OtherAction>(&event->action);
	assert(other);
	assert(other->details.size() == 150000);

	assert(!ParseLogLine(std::string(120000, 'z')));

	return 0;
}
