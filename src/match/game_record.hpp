/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_record.hpp declarations.*/

#pragma once

#include "kill_tally.hpp"
#include "../parser/log_events.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace q3log {

/*
=============
ExtractPlayerName

Returns the display name stored after the `n\` key of a userinfo string,
up to the next backslash. Yields nothing when the key is absent or empty.
=============
*/
std::optional<std::string> ExtractPlayerName(std::string_view userinfo);

// One game session: every event between an InitGame line and the matching
// ShutdownGame (or the point where the session was cut short), together with
// the kill tallies accumulated while the events were added.
struct GameRecord {
	uint32_t id = 0;
	std::vector<GameEvent> events;
	std::optional<std::string> initDetails;
	bool completed = false;
	KillTally killsByMeans;
	KillTally killers;

	GameRecord() = default;
	explicit GameRecord(uint32_t gameId) : id(gameId) {}

	/*
	=============
	GameRecord::AddEvent

	Appends the event and applies its aggregate side effects.
	=============
	*/
	void AddEvent(GameEvent event);

	/*
	=============
	GameRecord::Players

	Player id to latest display name, built from the userinfo updates.
	=============
	*/
	std::map<uint32_t, std::string> Players() const;

	/*
	=============
	GameRecord::Kills

	The kill events of this game in log order.
	=============
	*/
	std::vector<const GameEvent*> Kills() const;

	size_t KillCount() const;
};

} // namespace q3log
