/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_record.cpp implementation.*/

#include "game_record.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

namespace q3log {

/*
=============
ExtractPlayerName
=============
*/
std::optional<std::string> ExtractPlayerName(std::string_view userinfo)
{
	constexpr std::string_view kNameKey{"n\\"};

	for (size_t pos = userinfo.find(kNameKey); pos != std::string_view::npos; pos = userinfo.find(kNameKey, pos + 1)) {
		const size_t start = pos + kNameKey.size();
		const size_t end = std::min(userinfo.find('\\', start), userinfo.size());
		if (end > start)
			return std::string(userinfo.substr(start, end - start));
	}

	return std::nullopt;
}

/*
=============
GameRecord::AddEvent
=============
*/
void GameRecord::AddEvent(GameEvent event)
{
	std::visit([this](const auto& action) {
		using T = std::decay_t<decltype(action)>;
		if constexpr (std::is_same_v<T, InitGameAction>) {
			initDetails = action.details;
		}
		else if constexpr (std::is_same_v<T, ShutdownGameAction>) {
			completed = true;
		}
		else if constexpr (std::is_same_v<T, KillAction>) {
			TallyIncrement(killsByMeans, action.method);
			if (!action.IsWorldKill())
				TallyIncrement(killers, action.playerName);
		}
	}, event.action);

	events.push_back(std::move(event));
}

/*
=============
GameRecord::Players
=============
*/
std::map<uint32_t, std::string> GameRecord::Players() const
{
	std::map<uint32_t, std::string> players;

	for (const GameEvent& event : events) {
		const auto* change = std::get_if<ClientUserinfoChangedAction>(&event.action);
		if (!change)
			continue;

		if (std::optional<std::string> name = ExtractPlayerName(change->info))
			players[change->playerId] = std::move(*name);
	}

	return players;
}

/*
=============
GameRecord::Kills
=============
*/
std::vector<const GameEvent*> GameRecord::Kills() const
{
	std::vector<const GameEvent*> kills;

	for (const GameEvent& event : events) {
		if (std::holds_alternative<KillAction>(event.action))
			kills.push_back(&event);
	}

	return kills;
}

/*
=============
GameRecord::KillCount
=============
*/
size_t GameRecord::KillCount() const
{
	size_t count = 0;
	for (const GameEvent& event : events) {
		if (std::holds_alternative<KillAction>(event.action))
			++count;
	}
	return count;
}

} // namespace q3log
