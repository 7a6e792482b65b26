/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_game_record_aggregation.cpp implementation.*/

#include "match/game_record.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <variant>

using namespace q3log;

/*
=============
MakeKill

Builds a kill event credited to `attacker`.
=============
*/
static GameEvent MakeKill(const std::string& attacker, const std::string& victim, const std::string& method)
{
	KillAction kill;
	kill.killId = 1;
	kill.playerId = attacker == "<world>" ? 1022 : 2;
	kill.victimId = 3;
	kill.playerName = attacker;
	kill.victimName = victim;
	kill.method = method;
	return GameEvent{ "1:00", kill };
}

/*
=============
main

Verifies the aggregate side effects applied as events are added to a game.
=============
*/
int main()
{
	GameRecord game(7);
	assert(game.id == 7);
	assert(!game.completed);
	assert(!game.initDetails);

	game.AddEvent(GameEvent{ "0:00", InitGameAction{ "\\g_gametype\\0" } });
	assert(game.initDetails == std::optional<std::string>("\\g_gametype\\0"));

	game.AddEvent(MakeKill("Isgalamido", "Mocinha", "MOD_ROCKET_SPLASH"));
	game.AddEvent(MakeKill("Isgalamido", "Zeh", "MOD_ROCKET_SPLASH"));
	game.AddEvent(MakeKill("<world>", "Isgalamido", "MOD_TRIGGER_HURT"));
	game.AddEvent(MakeKill("Zeh", "Isgalamido", "MOD_RAILGUN"));
	game.AddEvent(GameEvent{ "1:10", ItemAction{ 2, "weapon_rocketlauncher" } });
	game.AddEvent(GameEvent{ "1:11", OtherAction{ "Exit", "Fraglimit hit." } });

	// Every kill is tallied by cause; <world> is never credited as a killer.
	assert(game.killsByMeans.size() == 3);
	assert(game.killsByMeans.at("MOD_ROCKET_SPLASH") == 2);
	assert(game.killsByMeans.at("MOD_TRIGGER_HURT") == 1);
	assert(game.killsByMeans.at("MOD_RAILGUN") == 1);
	assert(TallyTotal(game.killsByMeans) == 4);

	assert(game.killers.size() == 2);
	assert(game.killers.at("Isgalamido") == 2);
	assert(game.killers.at("Zeh") == 1);
	assert(game.killers.count("<world>") == 0);

	// Kills are a view over the event list in log order.
	const auto kills = game.Kills();
	assert(kills.size() == 4);
	assert(game.KillCount() == 4);
	assert(std::get<KillAction>(kills[2]->action).playerName == "<world>");
	assert(kills[0] == &game.events[1]);

	assert(!game.completed);
	game.AddEvent(GameEvent{ "1:12", ShutdownGameAction{} });
	assert(game.completed);
	assert(game.events.size() == 8);

	// Completion never reverts and a later InitGame only overwrites the details.
	game.AddEvent(GameEvent{ "1:13", InitGameAction{ "\\g_gametype\\4" } });
	assert(game.completed);
	assert(game.initDetails == std::optional<std::string>("\\g_gametype\\4"));

	// Tally helpers.
	KillTally total;
	TallyMerge(total, game.killers);
	TallyMerge(total, game.killers);
	assert(total.at("Isgalamido") == 4);
	assert(total.at("Zeh") == 2);
	TallyIncrement(total, "Mocinha");
	assert(total.at("Mocinha") == 1);
	assert(TallyTotal(total) == 7);

	return 0;
}
