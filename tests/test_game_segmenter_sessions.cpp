/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_game_segmenter_sessions.cpp implementation.*/

#include "match/game_segmenter.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace q3log;

/*
=============
ParseAll

Runs a fresh segmenter over the provided lines.
=============
*/
static GameSegmenter ParseAll(const std::vector<std::string>& lines)
{
	GameSegmenter segmenter;
	segmenter.ParseLines(lines);
	return segmenter;
}

/*
=============
main

Walks the session state machine through clean, restarted and truncated logs.
=============
*/
int main()
{
	// Clean shutdown followed by a game cut off at end of input.
	{
		const GameSegmenter segmenter = ParseAll({
			"0:00 InitGame: x",
			"0:01 ClientConnect: 1",
			"0:02 ShutdownGame:",
			"0:03 InitGame: y",
			"0:04 ClientConnect: 2",
		});
		assert(!segmenter.HasOpenGame());
		assert(segmenter.GameCounter() == 2);

		const auto& games = segmenter.Games();
		assert(games.size() == 2);
		assert(games[0].id == 1);
		assert(games[0].completed);
		assert(games[0].events.size() == 3);
		assert(games[0].initDetails == std::optional<std::string>("x"));
		assert(std::holds_alternative<ShutdownGameAction>(games[0].events.back().action));
		assert(games[1].id == 2);
		assert(!games[1].completed);
		assert(games[1].events.size() == 2);
		assert(games[1].initDetails == std::optional<std::string>("y"));
	}

	// A restart without shutdown closes the open game as incomplete.
	{
		const GameSegmenter segmenter = ParseAll({
			"0:00 InitGame: first",
			"0:05 ClientConnect: 3",
			"0:10 InitGame: second",
			"0:11 ClientBegin: 3",
			"0:12 ShutdownGame:",
		});
		const auto& games = segmenter.Games();
		assert(games.size() == 2);
		assert(!games[0].completed);
		assert(games[0].events.size() == 2);
		assert(games[1].completed);
		assert(games[1].events.size() == 3);
		assert(games[1].events.front().timestamp == "0:10");
	}

	// Repeated InitGame lines each produce their own near-empty game.
	{
		const GameSegmenter segmenter = ParseAll({
			"0:00 InitGame: a",
			"0:00 InitGame: b",
			"0:00 InitGame: c",
		});
		const auto& games = segmenter.Games();
		assert(games.size() == 3);
		for (size_t i = 0; i < games.size(); ++i) {
			assert(games[i].id == i + 1);
			assert(!games[i].completed);
			assert(games[i].events.size() == 1);
		}
	}

	// Events outside of any game are dropped, including a stray shutdown.
	{
		const GameSegmenter segmenter = ParseAll({
			"0:00 ClientConnect: 1",
			"0:00 ShutdownGame:",
			"0:00 Kill: 1 2 3: A killed B by MOD_GAUNTLET",
			"0:01 InitGame: x",
			"0:02 ShutdownGame:",
			"0:03 ClientConnect: 2",
			"0:04 ShutdownGame:",
		});
		const auto& games = segmenter.Games();
		assert(games.size() == 1);
		assert(games[0].events.size() == 2);
		assert(games[0].completed);
		assert(segmenter.OverallKillsByMeans().empty());
	}

	// Noise lines are skipped without affecting the open game.
	{
		GameSegmenter segmenter;
		assert(segmenter.ProcessLine("  0:00 InitGame: \\sv_hostname\\Code Miner Server"));
		assert(!segmenter.ProcessLine("  0:00 ------------------------------------------------------------"));
		assert(!segmenter.ProcessLine(""));
		assert(!segmenter.ProcessLine(" 0:01 ClientConnect: nobody"));
		assert(!segmenter.ProcessLine(" 0:02 Kill: 1 2: A killed B by MOD_GAUNTLET"));
		assert(segmenter.ProcessLine(" 0:03 Exit: Timelimit hit."));
		assert(segmenter.HasOpenGame());
		assert(segmenter.CurrentGame()->events.size() == 2);
		assert(segmenter.SkippedLines() == 4);
		assert(segmenter.Games().empty());

		segmenter.Finish();
		assert(!segmenter.HasOpenGame());
		assert(segmenter.Games().size() == 1);
		assert(!segmenter.Games()[0].completed);

		// Finishing again has nothing left to close.
		segmenter.Finish();
		assert(segmenter.Games().size() == 1);
	}

	// Nothing recognisable means no games and no tallies.
	{
		const GameSegmenter segmenter = ParseAll({ "", "garbage", "1:00 ClientConnect: 1" });
		assert(segmenter.Games().empty());
		assert(segmenter.OverallKillers().empty());
		assert(segmenter.OverallKillsByMeans().empty());
		assert(segmenter.GameCounter() == 0);
	}

	// Independent segmenters share no state.
	{
		GameSegmenter a;
		GameSegmenter b;
		a.ProcessLine("0:00 InitGame: a");
		a.ProcessLine("0:01 ShutdownGame:");
		b.ProcessLine("0:00 InitGame: b");
		b.Finish();
		assert(a.Games().size() == 1 && a.Games()[0].completed);
		assert(b.Games().size() == 1 && !b.Games()[0].completed);
		assert(b.Games()[0].id == 1);
	}

	return 0;
}
