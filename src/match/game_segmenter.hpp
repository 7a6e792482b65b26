/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_segmenter.hpp declarations.*/

// game_segmenter.hpp (Game Session Segmentation)
// Groups the decoded events of a games log into GameRecords.
//
// A session opens on InitGame and closes on ShutdownGame. Servers that crash
// or restart leave sessions without a ShutdownGame line, so an InitGame seen
// while a session is still open closes it first, and `Finish` closes whatever
// is left at end of input. Only a ShutdownGame marks a session completed.
// Events outside of any session are dropped.
//
// Each closed session is folded into the overall tallies exactly once, at the
// moment it is closed.

#pragma once

#include "game_record.hpp"
#include "kill_tally.hpp"
#include "../parser/log_events.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace q3log {

class GameSegmenter {
public:
	/*
	=============
	GameSegmenter::HandleEvent

	Routes one decoded event through the session state machine.
	=============
	*/
	void HandleEvent(GameEvent event);

	/*
	=============
	GameSegmenter::ProcessLine

	Tokenizes and decodes a raw line, then handles the resulting event.
	Returns false when the line did not produce an event.
	=============
	*/
	bool ProcessLine(std::string_view line);

	/*
	=============
	GameSegmenter::Finish

	Closes the session left open at end of input.
	=============
	*/
	void Finish();

	/*
	=============
	GameSegmenter::ParseLines

	Feeds every line and finishes.
	=============
	*/
	void ParseLines(const std::vector<std::string>& lines);

	/*
	=============
	GameSegmenter::ParseFile

	Loads the file and parses it. On I/O failure nothing is parsed, `error`
	receives the reason and false is returned.
	=============
	*/
	bool ParseFile(const std::filesystem::path& path, std::string& error);

	const std::vector<GameRecord>& Games() const { return games_; }
	const KillTally& OverallKillsByMeans() const { return overallKillsByMeans_; }
	const KillTally& OverallKillers() const { return overallKillers_; }
	bool HasOpenGame() const { return currentGame_.has_value(); }
	const std::optional<GameRecord>& CurrentGame() const { return currentGame_; }
	uint32_t GameCounter() const { return gameCounter_; }
	size_t SkippedLines() const { return skippedLines_; }

private:
	void CloseCurrentGame();

	std::vector<GameRecord> games_;
	std::optional<GameRecord> currentGame_;
	uint32_t gameCounter_ = 0;
	KillTally overallKillsByMeans_;
	KillTally overallKillers_;
	size_t skippedLines_ = 0;
};

} // namespace q3log
