/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_segmenter.cpp implementation.*/

#include "game_segmenter.hpp"

#include "log_loader.hpp"
#include "../parser/log_line.hpp"
#include "../shared/logger.hpp"

#include <utility>
#include <variant>

namespace q3log {

/*
=============
GameSegmenter::CloseCurrentGame

Moves the open game into the finished list and folds its tallies into the
overall totals.
=============
*/
void GameSegmenter::CloseCurrentGame()
{
	if (!currentGame_)
		return;

	GameRecord game = std::move(*currentGame_);
	currentGame_.reset();

	TallyMerge(overallKillsByMeans_, game.killsByMeans);
	TallyMerge(overallKillers_, game.killers);

	Logf(LogLevel::Debug, "game {} closed: {} events, {} kills ({})",
		game.id, game.events.size(), game.KillCount(), game.completed ? "completed" : "incomplete");

	games_.push_back(std::move(game));
}

/*
=============
GameSegmenter::HandleEvent
=============
*/
void GameSegmenter::HandleEvent(GameEvent event)
{
	if (std::holds_alternative<InitGameAction>(event.action)) {
		if (currentGame_) {
			Logf(LogLevel::Debug, "InitGame at {} while game {} is still open, closing it", event.timestamp, currentGame_->id);
			CloseCurrentGame();
		}

		GameRecord game(++gameCounter_);
		game.AddEvent(std::move(event));
		currentGame_ = std::move(game);
		Logf(LogLevel::Debug, "game {} opened at {}", currentGame_->id, currentGame_->events.front().timestamp);
		return;
	}

	if (!currentGame_) {
		Logf(LogLevel::Debug, "dropping {} at {} outside of any game", ActionKeyword(event.action), event.timestamp);
		return;
	}

	const bool shutdown = std::holds_alternative<ShutdownGameAction>(event.action);
	currentGame_->AddEvent(std::move(event));

	if (shutdown)
		CloseCurrentGame();
}

/*
=============
GameSegmenter::ProcessLine
=============
*/
bool GameSegmenter::ProcessLine(std::string_view line)
{
	std::optional<GameEvent> event = ParseLogLine(line);
	if (!event) {
		++skippedLines_;
		return false;
	}

	HandleEvent(std::move(*event));
	return true;
}

/*
=============
GameSegmenter::Finish
=============
*/
void GameSegmenter::Finish()
{
	if (currentGame_) {
		Logf(LogLevel::Debug, "end of input with game {} still open", currentGame_->id);
		CloseCurrentGame();
	}
}

/*
=============
GameSegmenter::ParseLines
=============
*/
void GameSegmenter::ParseLines(const std::vector<std::string>& lines)
{
	for (const std::string& line : lines)
		ProcessLine(line);

	Finish();
}

/*
=============
GameSegmenter::ParseFile
=============
*/
bool GameSegmenter::ParseFile(const std::filesystem::path& path, std::string& error)
{
	std::vector<std::string> lines;
	if (!LoadLogLines(path, lines, error))
		return false;

	ParseLines(lines);

	Logf(LogLevel::Info, "parsed '{}': {} lines, {} games, {} lines skipped",
		path.string(), lines.size(), games_.size(), skippedLines_);
	return true;
}

} // namespace q3log
