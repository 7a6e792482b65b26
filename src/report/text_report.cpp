/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

text_report.cpp implementation.*/

#include "text_report.hpp"

#include "report_common.hpp"
#include "../match/game_segmenter.hpp"

#include <fmt/format.h>

#include <ostream>

namespace q3log {
namespace {

/*
=============
WriteGameSummary
=============
*/
void WriteGameSummary(std::ostream& out, const GameRecord& game, const ReportOptions& options)
{
	out << fmt::format("\nGame {}: {} events ({})\n", game.id, game.events.size(), game.completed ? "completed" : "incomplete");

	if (options.players) {
		const auto players = game.Players();
		out << fmt::format("  Players: {}\n", players.size());
		for (const auto& [id, name] : players)
			out << fmt::format("    {}: {}\n", id, name);
	}

	out << fmt::format("  Kills: {}\n", game.KillCount());

	if (options.killsByMeans && !game.killsByMeans.empty()) {
		out << "  Kills by means:\n";
		for (const auto& [method, count] : SortTally(game.killsByMeans))
			out << fmt::format("    {}: {}\n", method, count);
	}

	if (options.killers && !game.killers.empty()) {
		out << "  Killers:\n";
		for (const auto& [killer, count] : SortTally(game.killers))
			out << fmt::format("    {}: {} kills\n", killer, count);
	}
}

} // namespace

/*
=============
WriteTextReport
=============
*/
void WriteTextReport(std::ostream& out, const GameSegmenter& segmenter, const ReportOptions& options)
{
	out << fmt::format("Parsed {} games:\n", segmenter.Games().size());

	for (const GameRecord& game : segmenter.Games())
		WriteGameSummary(out, game, options);

	out << "\n=== Overall Statistics ===\n";

	if (options.killsByMeans && !segmenter.OverallKillsByMeans().empty()) {
		out << "\nOverall kills by means:\n";
		for (const auto& [method, count] : SortTally(segmenter.OverallKillsByMeans()))
			out << fmt::format("  {}: {}\n", method, count);
	}

	const std::vector<TallyEntry> killers = SortTally(segmenter.OverallKillers());

	if (options.killers && !killers.empty()) {
		out << "\nOverall killers (top players by kills):\n";
		for (const auto& [killer, count] : killers)
			out << fmt::format("  {}: {} kills\n", killer, count);
	}

	if (options.ranking && !killers.empty()) {
		out << "\n=== PLAYER RANKING REPORT ===\n";
		for (size_t i = 0; i < killers.size(); ++i)
			out << fmt::format("{:>4} place: {} with {} kills\n", RankLabel(i + 1), killers[i].first, killers[i].second);
	}
}

} // namespace q3log
