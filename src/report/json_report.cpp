/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

json_report.cpp implementation.*/

// json_report.cpp (JSON Summary Export)
// Renders the parsed games as a JSON document for external tools. The layout
// mirrors the text report: a "games" array with per-game tallies, players and
// the ordered event list, followed by an "overall" block with the combined
// tallies and the player ranking. Tallies are emitted as objects; the ranking
// array carries the display order.

#include "json_report.hpp"

#include "report_common.hpp"
#include "../match/game_segmenter.hpp"
#include "../shared/logger.hpp"
#include "../shared/version.hpp"

#include <cerrno>
#include <exception>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <variant>

namespace q3log {
namespace {

using json = Json::Value;

/*
=============
TallyToJson
=============
*/
json TallyToJson(const KillTally& tally)
{
	json result(Json::objectValue);
	for (const auto& [key, count] : tally)
		result[key] = static_cast<Json::UInt>(count);
	return result;
}

/*
=============
RankingToJson
=============
*/
json RankingToJson(const KillTally& killers)
{
	json ranking(Json::arrayValue);
	const std::vector<TallyEntry> sorted = SortTally(killers);

	for (size_t i = 0; i < sorted.size(); ++i) {
		json entry;
		entry["rank"] = static_cast<Json::UInt64>(i + 1);
		entry["label"] = RankLabel(i + 1);
		entry["player"] = sorted[i].first;
		entry["kills"] = static_cast<Json::UInt>(sorted[i].second);
		ranking.append(entry);
	}

	return ranking;
}

/*
=============
GameToJson
=============
*/
json GameToJson(const GameRecord& game)
{
	json gameJson;
	gameJson["id"] = static_cast<Json::UInt>(game.id);
	gameJson["completed"] = game.completed;
	if (game.initDetails)
		gameJson["init_details"] = *game.initDetails;
	gameJson["event_count"] = static_cast<Json::UInt64>(game.events.size());
	gameJson["kill_count"] = static_cast<Json::UInt64>(game.KillCount());

	json players(Json::objectValue);
	for (const auto& [id, name] : game.Players())
		players[std::to_string(id)] = name;
	gameJson["players"] = players;

	gameJson["kills_by_means"] = TallyToJson(game.killsByMeans);
	gameJson["killers"] = TallyToJson(game.killers);

	json events(Json::arrayValue);
	for (const GameEvent& event : game.events)
		events.append(EventToJson(event));
	gameJson["events"] = events;

	return gameJson;
}

} // namespace

/*
=============
EventToJson
=============
*/
Json::Value EventToJson(const GameEvent& event)
{
	json result;
	result["timestamp"] = event.timestamp;
	result["action"] = std::string(ActionKeyword(event.action));

	std::visit([&result](const auto& action) {
		using T = std::decay_t<decltype(action)>;
		if constexpr (std::is_same_v<T, InitGameAction>) {
			result["details"] = action.details;
		}
		else if constexpr (std::is_same_v<T, ClientConnectAction> || std::is_same_v<T, ClientBeginAction> ||
			std::is_same_v<T, ClientDisconnectAction>) {
			result["player_id"] = static_cast<Json::UInt>(action.playerId);
		}
		else if constexpr (std::is_same_v<T, ClientUserinfoChangedAction>) {
			result["player_id"] = static_cast<Json::UInt>(action.playerId);
			result["info"] = action.info;
		}
		else if constexpr (std::is_same_v<T, ItemAction>) {
			result["item_id"] = static_cast<Json::UInt>(action.itemId);
			result["description"] = action.description;
		}
		else if constexpr (std::is_same_v<T, KillAction>) {
			result["kill_id"] = static_cast<Json::UInt>(action.killId);
			result["player_id"] = static_cast<Json::UInt>(action.playerId);
			result["victim_id"] = static_cast<Json::UInt>(action.victimId);
			result["player_name"] = action.playerName;
			result["victim_name"] = action.victimName;
			result["method"] = action.method;
		}
		else if constexpr (std::is_same_v<T, OtherAction>) {
			result["details"] = action.details;
		}
	}, event.action);

	return result;
}

/*
=============
BuildReportJson
=============
*/
Json::Value BuildReportJson(const GameSegmenter& segmenter)
{
	json root;
	root["generator"] = std::string(version::kToolTitle) + " " + std::string(version::kToolVersion);
	root["game_count"] = static_cast<Json::UInt64>(segmenter.Games().size());

	json games(Json::arrayValue);
	for (const GameRecord& game : segmenter.Games())
		games.append(GameToJson(game));
	root["games"] = games;

	json overall;
	overall["kills_by_means"] = TallyToJson(segmenter.OverallKillsByMeans());
	overall["killers"] = TallyToJson(segmenter.OverallKillers());
	overall["ranking"] = RankingToJson(segmenter.OverallKillers());
	root["overall"] = overall;

	return root;
}

/*
=============
WriteReportJson
=============
*/
bool WriteReportJson(const GameSegmenter& segmenter, const std::string& fileName)
{
	try {
		std::ofstream file(fileName);
		if (file.is_open()) {
			Json::StreamWriterBuilder writer;
			writer["indentation"] = "    ";
			file << Json::writeString(writer, BuildReportJson(segmenter)) << '\n';
			file.close();
			if (!file) {
				Logf(LogLevel::Error, "failed to write JSON report '{}'", fileName);
				return false;
			}
			Logf(LogLevel::Info, "JSON report written to {}", fileName);
			return true;
		}

		const std::error_code ec(errno, std::system_category());
		Logf(LogLevel::Error, "failed to open JSON report '{}' ({})", fileName, ec.message());
	}
	catch (const std::exception& e) {
		Logf(LogLevel::Error, "exception while writing JSON report '{}': {}", fileName, e.what());
	}

	return false;
}

} // namespace q3log
