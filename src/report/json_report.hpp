/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

json_report.hpp declarations.*/

#pragma once

#include "../parser/log_events.hpp"

#include <json/json.h>

#include <string>

namespace q3log {

class GameSegmenter;

/*
=============
EventToJson

Serializes one event as `{ "timestamp", "action", <action fields> }`.
=============
*/
Json::Value EventToJson(const GameEvent& event);

/*
=============
BuildReportJson

Builds the JSON summary: one entry per game plus the overall tallies and
the player ranking.
=============
*/
Json::Value BuildReportJson(const GameSegmenter& segmenter);

/*
=============
WriteReportJson

Writes BuildReportJson to `fileName`. Returns false and logs the reason when
the file cannot be written.
=============
*/
bool WriteReportJson(const GameSegmenter& segmenter, const std::string& fileName);

} // namespace q3log
