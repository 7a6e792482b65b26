/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

text_report.hpp declarations.*/

#pragma once

#include "report_options.hpp"

#include <iosfwd>

namespace q3log {

class GameSegmenter;

/*
=============
WriteTextReport

Prints the per-game summaries, the overall statistics and the player ranking
to `out`. Sections disabled in `options` are left out.
=============
*/
void WriteTextReport(std::ostream& out, const GameSegmenter& segmenter, const ReportOptions& options);

} // namespace q3log
