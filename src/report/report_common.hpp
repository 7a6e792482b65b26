/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

report_common.hpp declarations.*/

#pragma once

#include "../match/kill_tally.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace q3log {

using TallyEntry = std::pair<std::string, uint32_t>;

/*
=============
SortTally

Returns the tally ordered by count, highest first. Equal counts are ordered
by key so reports are reproducible.
=============
*/
std::vector<TallyEntry> SortTally(const KillTally& tally);

/*
=============
RankLabel

1-based position as shown in the ranking: "1st", "2nd", "3rd", then "Nth".
=============
*/
std::string RankLabel(size_t rank);

} // namespace q3log
