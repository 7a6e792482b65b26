/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

report_common.cpp implementation.*/

#include "report_common.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace q3log {

/*
=============
SortTally
=============
*/
std::vector<TallyEntry> SortTally(const KillTally& tally)
{
	std::vector<TallyEntry> entries(tally.begin(), tally.end());
	std::sort(entries.begin(), entries.end(), [](const TallyEntry& a, const TallyEntry& b) {
		if (a.second != b.second)
			return a.second > b.second;
		return a.first < b.first;
	});
	return entries;
}

/*
=============
RankLabel
=============
*/
std::string RankLabel(size_t rank)
{
	switch (rank) {
	case 1:
		return "1st";
	case 2:
		return "2nd";
	case 3:
		return "3rd";
	default:
		return fmt::format("{}th", rank);
	}
}

} // namespace q3log
