/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

kill_tally.hpp helpers.*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace q3log {

// Kill counts keyed by cause of death or by attacker name.
using KillTally = std::unordered_map<std::string, uint32_t>;

/*
=============
TallyIncrement

Adds one to the count stored under `key`, creating it when missing.
=============
*/
inline void TallyIncrement(KillTally& tally, std::string_view key)
{
	++tally[std::string(key)];
}

/*
=============
TallyMerge

Key-wise sum of `source` into `target`.
=============
*/
inline void TallyMerge(KillTally& target, const KillTally& source)
{
	for (const auto& [key, count] : source)
		target[key] += count;
}

/*
=============
TallyTotal

Sum of every count in the tally.
=============
*/
inline uint64_t TallyTotal(const KillTally& tally)
{
	uint64_t total = 0;
	for (const auto& [key, count] : tally)
		total += count;
	return total;
}

} // namespace q3log
