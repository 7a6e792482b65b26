/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

string_utils.hpp helpers.*/

#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace q3log {

inline constexpr std::string_view kWhitespace{" \t\r\n\v\f"};

/*
=============
TrimView

Returns the input with leading and trailing whitespace removed.
=============
*/
inline std::string_view TrimView(std::string_view raw)
{
	const size_t start = raw.find_first_not_of(kWhitespace);
	if (start == std::string_view::npos)
		return {};

	const size_t end = raw.find_last_not_of(kWhitespace);
	return raw.substr(start, end - start + 1);
}

/*
=============
StripPrefix

Returns the remainder after `prefix` when `value` starts with it.
=============
*/
inline std::optional<std::string_view> StripPrefix(std::string_view value, std::string_view prefix)
{
	if (value.substr(0, prefix.size()) != prefix)
		return std::nullopt;

	return value.substr(prefix.size());
}

/*
=============
SplitOnce

Splits `value` around the first occurrence of `separator`. Yields nothing
when the separator is absent.
=============
*/
inline std::optional<std::pair<std::string_view, std::string_view>> SplitOnce(std::string_view value, char separator)
{
	const size_t pos = value.find(separator);
	if (pos == std::string_view::npos)
		return std::nullopt;

	return std::make_pair(value.substr(0, pos), value.substr(pos + 1));
}

/*
=============
ParseUInt32

Attempts to parse the whole view as an unsigned 32-bit integer. Signs,
whitespace and out-of-range values are rejected.
=============
*/
inline std::optional<uint32_t> ParseUInt32(std::string_view str)
{
	if (str.empty())
		return std::nullopt;

	uint32_t value;
	auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
	if (ec == std::errc() && ptr == str.data() + str.size()) {
		return value;
	}
	return std::nullopt;
}

} // namespace q3log
