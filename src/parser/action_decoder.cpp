/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

action_decoder.cpp implementation.*/

// action_decoder.cpp (Log Action Decoding)
// Turns the payload of a games log line into a typed Action.
//
// Key Responsibilities:
// - Keyword Dispatch: `DecodeAction` checks the known keywords in a fixed
//   priority order (first match wins). `ShutdownGame:` only matches exactly.
// - Numeric Fields: player, item and kill ids are unsigned 32-bit values; a
//   malformed id drops the whole line instead of falling through.
// - Kill Lines: `DecodeKill` validates the three numeric ids and splits the
//   human readable description into attacker, victim and cause of death.
// - Fallback: any other `Keyword: payload` line is preserved as OtherAction.

#include "action_decoder.hpp"

#include "../shared/string_utils.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <type_traits>
#include <utility>

namespace q3log {
namespace {

constexpr std::string_view kInitGamePrefix{"InitGame:"};
constexpr std::string_view kShutdownGameLiteral{"ShutdownGame:"};
constexpr std::string_view kClientConnectPrefix{"ClientConnect:"};
constexpr std::string_view kClientUserinfoChangedPrefix{"ClientUserinfoChanged:"};
constexpr std::string_view kClientBeginPrefix{"ClientBegin:"};
constexpr std::string_view kClientDisconnectPrefix{"ClientDisconnect:"};
constexpr std::string_view kItemPrefix{"Item:"};
constexpr std::string_view kKillPrefix{"Kill:"};

struct IdAndText {
	uint32_t id = 0;
	std::string text;
};

/*
=============
DecodeSingleId

Payload holding nothing but one unsigned id.
=============
*/
std::optional<uint32_t> DecodeSingleId(std::string_view payload)
{
	return ParseUInt32(TrimView(payload));
}

/*
=============
DecodeIdAndText

Payload of the form `<id> <free text>`. The text after the first space is
kept verbatim.
=============
*/
std::optional<IdAndText> DecodeIdAndText(std::string_view payload)
{
	const auto parts = SplitOnce(TrimView(payload), ' ');
	if (!parts)
		return std::nullopt;

	const std::optional<uint32_t> id = ParseUInt32(parts->first);
	if (!id)
		return std::nullopt;

	return IdAndText{ *id, std::string(parts->second) };
}

/*
=============
SplitKillIds

Parses exactly three whitespace separated unsigned ids.
=============
*/
std::optional<std::array<uint32_t, 3>> SplitKillIds(std::string_view ids)
{
	std::array<uint32_t, 3> values{};
	size_t count = 0;
	size_t pos = 0;

	while (true) {
		pos = ids.find_first_not_of(kWhitespace, pos);
		if (pos == std::string_view::npos)
			break;

		const size_t end = std::min(ids.find_first_of(kWhitespace, pos), ids.size());
		if (count == values.size())
			return std::nullopt;

		const std::optional<uint32_t> value = ParseUInt32(ids.substr(pos, end - pos));
		if (!value)
			return std::nullopt;

		values[count++] = *value;
		pos = end;
	}

	if (count != values.size())
		return std::nullopt;

	return values;
}

/*
=============
FindSeparatedWord

Position of the first `word` at or after `from` that has whitespace on both
sides and at least one character before it.
=============
*/
size_t FindSeparatedWord(std::string_view text, std::string_view word, size_t from)
{
	for (size_t pos = text.find(word, from); pos != std::string_view::npos; pos = text.find(word, pos + 1)) {
		const size_t after = pos + word.size();
		if (pos == 0 || after >= text.size())
			continue;
		if (kWhitespace.find(text[pos - 1]) != std::string_view::npos && kWhitespace.find(text[after]) != std::string_view::npos)
			return pos;
	}

	return std::string_view::npos;
}

} // namespace

/*
=============
DecodeKill
=============
*/
std::optional<KillAction> DecodeKill(std::string_view details)
{
	const auto parts = SplitOnce(details, ':');
	if (!parts)
		return std::nullopt;

	const std::optional<std::array<uint32_t, 3>> ids = SplitKillIds(TrimView(parts->first));
	if (!ids)
		return std::nullopt;

	const std::string_view description = TrimView(parts->second);
	constexpr std::string_view kKilledWord{"killed"};
	constexpr std::string_view kByWord{"by"};

	// The first " killed " and the first " by " after it that leave non-empty
	// names act as separators.
	for (size_t killed = FindSeparatedWord(description, kKilledWord, 0); killed != std::string_view::npos;
		killed = FindSeparatedWord(description, kKilledWord, killed + 1)) {
		const std::string_view attacker = TrimView(description.substr(0, killed));
		const size_t victimStart = description.find_first_not_of(kWhitespace, killed + kKilledWord.size());
		if (attacker.empty() || victimStart == std::string_view::npos)
			continue;

		const size_t by = FindSeparatedWord(description, kByWord, victimStart + 1);
		if (by == std::string_view::npos)
			continue;

		KillAction kill;
		kill.killId = (*ids)[0];
		kill.playerId = (*ids)[1];
		kill.victimId = (*ids)[2];
		kill.playerName = std::string(attacker);
		kill.victimName = std::string(TrimView(description.substr(victimStart, by - victimStart)));
		kill.method = std::string(TrimView(description.substr(by + kByWord.size())));
		return kill;
	}

	return std::nullopt;
}

/*
=============
DecodeAction
=============
*/
std::optional<Action> DecodeAction(std::string_view content)
{
	if (auto rest = StripPrefix(content, kInitGamePrefix))
		return InitGameAction{ std::string(TrimView(*rest)) };

	if (content == kShutdownGameLiteral)
		return ShutdownGameAction{};

	if (auto rest = StripPrefix(content, kClientConnectPrefix)) {
		const std::optional<uint32_t> id = DecodeSingleId(*rest);
		if (!id)
			return std::nullopt;
		return ClientConnectAction{ *id };
	}

	if (auto rest = StripPrefix(content, kClientUserinfoChangedPrefix)) {
		std::optional<IdAndText> decoded = DecodeIdAndText(*rest);
		if (!decoded)
			return std::nullopt;
		return ClientUserinfoChangedAction{ decoded->id, std::move(decoded->text) };
	}

	if (auto rest = StripPrefix(content, kClientBeginPrefix)) {
		const std::optional<uint32_t> id = DecodeSingleId(*rest);
		if (!id)
			return std::nullopt;
		return ClientBeginAction{ *id };
	}

	if (auto rest = StripPrefix(content, kClientDisconnectPrefix)) {
		const std::optional<uint32_t> id = DecodeSingleId(*rest);
		if (!id)
			return std::nullopt;
		return ClientDisconnectAction{ *id };
	}

	if (auto rest = StripPrefix(content, kItemPrefix)) {
		std::optional<IdAndText> decoded = DecodeIdAndText(*rest);
		if (!decoded)
			return std::nullopt;
		return ItemAction{ decoded->id, std::move(decoded->text) };
	}

	if (auto rest = StripPrefix(content, kKillPrefix)) {
		std::optional<KillAction> kill = DecodeKill(TrimView(*rest));
		if (!kill)
			return std::nullopt;
		return std::move(*kill);
	}

	if (const auto parts = SplitOnce(content, ':'))
		return OtherAction{ std::string(parts->first), std::string(TrimView(parts->second)) };

	return std::nullopt;
}

/*
=============
ActionKeyword
=============
*/
std::string_view ActionKeyword(const Action& action)
{
	return std::visit([](const auto& value) -> std::string_view {
		using T = std::decay_t<decltype(value)>;
		if constexpr (std::is_same_v<T, InitGameAction>)
			return "InitGame";
		else if constexpr (std::is_same_v<T, ShutdownGameAction>)
			return "ShutdownGame";
		else if constexpr (std::is_same_v<T, ClientConnectAction>)
			return "ClientConnect";
		else if constexpr (std::is_same_v<T, ClientUserinfoChangedAction>)
			return "ClientUserinfoChanged";
		else if constexpr (std::is_same_v<T, ClientBeginAction>)
			return "ClientBegin";
		else if constexpr (std::is_same_v<T, ItemAction>)
			return "Item";
		else if constexpr (std::is_same_v<T, KillAction>)
			return "Kill";
		else if constexpr (std::is_same_v<T, ClientDisconnectAction>)
			return "ClientDisconnect";
		else
			return value.actionName;
	}, action);
}

} // namespace q3log
