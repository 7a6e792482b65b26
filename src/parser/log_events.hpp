/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_events.hpp declarations.*/

// log_events.hpp (Decoded Server Log Events)
// Typed representation of the lines a Quake III style server writes to its
// games log. Every recognized line becomes a GameEvent holding the raw clock
// text and one Action alternative; keywords without a dedicated alternative
// are kept as OtherAction so no colon-delimited line is lost.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace q3log {

// Attacker name the server uses for environmental deaths (falling, lava, ...).
inline constexpr std::string_view kWorldPlayerName{"<world>"};

struct InitGameAction {
	std::string details;

	bool operator==(const InitGameAction&) const = default;
};

struct ShutdownGameAction {
	bool operator==(const ShutdownGameAction&) const = default;
};

struct ClientConnectAction {
	uint32_t playerId = 0;

	bool operator==(const ClientConnectAction&) const = default;
};

struct ClientUserinfoChangedAction {
	uint32_t playerId = 0;
	std::string info;

	bool operator==(const ClientUserinfoChangedAction&) const = default;
};

struct ClientBeginAction {
	uint32_t playerId = 0;

	bool operator==(const ClientBeginAction&) const = default;
};

struct ItemAction {
	uint32_t itemId = 0;
	std::string description;

	bool operator==(const ItemAction&) const = default;
};

struct KillAction {
	uint32_t killId = 0;
	uint32_t playerId = 0;
	uint32_t victimId = 0;
	std::string playerName;
	std::string victimName;
	std::string method;

	// Environmental kills are tallied by cause but never credited to a player.
	bool IsWorldKill() const { return playerName == kWorldPlayerName; }

	bool operator==(const KillAction&) const = default;
};

struct ClientDisconnectAction {
	uint32_t playerId = 0;

	bool operator==(const ClientDisconnectAction&) const = default;
};

struct OtherAction {
	std::string actionName;
	std::string details;

	bool operator==(const OtherAction&) const = default;
};

using Action = std::variant<
	InitGameAction,
	ShutdownGameAction,
	ClientConnectAction,
	ClientUserinfoChangedAction,
	ClientBeginAction,
	ItemAction,
	KillAction,
	ClientDisconnectAction,
	OtherAction>;

struct GameEvent {
	std::string timestamp;
	Action action;

	bool operator==(const GameEvent&) const = default;
};

/*
=============
ActionKeyword

Returns the log keyword that produced the action. OtherAction reports the
keyword it was decoded from.
=============
*/
std::string_view ActionKeyword(const Action& action);

} // namespace q3log
