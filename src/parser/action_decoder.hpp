/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

action_decoder.hpp declarations.*/

#pragma once

#include "log_events.hpp"

#include <optional>
#include <string_view>

namespace q3log {

/*
=============
DecodeAction

Maps the text following the clock prefix onto an Action. Known keywords are
matched by prefix in a fixed order; any other text containing a colon becomes
an OtherAction. A known keyword whose payload is malformed yields nothing.
=============
*/
std::optional<Action> DecodeAction(std::string_view content);

/*
=============
DecodeKill

Decodes the payload of a `Kill:` line, i.e.
`<kill_id> <player_id> <victim_id>: <player> killed <victim> by <method>`.
=============
*/
std::optional<KillAction> DecodeKill(std::string_view details);

} // namespace q3log
