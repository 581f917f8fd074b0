#pragma once

#include <string>
#include "scorebook/live_play_state.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace handlers {

/// Reject any action once the game has been completed.
void guard_live(const LivePlayState& state);

/// Require a defender id that belongs to the defending lineup.
void require_defender(const LivePlayState& state, const std::string& defender_id);

/**
 * Event skeleton for the current at-bat: game, inning, half and batter from
 * the state before the action, bases unchanged, no runs.
 */
v1::GameEvent make_event(const LivePlayState& state, v1::EventKind kind);

} // namespace handlers
} // namespace scorebook
