#pragma once

#include <vector>
#include "scorebook/live_play_state.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {

/**
 * Result of applying one scoring action: the next state and the event that
 * records it. The event carries no id or timestamp; the engine stamps both
 * when it appends.
 */
struct Transition {
    LivePlayState state;
    v1::GameEvent event;
};

/**
 * Dispatch a scoring action to the reducer for its kind.
 *
 * Throws InvalidActionError when the action is not allowed in `state`; the
 * input state is never modified.
 */
Transition reduce(const LivePlayState& state, const v1::ScoringAction& action);

/**
 * Recover the operator action an event was produced from.
 */
v1::ScoringAction action_from_event(const v1::GameEvent& event);

/**
 * Fold `events` over `initial` with the same reducers used live.
 *
 * Throws ReplayError if an event does not reproduce from the state before it.
 */
LivePlayState replay(const LivePlayState& initial, const std::vector<v1::GameEvent>& events);

} // namespace scorebook
