#include "common.hpp"
#include "scorebook/validation.hpp"

namespace scorebook {
namespace handlers {

void guard_live(const LivePlayState& state) {
    validation::require_state(!state.is_complete, "Game " + state.game_id + " is already complete");
}

void require_defender(const LivePlayState& state, const std::string& defender_id) {
    validation::require_not_empty(defender_id, "defender_id");
    const Lineup& defense = state.defense_lineup();
    validation::require_state(!defense.empty(), "No defender roster for team " + state.defense_team_id);
    validation::require_state(defense.contains(defender_id),
                              "Defender " + defender_id + " is not on team " + state.defense_team_id);
}

v1::GameEvent make_event(const LivePlayState& state, v1::EventKind kind) {
    v1::GameEvent event;
    event.set_game_id(state.game_id);
    event.set_event_type(kind);
    event.set_inning(state.inning);
    event.set_half(state.half);
    event.set_batter_id(state.current_batter().player_id);
    *event.mutable_base_state_before() = state.bases.to_proto();
    *event.mutable_base_state_after() = state.bases.to_proto();
    event.set_runs_scored(0);
    event.set_rbi(0);
    return event;
}

} // namespace handlers
} // namespace scorebook
