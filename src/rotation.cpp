#include "scorebook/rotation.hpp"
#include "scorebook/errors.hpp"

#include <algorithm>
#include <utility>

namespace scorebook {

Lineup advance_batter(Lineup lineup) {
    if (lineup.empty()) {
        throw SetupError("Cannot advance an empty lineup for team " + lineup.team_id);
    }
    lineup.current_index = (lineup.current_index + 1) % lineup.size();
    return lineup;
}

LivePlayState rotate_sides(LivePlayState state) {
    int next_inning = state.half == v1::HALF_BOTTOM ? state.inning + 1 : state.inning;

    state.half = state.half == v1::HALF_TOP ? v1::HALF_BOTTOM : v1::HALF_TOP;
    state.inning = next_inning;
    state.planned_innings = std::max(state.planned_innings, next_inning);
    state.outs = 0;
    state.strikes = 0;
    state.bases = BaseState{};
    std::swap(state.offense_team_id, state.defense_team_id);
    return state;
}

LivePlayState record_out(LivePlayState state, bool batter_done) {
    if (batter_done) {
        auto& lineup = state.lineups.at(state.offense_team_id);
        lineup = advance_batter(std::move(lineup));
        state.strikes = 0;
    }

    state.outs += 1;
    if (state.outs >= kOutsPerHalf) {
        state = rotate_sides(std::move(state));
    }
    return state;
}

} // namespace scorebook
