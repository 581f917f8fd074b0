#include "hit_handler.hpp"
#include "common.hpp"
#include "scorebook/base_state.hpp"
#include "scorebook/errors.hpp"
#include "scorebook/rotation.hpp"

namespace scorebook {
namespace handlers {

namespace {

v1::EventKind event_kind_for(v1::HitKind kind) {
    switch (kind) {
        case v1::HIT_KIND_SINGLE: return v1::EVENT_KIND_SINGLE;
        case v1::HIT_KIND_DOUBLE: return v1::EVENT_KIND_DOUBLE;
        case v1::HIT_KIND_TRIPLE: return v1::EVENT_KIND_TRIPLE;
        case v1::HIT_KIND_HOMERUN: return v1::EVENT_KIND_HOMERUN;
        case v1::HIT_KIND_UNSPECIFIED: break;
    }
    throw InvalidActionError::invalid_argument("Hit kind must be single, double, triple or homerun");
}

} // anonymous namespace

Transition handle_hit(const v1::RecordHit& cmd, const LivePlayState& state) {
    // Guard
    guard_live(state);

    // Validate
    v1::EventKind kind = event_kind_for(cmd.kind());
    const LineupSlot& batter = state.current_batter();

    // Compute
    HitAdvance advance = advance_for_hit(state.bases, static_cast<int>(cmd.kind()), batter.player_id);

    Transition result{state, make_event(state, kind)};
    LivePlayState& next = result.state;

    TeamTotals& offense = next.scoreboard[next.offense_team_id];
    offense.credit_runs(next.inning, advance.runs_scored);
    offense.hits += 1;

    auto& lineup = next.lineups.at(next.offense_team_id);
    lineup = advance_batter(std::move(lineup));
    next.bases = advance.after;
    next.strikes = 0;

    v1::GameEvent& event = result.event;
    *event.mutable_base_state_before() = advance.before.to_proto();
    *event.mutable_base_state_after() = advance.after.to_proto();
    event.set_runs_scored(advance.runs_scored);
    event.set_rbi(advance.rbi);
    if (cmd.has_notes()) {
        event.set_notes(cmd.notes());
    }
    return result;
}

} // namespace handlers
} // namespace scorebook
