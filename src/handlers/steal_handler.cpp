#include "steal_handler.hpp"
#include "common.hpp"
#include "scorebook/base_state.hpp"
#include "scorebook/rotation.hpp"
#include "scorebook/validation.hpp"

namespace scorebook {
namespace handlers {

Transition handle_steal(const v1::RecordSteal& cmd, const LivePlayState& state) {
    // Guard
    guard_live(state);
    validation::require_state(!state.bases.empty(), "No runner on base to steal");

    // Validate
    validation::require_not_empty(cmd.runner_id(), "runner_id");
    validation::require_state(state.bases.locate(cmd.runner_id()) >= 0,
                              "Runner " + cmd.runner_id() + " is not on base");
    if (cmd.has_defender_id()) {
        require_defender(state, cmd.defender_id());
    }

    // Compute
    StealResolution steal = resolve_steal(state.bases, cmd.runner_id(), cmd.success());

    Transition result{state, make_event(state, cmd.success() ? v1::EVENT_KIND_STEAL_SUCCESS
                                                             : v1::EVENT_KIND_STEAL_FAIL)};
    LivePlayState& next = result.state;
    next.bases = steal.after;

    if (cmd.success()) {
        if (steal.runs_scored > 0) {
            next.scoreboard[next.offense_team_id].credit_runs(next.inning, steal.runs_scored);
        }
    } else {
        next = record_out(std::move(next), false);
    }

    v1::GameEvent& event = result.event;
    event.set_runner_id(cmd.runner_id());
    if (cmd.has_defender_id()) {
        event.set_defender_id(cmd.defender_id());
    }
    *event.mutable_base_state_before() = steal.before.to_proto();
    *event.mutable_base_state_after() = steal.after.to_proto();
    event.set_runs_scored(steal.runs_scored);
    event.set_rbi(cmd.success() ? steal.runs_scored : 0);
    if (cmd.has_notes()) {
        event.set_notes(cmd.notes());
    }
    return result;
}

} // namespace handlers
} // namespace scorebook
