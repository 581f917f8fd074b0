#include "error_handler.hpp"
#include "common.hpp"
#include "scorebook/rotation.hpp"

namespace scorebook {
namespace handlers {

Transition handle_error(const v1::RecordError& cmd, const LivePlayState& state) {
    // Guard
    guard_live(state);

    // Validate
    require_defender(state, cmd.defender_id());

    // Compute
    Transition result{state, make_event(state, v1::EVENT_KIND_ERROR)};
    result.event.set_defender_id(cmd.defender_id());
    if (cmd.has_notes()) {
        result.event.set_notes(cmd.notes());
    }

    result.state.scoreboard[result.state.defense_team_id].errors += 1;

    // An error on a two-strike count also retires the batter.
    if (state.strikes + 1 >= kStrikesPerOut) {
        result.state = record_out(std::move(result.state), true);
    } else {
        result.state.strikes += 1;
    }
    return result;
}

} // namespace handlers
} // namespace scorebook
