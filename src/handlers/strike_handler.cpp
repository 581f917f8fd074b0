#include "strike_handler.hpp"
#include "common.hpp"
#include "scorebook/rotation.hpp"

namespace scorebook {
namespace handlers {

Transition handle_strike(const v1::RecordStrike& cmd, const LivePlayState& state) {
    // Guard
    guard_live(state);

    // Compute
    bool strikeout = state.strikes + 1 >= kStrikesPerOut;
    Transition result{state, make_event(state, strikeout ? v1::EVENT_KIND_STRIKEOUT : v1::EVENT_KIND_STRIKE)};

    if (strikeout) {
        result.state = record_out(std::move(result.state), true);
    } else {
        result.state.strikes += 1;
    }

    if (cmd.has_notes()) {
        result.event.set_notes(cmd.notes());
    }
    return result;
}

} // namespace handlers
} // namespace scorebook
