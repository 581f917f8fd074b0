#include "caught_out_handler.hpp"
#include "common.hpp"
#include "scorebook/rotation.hpp"

namespace scorebook {
namespace handlers {

Transition handle_caught_out(const v1::RecordCaughtOut& cmd, const LivePlayState& state) {
    // Guard
    guard_live(state);

    // Validate
    require_defender(state, cmd.defender_id());

    // Compute
    Transition result{state, make_event(state, v1::EVENT_KIND_CAUGHT_OUT)};
    result.event.set_defender_id(cmd.defender_id());
    if (cmd.has_notes()) {
        result.event.set_notes(cmd.notes());
    }

    result.state = record_out(std::move(result.state), true);
    return result;
}

} // namespace handlers
} // namespace scorebook
