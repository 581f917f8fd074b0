#include "scorebook/reducer.hpp"
#include "scorebook/errors.hpp"
#include "scorebook/helpers.hpp"

#include "handlers/caught_out_handler.hpp"
#include "handlers/error_handler.hpp"
#include "handlers/hit_handler.hpp"
#include "handlers/steal_handler.hpp"
#include "handlers/strike_handler.hpp"

namespace scorebook {

Transition reduce(const LivePlayState& state, const v1::ScoringAction& action) {
    switch (action.action_case()) {
        case v1::ScoringAction::kHit:
            return handlers::handle_hit(action.hit(), state);
        case v1::ScoringAction::kStrike:
            return handlers::handle_strike(action.strike(), state);
        case v1::ScoringAction::kError:
            return handlers::handle_error(action.error(), state);
        case v1::ScoringAction::kCaughtOut:
            return handlers::handle_caught_out(action.caught_out(), state);
        case v1::ScoringAction::kSteal:
            return handlers::handle_steal(action.steal(), state);
        case v1::ScoringAction::ACTION_NOT_SET:
            throw InvalidActionError::invalid_argument("Scoring action has no action set");
    }
    throw InvalidActionError::invalid_argument("Unknown scoring action");
}

v1::ScoringAction action_from_event(const v1::GameEvent& event) {
    v1::ScoringAction action;
    switch (event.event_type()) {
        case v1::EVENT_KIND_SINGLE:
        case v1::EVENT_KIND_DOUBLE:
        case v1::EVENT_KIND_TRIPLE:
        case v1::EVENT_KIND_HOMERUN: {
            auto* hit = action.mutable_hit();
            hit->set_kind(static_cast<v1::HitKind>(helpers::bases_for(event.event_type())));
            if (event.has_notes()) hit->set_notes(event.notes());
            return action;
        }
        case v1::EVENT_KIND_STRIKE:
        case v1::EVENT_KIND_STRIKEOUT: {
            auto* strike = action.mutable_strike();
            if (event.has_notes()) strike->set_notes(event.notes());
            return action;
        }
        case v1::EVENT_KIND_ERROR: {
            auto* error = action.mutable_error();
            error->set_defender_id(event.defender_id());
            if (event.has_notes()) error->set_notes(event.notes());
            return action;
        }
        case v1::EVENT_KIND_CAUGHT_OUT: {
            auto* caught = action.mutable_caught_out();
            caught->set_defender_id(event.defender_id());
            if (event.has_notes()) caught->set_notes(event.notes());
            return action;
        }
        case v1::EVENT_KIND_STEAL_SUCCESS:
        case v1::EVENT_KIND_STEAL_FAIL: {
            auto* steal = action.mutable_steal();
            steal->set_runner_id(event.runner_id());
            if (event.has_defender_id()) steal->set_defender_id(event.defender_id());
            steal->set_success(event.event_type() == v1::EVENT_KIND_STEAL_SUCCESS);
            if (event.has_notes()) steal->set_notes(event.notes());
            return action;
        }
        case v1::EVENT_KIND_UNSPECIFIED:
            throw ReplayError("Event " + event.id() + " has no event type");
    }
    throw ReplayError("Event " + event.id() + " has unknown event type " +
                      std::to_string(static_cast<int>(event.event_type())));
}

LivePlayState replay(const LivePlayState& initial, const std::vector<v1::GameEvent>& events) {
    LivePlayState state = initial;
    for (const auto& event : events) {
        if (event.game_id() != state.game_id) {
            throw ReplayError("Event " + event.id() + " belongs to game " + event.game_id() +
                              ", not " + state.game_id);
        }

        Transition next;
        try {
            next = reduce(state, action_from_event(event));
        } catch (const InvalidActionError& e) {
            throw ReplayError("Event " + event.id() + " was rejected on replay: " + e.what());
        }

        if (!helpers::same_play(next.event, event)) {
            throw ReplayError("Event " + event.id() + " (" + helpers::event_kind_name(event.event_type()) +
                              ") does not match the state it was recorded in");
        }
        state = std::move(next.state);
    }
    return state;
}

} // namespace scorebook
