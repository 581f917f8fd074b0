#include "scorebook/game_engine.hpp"
#include "scorebook/errors.hpp"
#include "scorebook/helpers.hpp"
#include "scorebook/logging.hpp"
#include "scorebook/reducer.hpp"
#include "scorebook/stats.hpp"

namespace scorebook {

namespace {

constexpr const char* kDomain = "game";

} // anonymous namespace

GameEngine::GameEngine(v1::GameSetup setup, LivePlayState initial, EngineOptions options)
    : setup_(std::move(setup))
    , options_(options)
    , initial_(initial)
    , state_(std::move(initial)) {}

GameEngine GameEngine::start(v1::GameSetup setup, const EngineOptions& options) {
    if (setup.game_id().empty()) {
        setup.set_game_id(helpers::new_id());
    }
    for (auto& team : *setup.mutable_teams()) {
        if (team.team_id().empty()) {
            team.set_team_id(helpers::new_id());
        }
    }
    if (!setup.has_start_time()) {
        *setup.mutable_start_time() = helpers::now();
    }

    auto initial = LivePlayState::initial(setup, setup.game_id(), options.default_planned_innings);
    log_info(kDomain, "game_started",
             {{"game_id", initial.game_id},
              {"mode", v1::GameMode_Name(initial.mode)},
              {"teams", initial.team_order},
              {"planned_innings", initial.planned_innings},
              {"start_time", helpers::iso8601(setup.start_time())}});
    return GameEngine(std::move(setup), std::move(initial), options);
}

GameEngine GameEngine::restore(const v1::GameSetup& setup, const std::vector<v1::GameEvent>& events,
                               const EngineOptions& options) {
    if (setup.game_id().empty()) {
        throw SetupError("Cannot restore a game without its game_id");
    }

    auto initial = LivePlayState::initial(setup, setup.game_id(), options.default_planned_innings);
    GameEngine engine(setup, initial, options);
    engine.state_ = replay(initial, events);
    engine.log_ = EventLog(events);

    log_info(kDomain, "game_restored",
             {{"game_id", engine.game_id()}, {"events", events.size()}});
    return engine;
}

void GameEngine::guard_live(const std::string& operation) const {
    if (state_.is_complete) {
        throw InvalidActionError::precondition_failed("Game " + state_.game_id +
                                                      " is complete; cannot " + operation);
    }
}

v1::GameEvent GameEngine::apply(const v1::ScoringAction& action) {
    guard_live("apply an action");

    auto next = reduce(state_, action);
    next.event.set_id(helpers::new_id());
    *next.event.mutable_timestamp() = helpers::now();

    log_.append(next.event);
    state_ = std::move(next.state);
    return next.event;
}

v1::GameEvent GameEngine::apply_hit(v1::HitKind kind) {
    v1::ScoringAction action;
    action.mutable_hit()->set_kind(kind);
    return apply(action);
}

v1::GameEvent GameEngine::apply_strike() {
    v1::ScoringAction action;
    action.mutable_strike();
    return apply(action);
}

v1::GameEvent GameEngine::apply_error(const std::string& defender_id) {
    v1::ScoringAction action;
    action.mutable_error()->set_defender_id(defender_id);
    return apply(action);
}

v1::GameEvent GameEngine::apply_caught_out(const std::string& defender_id) {
    v1::ScoringAction action;
    action.mutable_caught_out()->set_defender_id(defender_id);
    return apply(action);
}

v1::GameEvent GameEngine::apply_steal(const std::string& runner_id,
                                      const std::optional<std::string>& defender_id, bool success) {
    v1::ScoringAction action;
    auto* steal = action.mutable_steal();
    steal->set_runner_id(runner_id);
    if (defender_id) steal->set_defender_id(*defender_id);
    steal->set_success(success);
    return apply(action);
}

bool GameEngine::undo_last() {
    guard_live("undo");
    if (log_.empty()) {
        return false;
    }

    // Rebuild before touching the log so a failed replay leaves the engine as it was.
    std::vector<v1::GameEvent> remaining(log_.events().begin(), log_.events().end() - 1);
    auto rebuilt = replay(initial_, remaining);

    auto undone = log_.pop_back();
    state_ = std::move(rebuilt);

    log_info(kDomain, "undo",
             {{"game_id", state_.game_id},
              {"event_id", undone.id()},
              {"event_type", helpers::event_kind_name(undone.event_type())},
              {"inning", undone.inning()},
              {"half", helpers::half_name(undone.half())}});
    return true;
}

v1::GameInfo GameEngine::game_info() const {
    v1::GameInfo info;
    info.set_id(state_.game_id);
    info.set_mode(state_.mode);
    info.set_league_id(state_.league_id);
    *info.mutable_start_time() = setup_.start_time();
    for (const auto& team_id : state_.team_order) {
        info.add_team_order(team_id);
    }
    for (const auto& [team_id, totals] : state_.scoreboard) {
        (*info.mutable_final_score())[team_id] = totals.runs;
    }
    for (const auto& [team_id, label] : state_.team_labels) {
        (*info.mutable_team_labels())[team_id] = label;
    }
    return info;
}

v1::GameRecord GameEngine::complete_game() {
    guard_live("complete it again");
    state_.is_complete = true;

    v1::GameRecord record;
    *record.mutable_setup() = setup_;
    *record.mutable_game() = game_info();
    *record.mutable_final_state() = state_.to_proto();
    for (const auto& event : log_.events()) {
        *record.add_events() = event;
    }
    *record.mutable_summary() = summarize(record.game(), state_, log_.events());
    *record.mutable_completed_at() = helpers::now();

    log_info(kDomain, "game_completed",
             {{"game_id", state_.game_id},
              {"events", log_.size()},
              {"total_runs", state_.total_runs()}});
    return record;
}

} // namespace scorebook
