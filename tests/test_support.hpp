#pragma once

#include <string>
#include <vector>
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace fixtures {

// 2024-06-01T00:00:00Z and 2025-06-01T00:00:00Z
constexpr long long kJune2024 = 1717200000LL;
constexpr long long kJune2025 = 1748736000LL;

inline v1::PlayerIdentity player(const std::string& id, const std::string& name,
                                 const std::string& identity_key = "", bool guest = false) {
    v1::PlayerIdentity identity;
    identity.set_id(id);
    identity.set_display_name(name);
    identity.set_identity_key(identity_key);
    identity.set_is_guest(guest);
    return identity;
}

inline v1::TeamSetup team(const std::string& team_id, const std::string& label,
                          const std::vector<v1::PlayerIdentity>& players) {
    v1::TeamSetup setup;
    setup.set_team_id(team_id);
    setup.set_label(label);
    for (const auto& p : players) {
        *setup.add_players() = p;
    }
    return setup;
}

/// Red (r1..r3) bats first against Blue (b1..b3).
inline v1::GameSetup red_vs_blue(const std::string& game_id = "g1") {
    v1::GameSetup setup;
    setup.set_mode(v1::GAME_MODE_FRIENDLY);
    setup.set_game_id(game_id);
    setup.mutable_start_time()->set_seconds(kJune2025);
    *setup.add_teams() = team("red", "Red Sox",
                              {player("r1", "Alice", "alice"), player("r2", "Bob", "bob"),
                               player("r3", "Cara", "cara")});
    *setup.add_teams() = team("blue", "Blue Jays",
                              {player("b1", "Dan", "dan"), player("b2", "Eve", "eve"),
                               player("b3", "Finn", "finn")});
    return setup;
}

inline v1::ScoringAction hit(v1::HitKind kind) {
    v1::ScoringAction action;
    action.mutable_hit()->set_kind(kind);
    return action;
}

inline v1::ScoringAction strike() {
    v1::ScoringAction action;
    action.mutable_strike();
    return action;
}

inline v1::ScoringAction error(const std::string& defender_id) {
    v1::ScoringAction action;
    action.mutable_error()->set_defender_id(defender_id);
    return action;
}

inline v1::ScoringAction caught_out(const std::string& defender_id) {
    v1::ScoringAction action;
    action.mutable_caught_out()->set_defender_id(defender_id);
    return action;
}

inline v1::ScoringAction steal(const std::string& runner_id, bool success,
                               const std::string& defender_id = "") {
    v1::ScoringAction action;
    auto* s = action.mutable_steal();
    s->set_runner_id(runner_id);
    s->set_success(success);
    if (!defender_id.empty()) s->set_defender_id(defender_id);
    return action;
}

inline v1::GameInfo game_info(const std::string& id, long long start_seconds,
                              v1::GameMode mode = v1::GAME_MODE_FRIENDLY,
                              const std::string& league_id = "") {
    v1::GameInfo info;
    info.set_id(id);
    info.set_mode(mode);
    info.set_league_id(league_id);
    info.mutable_start_time()->set_seconds(start_seconds);
    return info;
}

/// Hand-built event for aggregation tests.
inline v1::GameEvent event(const std::string& game_id, v1::EventKind kind, const std::string& batter_id,
                           const std::string& defender_id = "", const std::string& runner_id = "",
                           int rbi = 0) {
    v1::GameEvent e;
    e.set_game_id(game_id);
    e.set_event_type(kind);
    e.set_inning(1);
    e.set_half(v1::HALF_TOP);
    e.set_batter_id(batter_id);
    if (!defender_id.empty()) e.set_defender_id(defender_id);
    if (!runner_id.empty()) e.set_runner_id(runner_id);
    e.set_rbi(rbi);
    e.set_runs_scored(rbi);
    return e;
}

} // namespace fixtures
} // namespace scorebook
