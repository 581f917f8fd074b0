#pragma once

#include <map>
#include <string>
#include <vector>
#include "scorebook/base_state.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {

struct LineupSlot {
    std::string player_id;
    v1::PlayerIdentity identity;
    int batting_order = 0;

    bool operator==(const LineupSlot& other) const;
};

/// Batting order for one team with a circular cursor on the current batter.
struct Lineup {
    std::string team_id;
    std::vector<LineupSlot> slots;
    int current_index = 0;

    bool empty() const { return slots.empty(); }
    int size() const { return static_cast<int>(slots.size()); }
    const LineupSlot& current_batter() const;
    bool contains(const std::string& player_id) const;

    bool operator==(const Lineup& other) const;
    bool operator!=(const Lineup& other) const { return !(*this == other); }

    v1::Lineup to_proto() const;
};

struct TeamTotals {
    int runs = 0;
    int hits = 0;
    int errors = 0;
    std::map<int, int> inning_runs;

    void credit_runs(int inning, int runs_scored);

    bool operator==(const TeamTotals& other) const;
    bool operator!=(const TeamTotals& other) const { return !(*this == other); }

    v1::TeamTotals to_proto() const;
};

/**
 * The current play: inning, half, count, bases, scoreboard and lineups.
 *
 * Reducers take it by const reference and return a new value; the engine
 * holds the only live copy.
 */
struct LivePlayState {
    std::string game_id;
    v1::GameMode mode = v1::GAME_MODE_FRIENDLY;
    std::string league_id;
    std::map<std::string, std::string> team_labels;
    std::vector<std::string> team_order;
    int inning = 1;
    v1::Half half = v1::HALF_TOP;
    int outs = 0;
    int strikes = 0;
    std::string offense_team_id;
    std::string defense_team_id;
    BaseState bases;
    std::map<std::string, TeamTotals> scoreboard;
    std::map<std::string, Lineup> lineups;
    int planned_innings = 1;
    bool is_complete = false;

    const Lineup& offense_lineup() const;
    const Lineup& defense_lineup() const;
    const LineupSlot& current_batter() const { return offense_lineup().current_batter(); }

    /// Sum of runs over every team on the scoreboard.
    int total_runs() const;

    /// Every player in both lineups, in team order then batting order.
    std::vector<v1::PlayerIdentity> roster() const;

    bool operator==(const LivePlayState& other) const;
    bool operator!=(const LivePlayState& other) const { return !(*this == other); }

    v1::LivePlayState to_proto() const;

    /**
     * Fresh state for a new game: inning 1, top half, empty bases, no outs.
     * The first team in the setup bats first.
     *
     * Throws SetupError if the setup does not describe two distinct teams
     * with non-empty lineups of uniquely identified players.
     */
    static LivePlayState initial(const v1::GameSetup& setup, const std::string& game_id,
                                 int default_planned_innings = 1);
};

} // namespace scorebook
