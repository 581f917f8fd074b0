#pragma once

#include <vector>
#include "scorebook/live_play_state.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {

struct AggregateResult {
    std::vector<v1::PlayerStatsRow> rows;
    /// Events dropped because their game was not supplied.
    int skipped_events = 0;
};

struct TeamAggregateResult {
    std::vector<v1::TeamStatsRow> rows;
    int skipped_events = 0;
};

/**
 * Fold the events selected by `scope` into one leaderboard row per player.
 *
 * Per-game records of the same person merge on their identity key (or
 * lower-cased display name). Guests never merge and are reported only when
 * the scope is a single game. Events whose game is missing from `games` are
 * skipped and counted; players missing from `players` lose only their own
 * credit. Rows are sorted descending by `sort_key`; an unspecified key sorts
 * by slugging.
 */
AggregateResult aggregate(const std::vector<v1::GameEvent>& events,
                          const std::vector<v1::GameInfo>& games,
                          const std::vector<v1::PlayerIdentity>& players,
                          const v1::StatScope& scope,
                          v1::StatKey sort_key = v1::STAT_KEY_SLUGGING);

/**
 * Fold the same events per team, attributing each credit to the team the
 * credited player was listed under. Game counts, average score and
 * win/loss records come from the scoped games' final scores. Rows are sorted
 * by slugging, highest first.
 */
TeamAggregateResult aggregate_teams(const std::vector<v1::GameEvent>& events,
                                    const std::vector<v1::GameInfo>& games,
                                    const std::vector<v1::PlayerIdentity>& players,
                                    const v1::StatScope& scope);

/// Value of `key` in `stats`, widened to double for sorting.
double stat_value(const v1::PlayerStats& stats, v1::StatKey key);

/**
 * Box score for a game: final score, runs per inning for the team batting in
 * the top half and the team batting in the bottom half, and up to three top
 * performers by slugging among players with an at-bat.
 */
v1::GameSummary summarize(const v1::GameInfo& game, const LivePlayState& state,
                          const std::vector<v1::GameEvent>& events);

/// Scope covering every supplied game.
v1::StatScope overall_scope();

/// Scope covering a single game.
v1::StatScope game_scope(const std::string& game_id);

} // namespace scorebook
