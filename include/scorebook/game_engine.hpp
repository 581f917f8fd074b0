#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "scorebook/event_log.hpp"
#include "scorebook/live_play_state.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {

struct EngineOptions {
    /// Used when the setup leaves planned_innings at zero.
    int default_planned_innings = 1;
    std::size_t recent_plays = 6;
};

/**
 * Single-game scoring engine.
 *
 * Owns the live state and the event log of one game. Every accepted action
 * appends exactly one event; a rejected action throws and changes nothing.
 * The engine is not thread-safe; callers serialize access.
 */
class GameEngine {
public:
    /**
     * Start a new game. Missing game and team ids are generated, and a
     * missing start time is set to now.
     *
     * Throws SetupError if the setup does not describe a playable game.
     */
    static GameEngine start(v1::GameSetup setup, const EngineOptions& options = EngineOptions{});

    /**
     * Rebuild an engine from a stored setup and its events. The setup must
     * carry its game id.
     *
     * Throws SetupError for a bad setup and ReplayError if the events do not
     * reproduce.
     */
    static GameEngine restore(const v1::GameSetup& setup, const std::vector<v1::GameEvent>& events,
                              const EngineOptions& options = EngineOptions{});

    const LivePlayState& state() const { return state_; }
    const LivePlayState& initial_state() const { return initial_; }
    const EventLog& log() const { return log_; }
    const v1::GameSetup& setup() const { return setup_; }
    const std::string& game_id() const { return state_.game_id; }
    bool is_complete() const { return state_.is_complete; }

    /// Apply one scoring action and return the appended event.
    v1::GameEvent apply(const v1::ScoringAction& action);

    v1::GameEvent apply_hit(v1::HitKind kind);
    v1::GameEvent apply_strike();
    v1::GameEvent apply_error(const std::string& defender_id);
    v1::GameEvent apply_caught_out(const std::string& defender_id);
    v1::GameEvent apply_steal(const std::string& runner_id, const std::optional<std::string>& defender_id,
                              bool success);

    /**
     * Remove the newest event and rebuild the state from the rest.
     * Returns false, changing nothing, when the log is empty.
     */
    bool undo_last();

    /// Newest events first, at most `limit` of them.
    std::vector<v1::GameEvent> recent_plays(std::size_t limit) const { return log_.recent(limit); }
    std::vector<v1::GameEvent> recent_plays() const { return log_.recent(options_.recent_plays); }

    /// Game metadata with the current score.
    v1::GameInfo game_info() const;

    /**
     * Freeze the game and return everything needed to persist it. Further
     * actions, undo and a second completion are rejected.
     */
    v1::GameRecord complete_game();

private:
    GameEngine(v1::GameSetup setup, LivePlayState initial, EngineOptions options);

    void guard_live(const std::string& operation) const;

    v1::GameSetup setup_;
    EngineOptions options_;
    LivePlayState initial_;
    LivePlayState state_;
    EventLog log_;
};

} // namespace scorebook
