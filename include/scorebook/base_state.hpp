#pragma once

#include <array>
#include <optional>
#include <string>
#include "scorebook/v1/game.pb.h"

namespace scorebook {

/**
 * Occupancy of first, second and third base.
 *
 * Slot 0 is first base. A runner id appears in at most one slot.
 */
struct BaseState {
    static constexpr int kBases = 3;

    std::array<std::optional<std::string>, kBases> slots;

    const std::optional<std::string>& first() const { return slots[0]; }
    const std::optional<std::string>& second() const { return slots[1]; }
    const std::optional<std::string>& third() const { return slots[2]; }

    bool empty() const;
    int occupied_count() const;

    /// Slot index (0..2) holding the runner, -1 if not on base.
    int locate(const std::string& runner_id) const;

    bool operator==(const BaseState& other) const { return slots == other.slots; }
    bool operator!=(const BaseState& other) const { return !(*this == other); }

    v1::BaseState to_proto() const;
    static BaseState from_proto(const v1::BaseState& proto);

    static BaseState of(std::optional<std::string> first,
                        std::optional<std::string> second = std::nullopt,
                        std::optional<std::string> third = std::nullopt);
};

struct HitAdvance {
    BaseState before;
    BaseState after;
    int runs_scored = 0;
    int rbi = 0;
};

struct StealResolution {
    BaseState before;
    BaseState after;
    int runs_scored = 0;
};

/**
 * Move every runner `bases_advanced` bases (third first, then second, then
 * first) and place the batter. Runners carried past third score; on a
 * four-base hit the batter scores too.
 *
 * A batter still standing on a base leaves it before the runners move.
 *
 * Throws InvalidActionError if bases_advanced is outside 1..4 or the batter
 * id is empty.
 */
HitAdvance advance_for_hit(const BaseState& bases, int bases_advanced, const std::string& batter_id);

/**
 * Resolve a steal attempt.
 *
 * On failure the named runner is removed from their base (no-op if they hold
 * none). On success the lead runner advances one base, scoring from third.
 */
StealResolution resolve_steal(const BaseState& bases, const std::string& runner_id, bool success);

} // namespace scorebook
