#pragma once

#include "scorebook/live_play_state.hpp"

namespace scorebook {

constexpr int kOutsPerHalf = 3;
constexpr int kStrikesPerOut = 3;

/**
 * Move the batting cursor to the next slot, wrapping at the end of the order.
 * Throws SetupError on an empty lineup.
 */
Lineup advance_batter(Lineup lineup);

/**
 * End the half-inning: flip the half, bump the inning after the bottom half,
 * clear count and bases, and swap offense with defense. Planned innings grow
 * to cover extra innings.
 */
LivePlayState rotate_sides(LivePlayState state);

/**
 * Record one out against the batting team, advancing the batter when the out
 * ends their turn at the plate. Rotates once outs reach three.
 */
LivePlayState record_out(LivePlayState state, bool batter_done);

} // namespace scorebook
