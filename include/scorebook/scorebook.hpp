#pragma once

/**
 * Scorebook scoring engine
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"
#include "logging.hpp"

// Validation helpers
#include "validation.hpp"

// Scoring model
#include "base_state.hpp"
#include "live_play_state.hpp"
#include "rotation.hpp"
#include "event_log.hpp"
#include "reducer.hpp"

// Engine and statistics
#include "game_engine.hpp"
#include "stats.hpp"
#include "archive.hpp"

// Server settings
#include "config.hpp"
