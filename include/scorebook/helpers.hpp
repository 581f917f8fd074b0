#pragma once

#include <string>
#include <google/protobuf/timestamp.pb.h>
#include "scorebook/v1/game.pb.h"

namespace scorebook {

/**
 * Helper functions for working with Scorebook wire types.
 */
namespace helpers {

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Generate a random RFC 4122 version 4 identifier.
 */
std::string new_id();

/**
 * Calendar year (UTC) of a timestamp.
 */
int utc_year(const google::protobuf::Timestamp& ts);

/**
 * Format a timestamp as ISO-8601 UTC, second precision.
 */
std::string iso8601(const google::protobuf::Timestamp& ts);

/**
 * Compare two events by content, ignoring id and timestamp.
 */
bool same_play(const v1::GameEvent& a, const v1::GameEvent& b);

/**
 * Lower-case wire name of an event kind ("single", "caught_out", ...).
 */
std::string event_kind_name(v1::EventKind kind);

/**
 * Lower-case wire name of a half ("top" or "bottom").
 */
std::string half_name(v1::Half half);

/**
 * Bases a hit event is worth, 0 for anything else.
 */
int bases_for(v1::EventKind kind);

} // namespace helpers
} // namespace scorebook
