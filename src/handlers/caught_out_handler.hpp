#pragma once

#include "scorebook/reducer.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace handlers {

/// Handle RecordCaughtOut: the batter is out on a catch.
Transition handle_caught_out(const v1::RecordCaughtOut& cmd, const LivePlayState& state);

} // namespace handlers
} // namespace scorebook
