#pragma once

#include "scorebook/reducer.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace handlers {

/// Handle RecordStrike: a called strike, converting to a strikeout on the third.
Transition handle_strike(const v1::RecordStrike& cmd, const LivePlayState& state);

} // namespace handlers
} // namespace scorebook
