#pragma once

#include "scorebook/reducer.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace handlers {

/// Handle RecordHit: single, double, triple or homerun.
Transition handle_hit(const v1::RecordHit& cmd, const LivePlayState& state);

} // namespace handlers
} // namespace scorebook
