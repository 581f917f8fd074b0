#pragma once

#include "scorebook/reducer.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace handlers {

/// Handle RecordSteal: a runner's steal attempt, successful or not.
Transition handle_steal(const v1::RecordSteal& cmd, const LivePlayState& state);

} // namespace handlers
} // namespace scorebook
