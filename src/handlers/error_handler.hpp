#pragma once

#include "scorebook/reducer.hpp"
#include "scorebook/v1/game.pb.h"

namespace scorebook {
namespace handlers {

/// Handle RecordError: a fielding error charged to the defending team.
Transition handle_error(const v1::RecordError& cmd, const LivePlayState& state);

} // namespace handlers
} // namespace scorebook
