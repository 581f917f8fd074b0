#include "scorebook/base_state.hpp"
#include "scorebook/validation.hpp"

namespace scorebook {

namespace {

// Home plate sits one past third.
constexpr int kHome = BaseState::kBases;

void set_optional(std::optional<std::string>& slot, bool present, const std::string& value) {
    if (present) {
        slot = value;
    } else {
        slot.reset();
    }
}

} // anonymous namespace

bool BaseState::empty() const {
    return occupied_count() == 0;
}

int BaseState::occupied_count() const {
    int count = 0;
    for (const auto& slot : slots) {
        if (slot) ++count;
    }
    return count;
}

int BaseState::locate(const std::string& runner_id) const {
    for (int i = 0; i < kBases; ++i) {
        if (slots[i] && *slots[i] == runner_id) {
            return i;
        }
    }
    return -1;
}

v1::BaseState BaseState::to_proto() const {
    v1::BaseState proto;
    if (slots[0]) proto.set_first(*slots[0]);
    if (slots[1]) proto.set_second(*slots[1]);
    if (slots[2]) proto.set_third(*slots[2]);
    return proto;
}

BaseState BaseState::from_proto(const v1::BaseState& proto) {
    BaseState bases;
    set_optional(bases.slots[0], proto.has_first(), proto.first());
    set_optional(bases.slots[1], proto.has_second(), proto.second());
    set_optional(bases.slots[2], proto.has_third(), proto.third());
    return bases;
}

BaseState BaseState::of(std::optional<std::string> first,
                        std::optional<std::string> second,
                        std::optional<std::string> third) {
    BaseState bases;
    bases.slots[0] = std::move(first);
    bases.slots[1] = std::move(second);
    bases.slots[2] = std::move(third);
    return bases;
}

HitAdvance advance_for_hit(const BaseState& bases, int bases_advanced, const std::string& batter_id) {
    validation::require_in_range(bases_advanced, 1, 4, "bases_advanced");
    validation::require_not_empty(batter_id, "batter_id");

    HitAdvance result;
    result.before = bases;

    // A batter still on base from an earlier trip leaves that base to bat again.
    BaseState runners = bases;
    int own_base = runners.locate(batter_id);
    if (own_base >= 0) {
        runners.slots[own_base].reset();
    }

    for (int from = kHome - 1; from >= 0; --from) {
        const auto& occupant = runners.slots[from];
        if (!occupant) continue;

        int destination = from + bases_advanced;
        if (destination >= kHome) {
            result.runs_scored += 1;
        } else {
            result.after.slots[destination] = occupant;
        }
    }

    if (bases_advanced >= 4) {
        result.runs_scored += 1;
    } else {
        result.after.slots[bases_advanced - 1] = batter_id;
    }

    result.rbi = result.runs_scored;
    return result;
}

StealResolution resolve_steal(const BaseState& bases, const std::string& runner_id, bool success) {
    StealResolution result;
    result.before = bases;
    result.after = bases;

    if (!success) {
        int origin = bases.locate(runner_id);
        if (origin >= 0) {
            result.after.slots[origin].reset();
        }
        return result;
    }

    // Only the lead runner moves.
    for (int from = kHome - 1; from >= 0; --from) {
        if (!bases.slots[from]) continue;

        std::string occupant = *bases.slots[from];
        result.after.slots[from].reset();
        if (from + 1 >= kHome) {
            result.runs_scored = 1;
        } else {
            result.after.slots[from + 1] = occupant;
        }
        break;
    }
    return result;
}

} // namespace scorebook
