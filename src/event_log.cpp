#include "scorebook/event_log.hpp"
#include "scorebook/errors.hpp"

namespace scorebook {

v1::GameEvent EventLog::pop_back() {
    if (events_.empty()) {
        throw InvalidActionError::precondition_failed("Event log is empty");
    }
    v1::GameEvent event = std::move(events_.back());
    events_.pop_back();
    return event;
}

int EventLog::total_runs() const {
    int total = 0;
    for (const auto& event : events_) {
        total += event.runs_scored();
    }
    return total;
}

std::vector<v1::GameEvent> EventLog::recent(std::size_t limit) const {
    std::vector<v1::GameEvent> result;
    for (auto it = events_.rbegin(); it != events_.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

} // namespace scorebook
