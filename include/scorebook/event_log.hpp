#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "scorebook/v1/game.pb.h"

namespace scorebook {

/**
 * Ordered record of the scoring events of one game.
 *
 * Events are never edited once appended. Undo removes the newest event as a
 * whole; nothing else shrinks the log.
 */
class EventLog {
public:
    EventLog() = default;
    explicit EventLog(std::vector<v1::GameEvent> events) : events_(std::move(events)) {}

    void append(v1::GameEvent event) { events_.push_back(std::move(event)); }

    /// Remove and return the newest event. The log must not be empty.
    v1::GameEvent pop_back();

    const std::vector<v1::GameEvent>& events() const { return events_; }
    const v1::GameEvent& back() const { return events_.back(); }
    bool empty() const { return events_.empty(); }
    std::size_t size() const { return events_.size(); }

    /// Sum of runs_scored over every event.
    int total_runs() const;

    /// The newest `limit` events, newest first.
    std::vector<v1::GameEvent> recent(std::size_t limit) const;

private:
    std::vector<v1::GameEvent> events_;
};

} // namespace scorebook
