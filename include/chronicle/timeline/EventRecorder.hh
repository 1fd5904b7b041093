#pragma once

#include "chronicle/store/Store.hh"

#include <optional>

namespace chronicle {

// Where and when event writes land.
struct EventScope {
    Store& store;
    SeriesId series;
    Day day;
};

enum class FactChange : uint8_t { Unchanged, Opened, Changed, Closed };

std::string_view factChangeToString(FactChange change);

// Continuous fact ("holds office", "owns system"). `factKey` selects the
// events that describe the fact, whatever its current value; `current` is
// the subject the fact has now, or nullopt when it no longer holds.
//
// The open event is left open while its subject is unchanged. A different
// subject closes it with end = day - 1 and opens a new event at `day`.
FactChange recordContinuousFact(const EventScope& scope, const EventFilter& factKey, EventKind kind,
                                const std::optional<EventSubject>& current, bool known);

struct MomentaryResult {
    HistoricalEvent event;
    bool created = false;
};

// Momentary event keyed by (kind, subject). Recorded at most once; a later
// call with the same key only widens visibility. This overload stores an
// instant [day, day].
MomentaryResult recordMomentaryEvent(const EventScope& scope, EventKind kind, const EventSubject& subject,
                                     bool known);

// Same, with an explicit start and an optional end (open while running).
MomentaryResult recordMomentaryEvent(const EventScope& scope, EventKind kind, const EventSubject& subject,
                                     bool known, Day start, std::optional<Day> end);

// Sets end = max(start, day - 1) on an open event.
void closeEvent(const EventScope& scope, HistoricalEvent& event);

// Visibility only ever goes from unknown to known.
bool widenVisibility(const EventScope& scope, HistoricalEvent& event, bool known);

} // namespace chronicle
