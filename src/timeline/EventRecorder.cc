#include "chronicle/timeline/EventRecorder.hh"

#include <algorithm>

namespace chronicle {

std::string_view factChangeToString(FactChange change) {
    switch (change) {
    case FactChange::Unchanged:
        return "unchanged";
    case FactChange::Opened:
        return "opened";
    case FactChange::Changed:
        return "changed";
    case FactChange::Closed:
        return "closed";
    }
    return "unchanged";
}

void closeEvent(const EventScope& scope, HistoricalEvent& event) {
    if (!event.isOpen()) {
        return;
    }
    event.end = std::max(event.start, scope.day - 1);
    scope.store.updateEvent(scope.series, event);
}

bool widenVisibility(const EventScope& scope, HistoricalEvent& event, bool known) {
    if (!known || event.knownToObserver) {
        return false;
    }
    event.knownToObserver = true;
    scope.store.updateEvent(scope.series, event);
    return true;
}

FactChange recordContinuousFact(const EventScope& scope, const EventFilter& factKey, EventKind kind,
                                const std::optional<EventSubject>& current, bool known) {
    EventFilter openKey = factKey;
    openKey.openOnly = true;
    auto previous = scope.store.latestEvent(scope.series, openKey);

    if (previous && current && previous->kind == kind && previous->subject == *current) {
        widenVisibility(scope, *previous, known);
        return FactChange::Unchanged;
    }

    if (previous) {
        closeEvent(scope, *previous);
    }
    if (!current) {
        return previous ? FactChange::Closed : FactChange::Unchanged;
    }

    HistoricalEvent event;
    event.kind = kind;
    event.start = scope.day;
    event.subject = *current;
    event.knownToObserver = known;
    scope.store.appendEvent(scope.series, std::move(event));
    return previous ? FactChange::Changed : FactChange::Opened;
}

MomentaryResult recordMomentaryEvent(const EventScope& scope, EventKind kind, const EventSubject& subject,
                                     bool known) {
    return recordMomentaryEvent(scope, kind, subject, known, scope.day, scope.day);
}

MomentaryResult recordMomentaryEvent(const EventScope& scope, EventKind kind, const EventSubject& subject,
                                     bool known, Day start, std::optional<Day> end) {
    if (auto existing = scope.store.latestEvent(scope.series, EventFilter::forSubject(kind, subject))) {
        widenVisibility(scope, *existing, known);
        return {*existing, false};
    }

    HistoricalEvent event;
    event.kind = kind;
    event.start = start;
    event.end = end;
    event.subject = subject;
    event.knownToObserver = known;
    return {scope.store.appendEvent(scope.series, std::move(event)), true};
}

} // namespace chronicle
