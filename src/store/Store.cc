#include "chronicle/store/Store.hh"

#include "chronicle/core/Log.hh"

namespace chronicle {

std::optional<HistoricalEvent> Store::latestEvent(SeriesId series, const EventFilter& filter) const {
    auto matching = events(series, filter);
    if (matching.empty()) {
        return std::nullopt;
    }
    return matching.back();
}

HistoricalEvent Store::appendOrExtendEvent(SeriesId series, EventKind kind, const EventSubject& subject, Day start,
                                           std::optional<Day> end, bool knownToObserver) {
    auto filter = EventFilter::forSubject(kind, subject);
    filter.openOnly = true;

    if (auto open = latestEvent(series, filter)) {
        bool changed = false;
        if (end) {
            open->end = end;
            changed = true;
        }
        if (knownToObserver && !open->knownToObserver) {
            open->knownToObserver = true;
            changed = true;
        }
        if (changed) {
            updateEvent(series, *open);
        }
        return *open;
    }

    HistoricalEvent event;
    event.kind = kind;
    event.start = start;
    event.end = end;
    event.subject = subject;
    event.knownToObserver = knownToObserver;
    return appendEvent(series, std::move(event));
}

std::mutex& Store::seriesMutex(SeriesId series) {
    std::lock_guard<std::mutex> lock(lockTableMutex_);
    auto& slot = seriesMutexes_[series];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

Store::SeriesLock::SeriesLock(Store& store, SeriesId series) : lock_(store.seriesMutex(series)) {
    CHRONICLE_STORE_LOG_DEBUG("Acquired write lock for series {}", series);
}

} // namespace chronicle
