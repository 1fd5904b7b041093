#pragma once

#include "chronicle/store/Store.hh"

#include <optional>
#include <string>
#include <vector>

namespace chronicle {

// Read-side filter over a series' events. Entity constraints name in-source
// ids, so callers do not need to know store entity ids.
struct EventQuery {
    std::vector<EventKind> kinds;
    std::optional<std::int64_t> country;
    std::optional<std::int64_t> leader;
    std::optional<std::int64_t> system;
    std::optional<std::int64_t> planet;
    std::optional<std::int64_t> war;
    std::optional<std::int64_t> faction;
    std::optional<Day> from;
    std::optional<Day> to;
    bool knownOnly = false;
};

// Events matching the query, ordered by start day then creation. A country
// constraint matches either side of a two-country event. Unknown entities
// match nothing.
std::vector<HistoricalEvent> eventsFor(const Store& store, const std::string& seriesName, const EventQuery& query);

// Point-in-time records of one entity, ordered by day. Empty when the series
// or entity does not exist.
std::vector<SnapshotRecord> recordsFor(const Store& store, const std::string& seriesName, EntityKind kind,
                                       std::int64_t sourceId, std::string_view recordKind);

// One line per event, for the CLI and logs.
std::string describeEvent(const Store& store, SeriesId series, const HistoricalEvent& event);

} // namespace chronicle
