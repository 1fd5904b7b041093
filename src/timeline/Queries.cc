#include "chronicle/timeline/Queries.hh"

#include <algorithm>
#include <map>
#include <sstream>

namespace chronicle {

namespace {

// Store id of an in-source entity. nullopt when no constraint was given,
// kNoEntity when the entity is unknown.
std::optional<EntityId> resolve(const Store& store, SeriesId series, EntityKind kind,
                                const std::optional<std::int64_t>& sourceId) {
    if (!sourceId) {
        return std::nullopt;
    }
    auto entity = store.findEntity(series, kind, *sourceId);
    return entity ? entity->id : kNoEntity;
}

std::string entityLabel(const Store& store, SeriesId series, EntityId id) {
    auto entity = store.getEntity(series, id);
    if (!entity) {
        return "#" + std::to_string(id);
    }
    return entity->attrString("name", std::string(entityKindToString(entity->kind)) + " " +
                                          std::to_string(entity->sourceId));
}

} // namespace

std::vector<HistoricalEvent> eventsFor(const Store& store, const std::string& seriesName, const EventQuery& query) {
    auto series = store.findSeries(seriesName);
    if (!series) {
        return {};
    }

    EventFilter filter;
    filter.kinds = query.kinds;
    filter.leader = resolve(store, *series, EntityKind::Leader, query.leader);
    filter.system = resolve(store, *series, EntityKind::System, query.system);
    filter.planet = resolve(store, *series, EntityKind::Planet, query.planet);
    filter.war = resolve(store, *series, EntityKind::War, query.war);
    filter.faction = resolve(store, *series, EntityKind::Faction, query.faction);
    filter.from = query.from;
    filter.to = query.to;
    filter.knownOnly = query.knownOnly;

    std::map<EventId, HistoricalEvent> found;
    if (auto country = resolve(store, *series, EntityKind::Country, query.country)) {
        EventFilter asCountry = filter;
        asCountry.country = *country;
        EventFilter asTarget = filter;
        asTarget.targetCountry = *country;
        for (const auto* side : {&asCountry, &asTarget}) {
            for (auto& event : store.events(*series, *side)) {
                found.emplace(event.id, std::move(event));
            }
        }
    } else {
        for (auto& event : store.events(*series, filter)) {
            found.emplace(event.id, std::move(event));
        }
    }

    std::vector<HistoricalEvent> events;
    events.reserve(found.size());
    for (auto& [id, event] : found) {
        events.push_back(std::move(event));
    }
    std::stable_sort(events.begin(), events.end(),
                     [](const HistoricalEvent& a, const HistoricalEvent& b) { return a.start < b.start; });
    return events;
}

std::vector<SnapshotRecord> recordsFor(const Store& store, const std::string& seriesName, EntityKind kind,
                                       std::int64_t sourceId, std::string_view recordKind) {
    auto series = store.findSeries(seriesName);
    if (!series) {
        return {};
    }
    auto entity = store.findEntity(*series, kind, sourceId);
    if (!entity) {
        return {};
    }
    return store.records(*series, entity->id, recordKind);
}

std::string describeEvent(const Store& store, SeriesId series, const HistoricalEvent& event) {
    std::ostringstream out;
    out << daysToDate(event.start) << " - " << (event.end ? daysToDate(*event.end) : std::string("ongoing")) << " "
        << eventKindToString(event.kind);

    const auto& subject = event.subject;
    const std::pair<const char*, EntityId> parts[] = {
        {"country", subject.country}, {"target", subject.targetCountry}, {"leader", subject.leader},
        {"system", subject.system},   {"planet", subject.planet},        {"war", subject.war},
        {"faction", subject.faction},
    };
    for (const auto& [label, id] : parts) {
        if (id != kNoEntity) {
            out << " " << label << "=\"" << entityLabel(store, series, id) << "\"";
        }
    }
    if (!subject.description.empty()) {
        out << " (" << subject.description << ")";
    }
    if (!event.knownToObserver) {
        out << " [hidden]";
    }
    return out.str();
}

} // namespace chronicle
