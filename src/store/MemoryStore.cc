#include "chronicle/store/MemoryStore.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/utils/ErrorHandling.hh"

#include <algorithm>
#include <limits>
#include <tuple>
#include <utility>

namespace chronicle {

MemoryStore::Series& MemoryStore::series(SeriesId id) {
    auto it = series_.find(id);
    if (it == series_.end()) {
        throwStoreError("Unknown series id " + std::to_string(id));
    }
    return *it->second;
}

const MemoryStore::Series& MemoryStore::series(SeriesId id) const {
    auto it = series_.find(id);
    if (it == series_.end()) {
        throwStoreError("Unknown series id " + std::to_string(id));
    }
    return *it->second;
}

MemoryStore::Series& MemoryStore::writable(SeriesId id) {
    auto& s = series(id);
    if (!s.open) {
        throwStoreError("Write to series '" + s.name + "' outside a transaction");
    }
    return s;
}

bool MemoryStore::SubjectKeyLess::operator()(const SubjectKey& a, const SubjectKey& b) const {
    const auto& x = a.second;
    const auto& y = b.second;
    return std::tie(a.first, x.country, x.targetCountry, x.leader, x.system, x.planet, x.war, x.faction,
                    x.description) < std::tie(b.first, y.country, y.targetCountry, y.leader, y.system, y.planet,
                                              y.war, y.faction, y.description);
}

void MemoryStore::indexEvent(SeriesState& state, size_t position) {
    const auto& event = state.events[position];
    state.eventsByKind[event.kind].push_back(position);
    state.eventsBySubject[SubjectKey{event.kind, event.subject}].push_back(position);
    if (event.isOpen()) {
        state.openByKind[event.kind].insert(position);
    }
}

// Events are only ever removed from the back.
void MemoryStore::unindexLastEvent(SeriesState& state) {
    size_t position = state.events.size() - 1;
    const auto& event = state.events[position];

    auto byKind = state.eventsByKind.find(event.kind);
    byKind->second.pop_back();
    if (byKind->second.empty()) {
        state.eventsByKind.erase(byKind);
    }
    auto bySubject = state.eventsBySubject.find(SubjectKey{event.kind, event.subject});
    bySubject->second.pop_back();
    if (bySubject->second.empty()) {
        state.eventsBySubject.erase(bySubject);
    }
    auto open = state.openByKind.find(event.kind);
    if (open != state.openByKind.end()) {
        open->second.erase(position);
        if (open->second.empty()) {
            state.openByKind.erase(open);
        }
    }
}

void MemoryStore::setEventState(SeriesState& state, size_t position, std::optional<Day> end, bool known) {
    auto& event = state.events[position];
    if (event.isOpen() && end) {
        auto open = state.openByKind.find(event.kind);
        open->second.erase(position);
        if (open->second.empty()) {
            state.openByKind.erase(open);
        }
    } else if (!event.isOpen() && !end) {
        state.openByKind[event.kind].insert(position);
    }
    event.end = end;
    event.knownToObserver = known;
}

void MemoryStore::undo(SeriesState& state, JournalEntry& entry) {
    using Op = JournalEntry::Op;
    switch (entry.op) {
    case Op::InsertEntity: {
        Entity entity = std::move(state.entities.back());
        state.entities.pop_back();
        state.entityIndex.erase(EntityKey{entity.kind, entity.sourceId});
        entry.other = std::move(entity);
        break;
    }
    case Op::UpdateEntity:
        std::swap(state.entities[entry.position].attributes, std::get<Entity>(entry.other).attributes);
        break;
    case Op::AppendEvent: {
        unindexLastEvent(state);
        entry.other = std::move(state.events.back());
        state.events.pop_back();
        break;
    }
    case Op::UpdateEvent: {
        auto& saved = std::get<HistoricalEvent>(entry.other);
        auto current = state.events[entry.position];
        setEventState(state, entry.position, saved.end, saved.knownToObserver);
        saved = std::move(current);
        break;
    }
    case Op::AddRecord: {
        auto& record = std::get<SnapshotRecord>(entry.other);
        auto it = state.records.find(RecordKey{record.entity, record.kind, record.day});
        record = std::move(it->second);
        state.records.erase(it);
        break;
    }
    case Op::AddSnapshot:
        state.snapshots.erase(entry.day);
        break;
    case Op::SetAttributes:
        std::swap(state.attributes, std::get<nlohmann::json>(entry.other));
        break;
    }
}

void MemoryStore::redo(SeriesState& state, JournalEntry& entry) {
    using Op = JournalEntry::Op;
    switch (entry.op) {
    case Op::InsertEntity: {
        const auto& entity = std::get<Entity>(entry.other);
        state.entityIndex.emplace(EntityKey{entity.kind, entity.sourceId}, entity.id);
        state.entities.push_back(entity);
        break;
    }
    case Op::AppendEvent:
        state.events.push_back(std::get<HistoricalEvent>(entry.other));
        indexEvent(state, state.events.size() - 1);
        break;
    case Op::AddRecord: {
        const auto& record = std::get<SnapshotRecord>(entry.other);
        state.records.emplace(RecordKey{record.entity, record.kind, record.day}, record);
        break;
    }
    case Op::AddSnapshot:
        state.snapshots.insert(entry.day);
        break;
    case Op::UpdateEntity:
    case Op::UpdateEvent:
    case Op::SetAttributes:
        // Swaps are their own inverse.
        undo(state, entry);
        break;
    }
}

// Positions worth testing against `filter`, ascending.
std::vector<size_t> MemoryStore::candidates(const SeriesState& state, const EventFilter& filter) {
    std::vector<size_t> positions;
    const bool exactSubject = filter.kinds.size() == 1 && filter.country && filter.targetCountry &&
                              filter.leader && filter.system && filter.planet && filter.war && filter.faction &&
                              filter.description;

    if (exactSubject) {
        EventSubject subject{*filter.country, *filter.targetCountry, *filter.leader, *filter.system,
                             *filter.planet,  *filter.war,           *filter.faction, *filter.description};
        auto it = state.eventsBySubject.find(SubjectKey{filter.kinds.front(), subject});
        if (it != state.eventsBySubject.end()) {
            positions = it->second;
        }
        return positions;
    }

    if (filter.openOnly) {
        for (const auto& [kind, open] : state.openByKind) {
            bool wanted =
                filter.kinds.empty() || std::find(filter.kinds.begin(), filter.kinds.end(), kind) != filter.kinds.end();
            if (wanted) {
                positions.insert(positions.end(), open.begin(), open.end());
            }
        }
        std::sort(positions.begin(), positions.end());
        return positions;
    }

    if (filter.kinds.empty()) {
        positions.resize(state.events.size());
        for (size_t i = 0; i < positions.size(); ++i) {
            positions[i] = i;
        }
        return positions;
    }

    for (auto kind : filter.kinds) {
        auto it = state.eventsByKind.find(kind);
        if (it != state.eventsByKind.end()) {
            positions.insert(positions.end(), it->second.begin(), it->second.end());
        }
    }
    if (filter.kinds.size() > 1) {
        std::sort(positions.begin(), positions.end());
    }
    return positions;
}

// -- Series --

SeriesId MemoryStore::getOrCreateSeries(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seriesByName_.find(name);
    if (it != seriesByName_.end()) {
        return it->second;
    }
    auto entry = std::make_unique<Series>();
    entry->id = nextSeriesId_++;
    entry->name = name;
    SeriesId id = entry->id;
    series_.emplace(id, std::move(entry));
    seriesByName_.emplace(name, id);
    CHRONICLE_STORE_LOG_INFO("Created series '{}' (id {})", name, id);
    return id;
}

std::optional<SeriesId> MemoryStore::findSeries(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seriesByName_.find(name);
    if (it == seriesByName_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryStore::seriesNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(seriesByName_.size());
    for (const auto& [name, id] : seriesByName_) {
        names.push_back(name);
    }
    return names;
}

bool MemoryStore::deleteSeries(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seriesByName_.find(name);
    if (it == seriesByName_.end()) {
        return false;
    }
    series_.erase(it->second);
    seriesByName_.erase(it);
    CHRONICLE_STORE_LOG_INFO("Deleted series '{}'", name);
    return true;
}

nlohmann::json MemoryStore::seriesAttributes(SeriesId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series(id).state.attributes;
}

void MemoryStore::setSeriesAttributes(SeriesId id, nlohmann::json attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    JournalEntry entry{JournalEntry::Op::SetAttributes};
    entry.other = std::move(attributes);
    std::swap(s.state.attributes, std::get<nlohmann::json>(entry.other));
    s.journal.push_back(std::move(entry));
}

// -- Entities --

std::optional<Entity> MemoryStore::findEntity(SeriesId id, EntityKind kind, std::int64_t sourceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    auto it = state.entityIndex.find({kind, sourceId});
    if (it == state.entityIndex.end()) {
        return std::nullopt;
    }
    return state.entities[static_cast<size_t>(it->second - 1)];
}

std::optional<Entity> MemoryStore::getEntity(SeriesId id, EntityId entityId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    if (entityId < 1 || static_cast<size_t>(entityId) > state.entities.size()) {
        return std::nullopt;
    }
    return state.entities[static_cast<size_t>(entityId - 1)];
}

std::vector<Entity> MemoryStore::entities(SeriesId id, EntityKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    std::vector<Entity> result;
    auto it = state.entityIndex.lower_bound({kind, std::numeric_limits<std::int64_t>::min()});
    for (; it != state.entityIndex.end() && it->first.first == kind; ++it) {
        result.push_back(state.entities[static_cast<size_t>(it->second - 1)]);
    }
    return result;
}

Entity MemoryStore::upsertEntity(SeriesId id, Entity entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    auto& state = s.state;

    if (entity.id == kNoEntity) {
        auto existing = state.entityIndex.find({entity.kind, entity.sourceId});
        if (existing != state.entityIndex.end()) {
            entity.id = existing->second;
        } else {
            entity.id = static_cast<EntityId>(state.entities.size()) + 1;
            state.entityIndex.emplace(EntityKey{entity.kind, entity.sourceId}, entity.id);
            state.entities.push_back(entity);
            s.journal.push_back({JournalEntry::Op::InsertEntity});
            return entity;
        }
    }

    if (entity.id < 1 || static_cast<size_t>(entity.id) > state.entities.size()) {
        throwStoreError("Unknown entity id " + std::to_string(entity.id));
    }
    auto& stored = state.entities[static_cast<size_t>(entity.id - 1)];
    if (stored.kind != entity.kind || stored.sourceId != entity.sourceId) {
        throwStoreError("Entity " + std::to_string(entity.id) + " cannot change its kind or source id");
    }
    JournalEntry entry{JournalEntry::Op::UpdateEntity, static_cast<size_t>(entity.id - 1)};
    entry.other = stored;
    stored.attributes = std::move(entity.attributes);
    s.journal.push_back(std::move(entry));
    return stored;
}

// -- Events --

HistoricalEvent MemoryStore::appendEvent(SeriesId id, HistoricalEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    auto& state = s.state;
    if (event.end && *event.end < event.start) {
        throwStoreError("Event " + std::string(eventKindToString(event.kind)) + " ends before it starts");
    }
    event.id = static_cast<EventId>(state.events.size()) + 1;
    state.events.push_back(event);
    indexEvent(state, state.events.size() - 1);
    s.journal.push_back({JournalEntry::Op::AppendEvent});
    return event;
}

void MemoryStore::updateEvent(SeriesId id, const HistoricalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    auto& state = s.state;
    if (event.id < 1 || static_cast<size_t>(event.id) > state.events.size()) {
        throwStoreError("Unknown event id " + std::to_string(event.id));
    }
    auto& stored = state.events[static_cast<size_t>(event.id - 1)];
    if (stored.kind != event.kind || stored.start != event.start || !(stored.subject == event.subject)) {
        throwStoreError("Event " + std::to_string(event.id) + ": only end and visibility may change");
    }
    if (stored.knownToObserver && !event.knownToObserver) {
        throwStoreError("Event " + std::to_string(event.id) + ": visibility cannot be narrowed");
    }
    if (event.end && *event.end < event.start) {
        throwStoreError("Event " + std::to_string(event.id) + " would end before it starts");
    }
    if (stored.end == event.end && stored.knownToObserver == event.knownToObserver) {
        return;
    }
    size_t position = static_cast<size_t>(event.id - 1);
    JournalEntry entry{JournalEntry::Op::UpdateEvent, position};
    entry.other = stored;
    setEventState(state, position, event.end, event.knownToObserver);
    s.journal.push_back(std::move(entry));
}

std::vector<HistoricalEvent> MemoryStore::events(SeriesId id, const EventFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    std::vector<HistoricalEvent> result;
    for (auto position : candidates(state, filter)) {
        if (filter.matches(state.events[position])) {
            result.push_back(state.events[position]);
        }
    }
    return result;
}

std::optional<HistoricalEvent> MemoryStore::latestEvent(SeriesId id, const EventFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    auto positions = candidates(state, filter);
    for (auto it = positions.rbegin(); it != positions.rend(); ++it) {
        if (filter.matches(state.events[*it])) {
            return state.events[*it];
        }
    }
    return std::nullopt;
}

// -- Records --

void MemoryStore::addRecord(SeriesId id, SnapshotRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    auto& state = s.state;
    if (record.entity < 1 || static_cast<size_t>(record.entity) > state.entities.size()) {
        throwStoreError("Record '" + record.kind + "' references unknown entity " + std::to_string(record.entity));
    }
    RecordKey key{record.entity, record.kind, record.day};
    if (state.records.count(key) > 0) {
        throwStoreError("Record '" + record.kind + "' for entity " + std::to_string(record.entity) + " on " +
                        daysToDate(record.day) + " already exists");
    }
    JournalEntry entry{JournalEntry::Op::AddRecord};
    entry.other = SnapshotRecord{record.entity, record.kind, record.day, {}};
    state.records.emplace(std::move(key), std::move(record));
    s.journal.push_back(std::move(entry));
}

std::vector<SnapshotRecord> MemoryStore::records(SeriesId id, EntityId entity, std::string_view kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    std::vector<SnapshotRecord> result;
    std::string kindName(kind);
    auto it = state.records.lower_bound({entity, kindName, std::numeric_limits<Day>::min()});
    for (; it != state.records.end(); ++it) {
        const auto& [e, k, day] = it->first;
        if (e != entity || k != kindName) {
            break;
        }
        result.push_back(it->second);
    }
    return result;
}

// -- Snapshots --

bool MemoryStore::snapshotExists(SeriesId id, Day day) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series(id).state.snapshots.count(day) > 0;
}

std::vector<Day> MemoryStore::snapshots(SeriesId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = series(id).state;
    return {state.snapshots.begin(), state.snapshots.end()};
}

void MemoryStore::addSnapshot(SeriesId id, Day day) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    if (s.pendingSnapshot) {
        throwStoreError("Transaction on series '" + s.name + "' already holds snapshot " +
                        daysToDate(*s.pendingSnapshot));
    }
    if (!s.state.snapshots.insert(day).second) {
        throwStoreError("Snapshot " + daysToDate(day) + " already exists in series '" + s.name + "'");
    }
    s.pendingSnapshot = day;
    JournalEntry entry{JournalEntry::Op::AddSnapshot};
    entry.day = day;
    s.journal.push_back(std::move(entry));
}

bool MemoryStore::supersedeSnapshot(SeriesId id, Day day) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    if (!s.lastDay || *s.lastDay != day || !s.lastJournal) {
        return false;
    }
    if (!s.journal.empty()) {
        throwStoreError("Series '" + s.name + "': supersede must precede other writes in the transaction");
    }
    auto& journal = *s.lastJournal;
    for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
        undo(s.state, *it);
    }
    s.superseded = std::move(s.lastJournal);
    s.lastJournal.reset();
    CHRONICLE_STORE_LOG_INFO("Series '{}': reverted snapshot {} for supersede", s.name, daysToDate(day));
    return true;
}

// -- Transactions --

void MemoryStore::beginTransaction(SeriesId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = series(id);
    if (s.open) {
        throwStoreError("Series '" + s.name + "' already has an open transaction");
    }
    s.open = true;
    s.journal.clear();
    s.superseded.reset();
    s.pendingSnapshot.reset();
}

void MemoryStore::commit(SeriesId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    if (s.pendingSnapshot) {
        // After a supersede the journal starts from the state the replaced
        // snapshot was applied on, so it alone reverts this snapshot.
        s.lastJournal = std::move(s.journal);
        s.lastDay = s.pendingSnapshot;
    } else {
        // Writes outside a snapshot cannot be reverted by a supersede.
        s.lastJournal.reset();
        s.lastDay.reset();
    }
    s.open = false;
    s.journal.clear();
    s.superseded.reset();
    s.pendingSnapshot.reset();
}

void MemoryStore::rollback(SeriesId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = writable(id);
    for (auto it = s.journal.rbegin(); it != s.journal.rend(); ++it) {
        undo(s.state, *it);
    }
    if (s.superseded) {
        for (auto& entry : *s.superseded) {
            redo(s.state, entry);
        }
        s.lastJournal = std::move(s.superseded);
    }
    s.open = false;
    s.journal.clear();
    s.superseded.reset();
    s.pendingSnapshot.reset();
    CHRONICLE_STORE_LOG_INFO("Series '{}': transaction rolled back", s.name);
}

bool MemoryStore::inTransaction(SeriesId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series(id).open;
}

size_t MemoryStore::eventCount(SeriesId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series(id).state.events.size();
}

// -- JSON export / import --

nlohmann::json MemoryStore::exportSeries(SeriesId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& s = series(id);
    if (s.open) {
        throwStoreError("Cannot export series '" + s.name + "' during a transaction");
    }

    nlohmann::json records = nlohmann::json::array();
    for (const auto& [key, record] : s.state.records) {
        records.push_back(record);
    }

    return nlohmann::json{{"name", s.name},
                          {"attributes", s.state.attributes},
                          {"snapshots", s.state.snapshots},
                          {"entities", s.state.entities},
                          {"events", s.state.events},
                          {"records", std::move(records)}};
}

SeriesId MemoryStore::importSeries(const nlohmann::json& document) {
    SeriesState state;
    std::string name;
    try {
        name = document.at("name").get<std::string>();
        state.attributes = document.value("attributes", nlohmann::json::object());
        for (Day day : document.at("snapshots").get<std::vector<Day>>()) {
            state.snapshots.insert(day);
        }
        state.entities = document.at("entities").get<std::vector<Entity>>();
        for (size_t i = 0; i < state.entities.size(); ++i) {
            const auto& e = state.entities[i];
            if (e.id != static_cast<EntityId>(i) + 1) {
                throwStoreError("Series '" + name + "': entity ids are not dense");
            }
            state.entityIndex.emplace(EntityKey{e.kind, e.sourceId}, e.id);
        }
        state.events = document.at("events").get<std::vector<HistoricalEvent>>();
        for (size_t i = 0; i < state.events.size(); ++i) {
            if (state.events[i].id != static_cast<EventId>(i) + 1) {
                throwStoreError("Series '" + name + "': event ids are not dense");
            }
            indexEvent(state, i);
        }
        for (auto record : document.at("records").get<std::vector<SnapshotRecord>>()) {
            RecordKey key{record.entity, record.kind, record.day};
            state.records.emplace(std::move(key), std::move(record));
        }
    } catch (const nlohmann::json::exception& e) {
        throwStoreError("Malformed series document: " + std::string(e.what()));
    } catch (const StoreError&) {
        throw;
    } catch (const ChronicleException& e) {
        throwStoreError("Malformed series document: " + std::string(e.what()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seriesByName_.find(name);
    SeriesId id;
    if (it != seriesByName_.end()) {
        id = it->second;
        if (series_.at(id)->open) {
            throwStoreError("Cannot replace series '" + name + "' during a transaction");
        }
    } else {
        id = nextSeriesId_++;
        seriesByName_.emplace(name, id);
    }
    auto entry = std::make_unique<Series>();
    entry->id = id;
    entry->name = name;
    entry->state = std::move(state);
    series_[id] = std::move(entry);
    return id;
}

} // namespace chronicle
