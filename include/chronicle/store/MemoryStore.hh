#pragma once

#include "chronicle/store/Store.hh"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <tuple>
#include <variant>

namespace chronicle {

/**
 * @brief In-process Store with journaled transactions.
 *
 * Every write inside a transaction appends an undo entry to the series
 * journal; rollback() replays it backwards. Committing a snapshot keeps its
 * journal, so a later snapshot with the same day can supersede it. The cost
 * of a transaction is proportional to what it writes, not to the stored
 * history. Open events are indexed by kind, and all events by exact subject,
 * so the lookups the timeline does per snapshot avoid full scans. Series can
 * be exported to and imported from JSON (see StoreFile).
 *
 * All methods are thread-safe; writers of one series are additionally
 * expected to hold a Store::SeriesLock.
 */
class MemoryStore : public Store {
  public:
    MemoryStore() = default;
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    SeriesId getOrCreateSeries(const std::string& name) override;
    std::optional<SeriesId> findSeries(const std::string& name) const override;
    std::vector<std::string> seriesNames() const override;
    bool deleteSeries(const std::string& name) override;
    nlohmann::json seriesAttributes(SeriesId series) const override;
    void setSeriesAttributes(SeriesId series, nlohmann::json attributes) override;

    std::optional<Entity> findEntity(SeriesId series, EntityKind kind, std::int64_t sourceId) const override;
    std::optional<Entity> getEntity(SeriesId series, EntityId id) const override;
    std::vector<Entity> entities(SeriesId series, EntityKind kind) const override;
    Entity upsertEntity(SeriesId series, Entity entity) override;

    HistoricalEvent appendEvent(SeriesId series, HistoricalEvent event) override;
    void updateEvent(SeriesId series, const HistoricalEvent& event) override;
    std::vector<HistoricalEvent> events(SeriesId series, const EventFilter& filter) const override;
    std::optional<HistoricalEvent> latestEvent(SeriesId series, const EventFilter& filter) const override;

    void addRecord(SeriesId series, SnapshotRecord record) override;
    std::vector<SnapshotRecord> records(SeriesId series, EntityId entity, std::string_view kind) const override;

    bool snapshotExists(SeriesId series, Day day) const override;
    std::vector<Day> snapshots(SeriesId series) const override;
    void addSnapshot(SeriesId series, Day day) override;
    bool supersedeSnapshot(SeriesId series, Day day) override;

    void beginTransaction(SeriesId series) override;
    void commit(SeriesId series) override;
    void rollback(SeriesId series) override;
    bool inTransaction(SeriesId series) const override;

    // Committed state of one series as JSON.
    nlohmann::json exportSeries(SeriesId series) const;
    // Replaces (or creates) the series named in the document.
    SeriesId importSeries(const nlohmann::json& document);

    size_t eventCount(SeriesId series) const;

  private:
    using EntityKey = std::pair<EntityKind, std::int64_t>;
    using RecordKey = std::tuple<EntityId, std::string, Day>;
    using SubjectKey = std::pair<EventKind, EventSubject>;

    struct SubjectKeyLess {
        bool operator()(const SubjectKey& a, const SubjectKey& b) const;
    };

    struct SeriesState {
        nlohmann::json attributes = nlohmann::json::object();
        std::vector<Entity> entities; // entities[id - 1]
        std::map<EntityKey, EntityId> entityIndex;
        std::vector<HistoricalEvent> events; // events[id - 1]
        std::map<EventKind, std::vector<size_t>> eventsByKind;
        std::map<EventKind, std::set<size_t>> openByKind;
        std::map<SubjectKey, std::vector<size_t>, SubjectKeyLess> eventsBySubject;
        std::map<RecordKey, SnapshotRecord> records;
        std::set<Day> snapshots;
    };

    // One reversible write. Update entries hold the value on the other side
    // of the change and are swapped in both directions.
    struct JournalEntry {
        enum class Op : uint8_t { InsertEntity, UpdateEntity, AppendEvent, UpdateEvent, AddRecord, AddSnapshot,
                                  SetAttributes };
        Op op;
        size_t position = 0;
        Day day = 0;
        std::variant<std::monostate, Entity, HistoricalEvent, SnapshotRecord, nlohmann::json> other;
    };
    using Journal = std::vector<JournalEntry>;

    struct Series {
        SeriesId id = 0;
        std::string name;
        SeriesState state;

        // Open transaction
        bool open = false;
        Journal journal;
        std::optional<Journal> superseded;
        std::optional<Day> pendingSnapshot;

        // Journal of the newest committed snapshot, while it can be reverted
        std::optional<Journal> lastJournal;
        std::optional<Day> lastDay;
    };

    Series& series(SeriesId id);
    const Series& series(SeriesId id) const;
    Series& writable(SeriesId id);

    static void indexEvent(SeriesState& state, size_t position);
    static void unindexLastEvent(SeriesState& state);
    static void setEventState(SeriesState& state, size_t position, std::optional<Day> end, bool known);
    static void undo(SeriesState& state, JournalEntry& entry);
    static void redo(SeriesState& state, JournalEntry& entry);
    static std::vector<size_t> candidates(const SeriesState& state, const EventFilter& filter);

    mutable std::mutex mutex_;
    std::map<SeriesId, std::unique_ptr<Series>> series_;
    std::map<std::string, SeriesId> seriesByName_;
    SeriesId nextSeriesId_ = 1;
};

} // namespace chronicle
