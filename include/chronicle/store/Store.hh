#pragma once

#include "chronicle/store/Model.hh"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chronicle {

/**
 * @brief Keyed persistence contract consumed by the timeline pipeline.
 *
 * Every operation is scoped to one series. Writes are expected inside
 * beginTransaction()/commit(); rollback() discards everything written since
 * the matching beginTransaction(). Implementations report failures by
 * throwing StoreError.
 */
class Store {
  public:
    virtual ~Store() = default;

    // -- Series --
    virtual SeriesId getOrCreateSeries(const std::string& name) = 0;
    virtual std::optional<SeriesId> findSeries(const std::string& name) const = 0;
    virtual std::vector<std::string> seriesNames() const = 0;
    // Full teardown of one series and everything it owns.
    virtual bool deleteSeries(const std::string& name) = 0;
    virtual nlohmann::json seriesAttributes(SeriesId series) const = 0;
    virtual void setSeriesAttributes(SeriesId series, nlohmann::json attributes) = 0;

    // -- Entities --
    virtual std::optional<Entity> findEntity(SeriesId series, EntityKind kind, std::int64_t sourceId) const = 0;
    virtual std::optional<Entity> getEntity(SeriesId series, EntityId id) const = 0;
    virtual std::vector<Entity> entities(SeriesId series, EntityKind kind) const = 0;
    // Inserts when entity.id is kNoEntity (assigning an id), otherwise
    // overwrites the stored entity. Returns the stored state.
    virtual Entity upsertEntity(SeriesId series, Entity entity) = 0;

    // -- Events --
    // Assigns the id; the passed id is ignored.
    virtual HistoricalEvent appendEvent(SeriesId series, HistoricalEvent event) = 0;
    // Only `end` and a false -> true visibility change are accepted.
    virtual void updateEvent(SeriesId series, const HistoricalEvent& event) = 0;
    // Matching events in creation order.
    virtual std::vector<HistoricalEvent> events(SeriesId series, const EventFilter& filter) const = 0;

    // -- Point-in-time records --
    virtual void addRecord(SeriesId series, SnapshotRecord record) = 0;
    // Records of one kind for one entity, ordered by day.
    virtual std::vector<SnapshotRecord> records(SeriesId series, EntityId entity, std::string_view kind) const = 0;

    // -- Snapshots --
    virtual bool snapshotExists(SeriesId series, Day day) const = 0;
    virtual std::vector<Day> snapshots(SeriesId series) const = 0;
    virtual void addSnapshot(SeriesId series, Day day) = 0;
    // Reverts every write of the newest committed snapshot when it has the
    // given day. Must be called inside a transaction. Returns false when
    // there is nothing to supersede.
    virtual bool supersedeSnapshot(SeriesId series, Day day) = 0;

    // -- Transactions --
    virtual void beginTransaction(SeriesId series) = 0;
    virtual void commit(SeriesId series) = 0;
    virtual void rollback(SeriesId series) = 0;
    virtual bool inTransaction(SeriesId series) const = 0;

    // Most recently created matching event. The default filters events().
    virtual std::optional<HistoricalEvent> latestEvent(SeriesId series, const EventFilter& filter) const;

    // Returns the open event of this kind and exact subject when there is
    // one, setting its end if `end` is given. Otherwise appends a new event
    // [start, end).
    HistoricalEvent appendOrExtendEvent(SeriesId series, EventKind kind, const EventSubject& subject, Day start,
                                        std::optional<Day> end = std::nullopt, bool knownToObserver = false);

    // Serializes writers of one series. Different series lock independently.
    class SeriesLock {
      public:
        SeriesLock(Store& store, SeriesId series);

      private:
        std::unique_lock<std::mutex> lock_;
    };

  private:
    std::mutex& seriesMutex(SeriesId series);

    std::mutex lockTableMutex_;
    std::unordered_map<SeriesId, std::unique_ptr<std::mutex>> seriesMutexes_;
};

} // namespace chronicle
