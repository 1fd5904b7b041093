#pragma once

#include "chronicle/parser/Value.hh"
#include "chronicle/store/Store.hh"
#include "chronicle/timeline/Pipeline.hh"
#include "chronicle/timeline/Processor.hh"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chronicle {

enum class SnapshotStatus : uint8_t { Committed, Superseded, RolledBack, RejectedOutOfOrder };

std::string_view snapshotStatusToString(SnapshotStatus status);

// Outcome of applying one snapshot to a series.
struct SnapshotReport {
    SnapshotStatus status = SnapshotStatus::RolledBack;
    Day day = 0;
    std::vector<PipelineWarning> warnings;
    std::vector<std::string> executed;
    std::vector<std::string> skipped;
    std::string error;

    bool applied() const { return status == SnapshotStatus::Committed || status == SnapshotStatus::Superseded; }
};

// Player country resolved from the top-level `player` list.
struct ObserverSelection {
    std::optional<std::int64_t> observer;
    std::set<std::int64_t> otherPlayers;
};

// One entry: that country. Several: the entry named `observerName`, the rest
// become other players; no match throws ConfigError. None: observer mode.
ObserverSelection selectObserver(const Value& gamestate, const std::string& observerName);

/**
 * @brief Applies parsed snapshots to series, one transaction per snapshot.
 *
 * process() walks Idle -> Running(processor) -> Committed | RolledBack. A
 * snapshot older than the newest committed one is rejected; one with the
 * same day supersedes it. Any exception raised while running rolls the
 * whole snapshot back and is reported, not rethrown.
 */
class TimelineEngine {
  public:
    explicit TimelineEngine(Store& store, TimelineOptions options = {});
    TimelineEngine(Store& store, TimelinePipeline pipeline, TimelineOptions options);

    SnapshotReport process(const std::string& seriesName, const Value& gamestate);

    const TimelinePipeline& pipeline() const { return pipeline_; }
    const TimelineOptions& options() const { return options_; }

  private:
    void updateSeriesAttributes(SeriesId series, const SnapshotContext& snapshot, IdentityMap& entities);

    Store& store_;
    TimelinePipeline pipeline_;
    TimelineOptions options_;
};

} // namespace chronicle
