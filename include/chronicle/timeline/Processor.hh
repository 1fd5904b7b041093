#pragma once

#include "chronicle/parser/Value.hh"
#include "chronicle/store/Store.hh"
#include "chronicle/timeline/EventRecorder.hh"
#include "chronicle/timeline/IdentityMap.hh"
#include "chronicle/utils/ErrorHandling.hh"

#include <any>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronicle {

struct TimelineOptions {
    // Player name that picks the observer when a save has several players.
    std::string observerName;
    // Per-country breakdown records for every country, not just the observer.
    bool readAllCountries = false;
};

// One parsed snapshot being applied to a series.
struct SnapshotContext {
    const Value& gamestate;
    std::string seriesName;
    SeriesId series = 0;
    Day day = 0;
    std::optional<std::int64_t> observerCountry;
    std::set<std::int64_t> otherPlayers;
    TimelineOptions options;
};

enum class WarningKind : uint8_t { MissingDependency, AmbiguousSubject };

std::string_view warningKindToString(WarningKind kind);

struct PipelineWarning {
    WarningKind kind = WarningKind::AmbiguousSubject;
    std::string processor;
    std::string message;
};

// Outputs of the processors that already ran for this snapshot, keyed by
// processor id. Read-only for processors.
class DependencyOutputs {
  public:
    void set(const std::string& id, std::any output) { outputs_[id] = std::move(output); }
    bool contains(const std::string& id) const { return outputs_.find(id) != outputs_.end(); }
    size_t size() const { return outputs_.size(); }

    template <typename T> const T& get(const std::string& id) const {
        auto it = outputs_.find(id);
        if (it == outputs_.end()) {
            throwError("No output from processor '" + id + "'");
        }
        const T* value = std::any_cast<T>(&it->second);
        if (!value) {
            throwError("Output of processor '" + id + "' has an unexpected type");
        }
        return *value;
    }

  private:
    std::unordered_map<std::string, std::any> outputs_;
};

// Everything a processor may read or write while it runs.
struct ProcessorInput {
    const SnapshotContext& snapshot;
    const DependencyOutputs& deps;
    Store& store;
    IdentityMap& entities;
    std::vector<PipelineWarning>& warnings;
    std::string processorId;

    const Value& gamestate() const { return snapshot.gamestate; }
    Day day() const { return snapshot.day; }
    EventScope scope() const { return EventScope{store, snapshot.series, snapshot.day}; }

    // A referenced id has no entity; the fact is dropped and processing
    // continues.
    void ambiguous(const std::string& message);
};

// Output of processors whose dependents only need to know they ran.
struct Completed {};

/**
 * @brief One extraction unit of the timeline pipeline.
 *
 * run() returns the output handed to dependents. An empty std::any means
 * "no output": every processor depending on this one is skipped for the
 * snapshot. Throwing aborts the snapshot and rolls back all of its writes.
 */
class Processor {
  public:
    virtual ~Processor() = default;

    virtual std::string id() const = 0;
    virtual std::vector<std::string> dependencies() const { return {}; }
    virtual std::any run(ProcessorInput& input) = 0;
};

} // namespace chronicle
