#pragma once

#include "chronicle/ingest/SaveDiscovery.hh"
#include "chronicle/ingest/SnapshotLoader.hh"
#include "chronicle/timeline/TimelineEngine.hh"
#include "chronicle/utils/ThreadPoolExecutor.hh"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chronicle {

// What happened to one save file.
struct ImportOutcome {
    SaveFile file;
    // Set when the file could not be read or parsed.
    std::optional<std::string> loadError;
    // Set when the snapshot reached the timeline engine.
    std::optional<SnapshotReport> report;

    bool imported() const { return report && report->applied(); }
    bool outOfOrder() const { return report && report->status == SnapshotStatus::RejectedOutOfOrder; }
    std::string failureReason() const;
};

/**
 * @brief Parses save files on a worker pool and applies them in order.
 *
 * Parsing runs on the pool with at most `window` files in flight. Each
 * series has a reorder buffer keyed by the file's position in that series,
 * so snapshots of one series always reach the engine in the order given,
 * whatever order the parses finish in. Engine calls happen on the thread
 * that called importFiles().
 *
 * cancel() may be called from any thread. It takes effect between
 * snapshots; a snapshot already handed to the engine runs to completion.
 */
class ImportScheduler {
  public:
    using OutcomeCallback = std::function<void(const ImportOutcome&)>;

    ImportScheduler(TimelineEngine& engine, SnapshotLoader loader, Utils::ThreadPoolExecutor& pool,
                    size_t window = 0);

    std::vector<ImportOutcome> importFiles(const std::vector<SaveFile>& files, const OutcomeCallback& onOutcome = {});

    void cancel() { cancelled_ = true; }
    void reset() { cancelled_ = false; }
    bool cancelled() const { return cancelled_; }

    size_t window() const { return window_; }

  private:
    TimelineEngine& engine_;
    SnapshotLoader loader_;
    Utils::ThreadPoolExecutor& pool_;
    size_t window_;
    std::atomic<bool> cancelled_{false};
};

} // namespace chronicle
