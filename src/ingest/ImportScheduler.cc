#include "chronicle/ingest/ImportScheduler.hh"

#include "chronicle/core/Log.hh"

#include <algorithm>
#include <chrono>
#include <future>
#include <list>
#include <map>

namespace chronicle {

namespace {

struct InFlight {
    size_t index;
    size_t position;
    std::future<Result<Value>> parsed;
};

struct Parsed {
    size_t index;
    std::optional<Value> gamestate;
    std::string error;
};

struct SeriesBuffer {
    size_t nextPosition = 0;
    std::map<size_t, Parsed> ready;
};

} // namespace

std::string ImportOutcome::failureReason() const {
    if (loadError) {
        return *loadError;
    }
    if (!report) {
        return "not imported";
    }
    std::string status(snapshotStatusToString(report->status));
    return report->error.empty() ? status : status + ": " + report->error;
}

ImportScheduler::ImportScheduler(TimelineEngine& engine, SnapshotLoader loader, Utils::ThreadPoolExecutor& pool,
                                 size_t window)
    : engine_(engine), loader_(std::move(loader)), pool_(pool),
      window_(window > 0 ? window : std::min<size_t>(16, 2 * std::max<size_t>(1, pool.getThreadCount()))) {}

std::vector<ImportOutcome> ImportScheduler::importFiles(const std::vector<SaveFile>& files,
                                                        const OutcomeCallback& onOutcome) {
    std::vector<ImportOutcome> outcomes;

    // Position of each file within its own series.
    std::vector<size_t> positions(files.size());
    std::map<std::string, size_t> perSeries;
    for (size_t i = 0; i < files.size(); ++i) {
        positions[i] = perSeries[files[i].series]++;
    }

    std::map<std::string, SeriesBuffer> buffers;
    std::list<InFlight> inFlight;
    size_t nextSubmit = 0;

    auto apply = [&](Parsed parsed) {
        ImportOutcome outcome;
        outcome.file = files[parsed.index];
        if (!parsed.gamestate) {
            outcome.loadError = std::move(parsed.error);
        } else {
            outcome.report = engine_.process(outcome.file.series, *parsed.gamestate);
        }
        if (outcome.outOfOrder()) {
            // Files are applied in modification order; a save rewritten after
            // a newer one lands here.
            CHRONICLE_LOG_WARN("snapshot {} for series {} skipped, its game date is not after the imported ones: {}",
                               outcome.file.path.string(), outcome.file.series, outcome.failureReason());
        } else if (!outcome.imported()) {
            CHRONICLE_LOG_ERROR("snapshot {} for series {} failed to import: {}", outcome.file.path.string(),
                                outcome.file.series, outcome.failureReason());
        }
        if (onOutcome) {
            onOutcome(outcome);
        }
        outcomes.push_back(std::move(outcome));
    };

    auto drain = [&](const std::string& series) {
        auto& buffer = buffers[series];
        for (auto it = buffer.ready.find(buffer.nextPosition); it != buffer.ready.end();
             it = buffer.ready.find(buffer.nextPosition)) {
            if (cancelled_) {
                return;
            }
            Parsed parsed = std::move(it->second);
            buffer.ready.erase(it);
            ++buffer.nextPosition;
            apply(std::move(parsed));
        }
    };

    auto collect = [&](std::list<InFlight>::iterator it) {
        Parsed parsed{it->index, std::nullopt, {}};
        try {
            auto result = it->parsed.get();
            if (result.isOk()) {
                parsed.gamestate = std::move(result.value());
            } else {
                parsed.error = result.message();
            }
        } catch (const std::exception& e) {
            parsed.error = e.what();
        }
        const std::string& series = files[it->index].series;
        buffers[series].ready.emplace(it->position, std::move(parsed));
        inFlight.erase(it);
        drain(series);
    };

    while (!cancelled_ && (nextSubmit < files.size() || !inFlight.empty())) {
        while (nextSubmit < files.size() && inFlight.size() < window_) {
            SnapshotLoader loader = loader_;
            std::filesystem::path path = files[nextSubmit].path;
            inFlight.push_back({nextSubmit, positions[nextSubmit],
                                pool_.submit([loader, path]() { return loader.load(path); })});
            ++nextSubmit;
        }

        bool collected = false;
        for (auto it = inFlight.begin(); it != inFlight.end() && !cancelled_;) {
            auto current = it++;
            if (current->parsed.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                collect(current);
                collected = true;
            }
        }
        if (!collected && !inFlight.empty() && !cancelled_) {
            inFlight.front().parsed.wait();
            collect(inFlight.begin());
        }
    }

    if (cancelled_) {
        CHRONICLE_LOG_INFO("Import cancelled, {} of {} files applied", outcomes.size(), files.size());
    }
    return outcomes;
}

} // namespace chronicle
