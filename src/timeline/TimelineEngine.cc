#include "chronicle/timeline/TimelineEngine.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/timeline/IdentityMap.hh"
#include "chronicle/timeline/Processors.hh"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chronicle {

namespace {

std::string nowTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

std::string_view snapshotStatusToString(SnapshotStatus status) {
    switch (status) {
    case SnapshotStatus::Committed:
        return "committed";
    case SnapshotStatus::Superseded:
        return "superseded";
    case SnapshotStatus::RolledBack:
        return "rolled_back";
    case SnapshotStatus::RejectedOutOfOrder:
        return "rejected_out_of_order";
    }
    return "unknown";
}

ObserverSelection selectObserver(const Value& gamestate, const std::string& observerName) {
    std::vector<std::pair<std::string, std::int64_t>> players;
    for (const auto* player : itemsAt(gamestate, "player")) {
        if (!player->isMap()) {
            continue;
        }
        auto country = getInt(*player, "country");
        if (country.isError()) {
            continue;
        }
        players.emplace_back(getStringOr(*player, "name", ""), country.value());
    }

    ObserverSelection selection;
    if (players.empty()) {
        return selection;
    }
    if (players.size() == 1) {
        selection.observer = players.front().second;
        return selection;
    }

    for (const auto& [name, country] : players) {
        if (!selection.observer && name == observerName) {
            selection.observer = country;
        } else {
            selection.otherPlayers.insert(country);
        }
    }
    if (!selection.observer) {
        std::ostringstream names;
        for (size_t i = 0; i < players.size(); ++i) {
            names << (i > 0 ? ", " : "") << '"' << players[i].first << '"';
        }
        throw ConfigError("Save has " + std::to_string(players.size()) + " players (" + names.str() +
                          ") and none is named \"" + observerName + "\"; set timeline.observer_name");
    }
    return selection;
}

TimelineEngine::TimelineEngine(Store& store, TimelineOptions options)
    : TimelineEngine(store, makeDefaultPipeline(), std::move(options)) {}

TimelineEngine::TimelineEngine(Store& store, TimelinePipeline pipeline, TimelineOptions options)
    : store_(store), pipeline_(std::move(pipeline)), options_(std::move(options)) {}

SnapshotReport TimelineEngine::process(const std::string& seriesName, const Value& gamestate) {
    SnapshotReport report;

    auto date = getString(gamestate, "date");
    auto day = date.isOk() ? dateToDays(date.value()) : std::nullopt;
    if (!day) {
        report.error = "snapshot has no valid date";
        CHRONICLE_TIMELINE_LOG_ERROR("{}: {}", seriesName, report.error);
        return report;
    }
    report.day = *day;
    std::string prefix = seriesName + " " + daysToDate(*day);

    SeriesId series = store_.getOrCreateSeries(seriesName);
    Store::SeriesLock lock(store_, series);

    auto known = store_.snapshots(series);
    if (!known.empty() && *day < known.back()) {
        report.status = SnapshotStatus::RejectedOutOfOrder;
        report.error = "newest snapshot of the series is " + daysToDate(known.back());
        CHRONICLE_TIMELINE_LOG_WARN("{}: rejected, {}", prefix, report.error);
        return report;
    }

    store_.beginTransaction(series);
    try {
        bool superseding = false;
        if (!known.empty() && *day == known.back()) {
            superseding = store_.supersedeSnapshot(series, *day);
            if (!superseding) {
                store_.rollback(series);
                report.status = SnapshotStatus::RejectedOutOfOrder;
                report.error = "snapshot " + daysToDate(*day) + " was imported before and can no longer be replaced";
                CHRONICLE_TIMELINE_LOG_WARN("{}: rejected, {}", prefix, report.error);
                return report;
            }
        }
        store_.addSnapshot(series, *day);

        auto selection = selectObserver(gamestate, options_.observerName);
        SnapshotContext snapshot{gamestate,  seriesName, series, *day, selection.observer, selection.otherPlayers,
                                 options_};

        IdentityMap entities(store_, series);
        auto run = pipeline_.run(snapshot, store_, entities, report.warnings);
        updateSeriesAttributes(series, snapshot, entities);
        entities.flush();
        store_.commit(series);

        report.status = superseding ? SnapshotStatus::Superseded : SnapshotStatus::Committed;
        report.executed = std::move(run.executed);
        report.skipped = std::move(run.skipped);
        CHRONICLE_TIMELINE_LOG_INFO("{}: {} ({} processors, {} skipped, {} warnings)", prefix,
                                    snapshotStatusToString(report.status), report.executed.size(),
                                    report.skipped.size(), report.warnings.size());
    } catch (const std::exception& e) {
        store_.rollback(series);
        report.status = SnapshotStatus::RolledBack;
        report.error = e.what();
        CHRONICLE_TIMELINE_LOG_ERROR("{}: rolled back: {}", prefix, report.error);
    }
    return report;
}

void TimelineEngine::updateSeriesAttributes(SeriesId series, const SnapshotContext& snapshot,
                                            IdentityMap& entities) {
    auto attributes = store_.seriesAttributes(series);
    if (!attributes.is_object()) {
        attributes = nlohmann::json::object();
    }

    if (!attributes.contains("player_country_name")) {
        std::string player = "Observer Mode";
        if (snapshot.observerCountry) {
            if (Entity* country = entities.find(EntityKind::Country, *snapshot.observerCountry)) {
                player = country->attrString("name", player);
            }
        }
        attributes["player_country_name"] = player;

        if (const auto* galaxy = childMap(snapshot.gamestate, "galaxy")) {
            attributes["galaxy_template"] = getStringOr(*galaxy, "template", "");
            attributes["galaxy_shape"] = getStringOr(*galaxy, "shape", "");
            attributes["difficulty"] = getStringOr(*galaxy, "difficulty", "");
        }
    }
    attributes["game_version"] = getStringOr(snapshot.gamestate, "version", "");
    attributes["last_day"] = snapshot.day;
    attributes["last_updated"] = nowTimestamp();
    store_.setSeriesAttributes(series, std::move(attributes));
}

} // namespace chronicle
