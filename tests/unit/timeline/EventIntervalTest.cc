#include "chronicle/store/MemoryStore.hh"
#include "chronicle/timeline/TimelineEngine.hh"
#include "unit/timeline/SaveBuilder.hh"
#include <gtest/gtest.h>

#include <map>
#include <random>
#include <sstream>
#include <tuple>

using namespace chronicle;
using chronicle::test::SaveBuilder;

namespace {

// What one generated snapshot contains.
struct Frame {
    Day day = 0;
    int solOwner = -1;
    int barnardOwner = -1;
    bool rivals = false;
    std::int64_t war = -1;
    Day warStart = 0;
};

std::string relation(bool rivals) {
    return std::string("relations_manager={ relation={ country=1 communications=yes") +
           (rivals ? " is_rival=yes" : "") + " } }";
}

SaveBuilder render(const Frame& frame) {
    SaveBuilder save(daysToDate(frame.day));
    save.player("alice", 0)
        .system(1, "Sol", {100}, {10})
        .system(2, "Barnard", {101})
        .planet(10, "name=\"Earth\" planet_class=\"pc_continental\" owner=0")
        .country(0, "Earth", relation(frame.rivals))
        .country(1, "Mars", "relations_manager={ relation={ country=0 communications=yes } }");
    if (frame.solOwner >= 0) {
        save.starbase(100, frame.solOwner);
    }
    if (frame.barnardOwner >= 0) {
        save.starbase(101, frame.barnardOwner);
    }
    if (frame.war >= 0) {
        std::ostringstream war;
        war << "war={ " << frame.war << "={ name=\"War " << frame.war << "\" start_date=\""
            << daysToDate(frame.warStart) << "\" attackers={ { country=1 call_type=\"primary\" } } "
            << "defenders={ { country=0 call_type=\"primary\" } } } }";
        save.raw(war.str());
    }
    return save;
}

std::vector<Frame> generate(unsigned seed) {
    std::mt19937 rng(seed);
    std::vector<Frame> frames(5 + rng() % 6);
    Day day = static_cast<Day>(rng() % 30);
    std::int64_t nextWar = 5;
    Frame previous;
    for (auto& frame : frames) {
        frame.day = day;
        day += 10 + static_cast<Day>(rng() % 50);
        frame.solOwner = static_cast<int>(rng() % 3) - 1;
        frame.barnardOwner = static_cast<int>(rng() % 3) - 1;
        frame.rivals = rng() % 2 == 0;
        if (previous.war >= 0 && rng() % 3 != 0) {
            frame.war = previous.war;
            frame.warStart = previous.warStart;
        } else if (previous.war < 0 && rng() % 2 == 0) {
            frame.war = nextWar++;
            frame.warStart = frame.day;
        }
        previous = frame;
    }
    return frames;
}

using SubjectKey = std::tuple<EventKind, EntityId, EntityId, EntityId, EntityId, EntityId, EntityId, EntityId,
                              std::string>;

SubjectKey keyOf(const HistoricalEvent& event) {
    const auto& s = event.subject;
    return {event.kind, s.country, s.targetCountry, s.leader, s.system, s.planet, s.war, s.faction, s.description};
}

} // namespace

class EventIntervalTest : public ::testing::TestWithParam<unsigned> {
  protected:
    MemoryStore store_;
    TimelineEngine engine_{store_};
};

TEST_P(EventIntervalTest, SameSubjectIntervalsNeverOverlap) {
    auto frames = generate(GetParam());
    for (const auto& frame : frames) {
        auto report = engine_.process("game_1", render(frame).parse());
        ASSERT_TRUE(report.applied()) << daysToDate(frame.day) << ": " << report.error;
    }

    SeriesId series = *store_.findSeries("game_1");
    auto events = store_.events(series, {});
    ASSERT_FALSE(events.empty());

    // Events come back in creation order.
    std::map<SubjectKey, HistoricalEvent> last;
    for (const auto& event : events) {
        if (event.end) {
            EXPECT_LE(event.start, *event.end) << eventKindToString(event.kind);
        }
        auto [it, inserted] = last.emplace(keyOf(event), event);
        if (inserted) {
            continue;
        }
        const HistoricalEvent& before = it->second;
        EXPECT_LT(before.start, event.start) << eventKindToString(event.kind) << " events " << before.id << " and "
                                             << event.id;
        ASSERT_TRUE(before.end.has_value())
            << eventKindToString(event.kind) << " event " << before.id << " is still open under " << event.id;
        EXPECT_LT(*before.end, event.start) << eventKindToString(event.kind) << " events " << before.id << " and "
                                            << event.id;
        it->second = event;
    }

    // Ownership attributes agree with the final snapshot.
    const Frame& latest = frames.back();
    auto sol = store_.findEntity(series, EntityKind::System, 1);
    ASSERT_TRUE(sol);
    auto owner = latest.solOwner >= 0 ? store_.findEntity(series, EntityKind::Country, latest.solOwner) : std::nullopt;
    EXPECT_EQ(sol->attrInt("owner"), owner ? owner->id : kNoEntity);
}

INSTANTIATE_TEST_SUITE_P(Seeds, EventIntervalTest, ::testing::Range(1u, 13u));
