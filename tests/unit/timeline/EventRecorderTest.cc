#include "chronicle/store/MemoryStore.hh"
#include "chronicle/timeline/EventRecorder.hh"
#include <gtest/gtest.h>

using namespace chronicle;

class EventRecorderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        series_ = store_.getOrCreateSeries("game_1");
        store_.beginTransaction(series_);
        country_ = makeEntity(EntityKind::Country, 0);
        curie_ = makeEntity(EntityKind::Leader, 10);
        tesla_ = makeEntity(EntityKind::Leader, 11);
        store_.commit(series_);
    }

    EntityId makeEntity(EntityKind kind, std::int64_t sourceId) {
        Entity entity;
        entity.kind = kind;
        entity.sourceId = sourceId;
        return store_.upsertEntity(series_, entity).id;
    }

    // Runs one snapshot's worth of writes at `day`.
    template <typename Fn> auto at(Day day, Fn&& fn) {
        store_.beginTransaction(series_);
        EventScope scope{store_, series_, day};
        auto result = fn(scope);
        store_.commit(series_);
        return result;
    }

    std::optional<EventSubject> physicsLeader(EntityId leader) const {
        EventSubject subject;
        subject.country = country_;
        subject.leader = leader;
        subject.description = "physics";
        return subject;
    }

    EventFilter physicsKey() const {
        EventFilter key;
        key.kinds = {EventKind::ResearchLeader};
        key.country = country_;
        key.description = "physics";
        return key;
    }

    FactChange research(Day day, std::optional<EventSubject> current, bool known = true) {
        return at(day, [&](const EventScope& scope) {
            return recordContinuousFact(scope, physicsKey(), EventKind::ResearchLeader, current, known);
        });
    }

    MemoryStore store_;
    SeriesId series_ = 0;
    EntityId country_ = kNoEntity;
    EntityId curie_ = kNoEntity;
    EntityId tesla_ = kNoEntity;
};

TEST_F(EventRecorderTest, ContinuousFactSpansUnchangedSnapshots) {
    EXPECT_EQ(research(0, physicsLeader(curie_)), FactChange::Opened);
    EXPECT_EQ(research(10, physicsLeader(curie_)), FactChange::Unchanged);
    EXPECT_EQ(research(20, physicsLeader(curie_)), FactChange::Unchanged);
    EXPECT_EQ(research(30, physicsLeader(curie_)), FactChange::Unchanged);
    EXPECT_EQ(research(31, physicsLeader(tesla_)), FactChange::Changed);

    auto events = store_.events(series_, physicsKey());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].subject.leader, curie_);
    EXPECT_EQ(events[0].start, 0);
    EXPECT_EQ(events[0].end, 30);
    EXPECT_EQ(events[1].subject.leader, tesla_);
    EXPECT_EQ(events[1].start, 31);
    EXPECT_TRUE(events[1].isOpen());
}

TEST_F(EventRecorderTest, ContinuousFactClosesWhenItStopsHolding) {
    research(0, physicsLeader(curie_));
    EXPECT_EQ(research(50, std::nullopt), FactChange::Closed);
    EXPECT_EQ(research(60, std::nullopt), FactChange::Unchanged);

    auto events = store_.events(series_, physicsKey());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].end, 49);
}

TEST_F(EventRecorderTest, FactOpenedAndChangedSameDayKeepsValidInterval) {
    research(40, physicsLeader(curie_));
    research(40, std::nullopt);

    auto events = store_.events(series_, physicsKey());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].end, 40);
}

TEST_F(EventRecorderTest, ContinuousFactOnlyWidensVisibility) {
    research(0, physicsLeader(curie_), false);
    research(10, physicsLeader(curie_), true);
    research(20, physicsLeader(curie_), false);

    auto events = store_.events(series_, physicsKey());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].knownToObserver);
}

TEST_F(EventRecorderTest, MomentaryEventIsRecordedOnce) {
    EventSubject subject;
    subject.country = country_;
    subject.leader = curie_;

    auto first = at(5, [&](const EventScope& scope) {
        return recordMomentaryEvent(scope, EventKind::LeaderDied, subject, false);
    });
    auto second = at(15, [&](const EventScope& scope) {
        return recordMomentaryEvent(scope, EventKind::LeaderDied, subject, true);
    });

    EXPECT_TRUE(first.created);
    EXPECT_FALSE(second.created);
    EXPECT_EQ(second.event.id, first.event.id);
    EXPECT_EQ(second.event.start, 5);
    EXPECT_EQ(second.event.end, 5);
    EXPECT_TRUE(second.event.knownToObserver);

    EventFilter died;
    died.kinds = {EventKind::LeaderDied};
    EXPECT_EQ(store_.events(series_, died).size(), 1u);
}

TEST_F(EventRecorderTest, MomentaryEventWithExplicitInterval) {
    EventSubject subject;
    subject.country = country_;
    subject.leader = tesla_;

    auto result = at(100, [&](const EventScope& scope) {
        return recordMomentaryEvent(scope, EventKind::LeaderRecruited, subject, true, 60, 100);
    });
    EXPECT_EQ(result.event.start, 60);
    EXPECT_EQ(result.event.end, 100);
}

TEST_F(EventRecorderTest, CloseEventNeverEndsBeforeStart) {
    HistoricalEvent event = at(7, [&](const EventScope& scope) {
        HistoricalEvent open;
        open.kind = EventKind::War;
        open.start = 7;
        open.subject.country = country_;
        return scope.store.appendEvent(scope.series, open);
    });

    at(7, [&](const EventScope& scope) {
        closeEvent(scope, event);
        return 0;
    });
    EXPECT_EQ(event.end, 7);

    // Closing twice keeps the first end.
    at(30, [&](const EventScope& scope) {
        closeEvent(scope, event);
        return 0;
    });
    EXPECT_EQ(store_.events(series_, {})[0].end, 7);
}

TEST_F(EventRecorderTest, WidenVisibilityIsOneWay) {
    HistoricalEvent event = at(0, [&](const EventScope& scope) {
        HistoricalEvent open;
        open.kind = EventKind::Tradition;
        open.start = 0;
        open.subject.country = country_;
        return scope.store.appendEvent(scope.series, open);
    });

    EXPECT_FALSE(at(1, [&](const EventScope& scope) { return widenVisibility(scope, event, false); }));
    EXPECT_TRUE(at(2, [&](const EventScope& scope) { return widenVisibility(scope, event, true); }));
    EXPECT_FALSE(at(3, [&](const EventScope& scope) { return widenVisibility(scope, event, true); }));
    EXPECT_TRUE(store_.events(series_, {})[0].knownToObserver);
}

TEST(FactChangeTest, Names) {
    EXPECT_EQ(factChangeToString(FactChange::Opened), "opened");
    EXPECT_EQ(factChangeToString(FactChange::Closed), "closed");
}
