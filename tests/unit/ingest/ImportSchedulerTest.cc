#include "chronicle/ingest/ImportScheduler.hh"
#include "chronicle/store/MemoryStore.hh"
#include "unit/timeline/SaveBuilder.hh"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace chronicle;
using chronicle::test::SaveBuilder;

class ImportSchedulerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "chronicle_scheduler_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override { std::filesystem::remove_all(tempDir_); }

    SaveFile write(const std::string& series, const std::string& name, const std::string& content) {
        auto dir = tempDir_ / series;
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        std::ofstream(path) << content;
        return SaveFile{series, path, std::filesystem::last_write_time(path)};
    }

    SaveFile snapshot(const std::string& series, const std::string& date) {
        SaveBuilder save(date);
        save.player("alice", 0).system(1, "Sol", {100}).country(0, "Earth").starbase(100, 0);
        return write(series, date + ".sav", save.text());
    }

    std::vector<Day> snapshotDays(const std::string& series) const {
        auto id = store_.findSeries(series);
        return id ? store_.snapshots(*id) : std::vector<Day>{};
    }

    std::filesystem::path tempDir_;
    MemoryStore store_;
    TimelineEngine engine_{store_};
    Utils::ThreadPoolExecutor pool_{4};
};

TEST_F(ImportSchedulerTest, AppliesEachSeriesInOrder) {
    std::vector<SaveFile> files;
    for (const char* date : {"2200.01.01", "2200.02.01", "2200.03.01", "2200.04.01", "2200.05.01"}) {
        files.push_back(snapshot("game_a", date));
    }
    files.push_back(snapshot("game_b", "2210.01.01"));
    files.push_back(snapshot("game_b", "2210.06.01"));

    ImportScheduler scheduler(engine_, SnapshotLoader{}, pool_, 2);
    EXPECT_EQ(scheduler.window(), 2u);

    std::vector<std::string> seen;
    auto outcomes = scheduler.importFiles(files, [&seen](const ImportOutcome& outcome) {
        seen.push_back(outcome.file.path.filename().string());
    });

    ASSERT_EQ(outcomes.size(), files.size());
    for (const auto& outcome : outcomes) {
        EXPECT_TRUE(outcome.imported()) << outcome.failureReason();
    }
    EXPECT_EQ(seen.size(), files.size());
    EXPECT_EQ(snapshotDays("game_a"), (std::vector<Day>{0, 30, 60, 90, 120}));
    EXPECT_EQ(snapshotDays("game_b"), (std::vector<Day>{3600, 3750}));
}

TEST_F(ImportSchedulerTest, FailuresAreReportedPerFile) {
    std::vector<SaveFile> files = {
        snapshot("game_a", "2200.01.01"),
        write("game_a", "broken.sav", "date=\"2200.02.01\"\ncountry={ 0={ name=\"Earth\" }\n}\n}\n"),
        snapshot("game_a", "2200.03.01"),
        snapshot("game_a", "2200.02.01"),
    };
    files.push_back(files[0]);
    files.back().path = tempDir_ / "game_a" / "vanished.sav";

    ImportScheduler scheduler(engine_, SnapshotLoader{}, pool_);
    EXPECT_GT(scheduler.window(), 0u);
    auto outcomes = scheduler.importFiles(files);
    ASSERT_EQ(outcomes.size(), 5u);

    EXPECT_TRUE(outcomes[0].imported());

    EXPECT_FALSE(outcomes[1].imported());
    ASSERT_TRUE(outcomes[1].loadError.has_value());
    EXPECT_NE(outcomes[1].failureReason().find("broken.sav"), std::string::npos);

    EXPECT_TRUE(outcomes[2].imported());

    // Older than the newest committed snapshot.
    EXPECT_FALSE(outcomes[3].imported());
    ASSERT_TRUE(outcomes[3].report.has_value());
    EXPECT_EQ(outcomes[3].report->status, SnapshotStatus::RejectedOutOfOrder);
    EXPECT_TRUE(outcomes[3].outOfOrder());
    EXPECT_FALSE(outcomes[1].outOfOrder());
    std::string reason = outcomes[3].failureReason();
    EXPECT_EQ(reason.rfind(std::string(snapshotStatusToString(SnapshotStatus::RejectedOutOfOrder)), 0), 0u) << reason;
    EXPECT_NE(reason.find("2200.03.01"), std::string::npos) << reason;

    EXPECT_TRUE(outcomes[4].loadError.has_value());
    EXPECT_EQ(snapshotDays("game_a"), (std::vector<Day>{0, 60}));
}

TEST_F(ImportSchedulerTest, CancelStopsBetweenSnapshots) {
    std::vector<SaveFile> files;
    for (const char* date : {"2200.01.01", "2200.02.01", "2200.03.01"}) {
        files.push_back(snapshot("game_a", date));
    }

    ImportScheduler scheduler(engine_, SnapshotLoader{}, pool_, 1);
    auto outcomes = scheduler.importFiles(files, [&scheduler](const ImportOutcome&) { scheduler.cancel(); });
    EXPECT_TRUE(scheduler.cancelled());
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(snapshotDays("game_a"), std::vector<Day>{0});

    scheduler.reset();
    auto rest = scheduler.importFiles({files[1], files[2]});
    EXPECT_EQ(rest.size(), 2u);
    EXPECT_EQ(snapshotDays("game_a"), (std::vector<Day>{0, 30, 60}));
}
