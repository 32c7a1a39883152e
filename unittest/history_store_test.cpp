#include <gtest/gtest.h>
#include "backup/history_store.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using testsupport::TempDir;

namespace {

BackupRun makeRun(const std::string& timestamp, RunStatus status = RunStatus::Success) {
    BackupRun run;
    run.timestamp = timestamp;
    run.durationMs = 1500;
    run.status = status;
    run.sourcesCount = 1;
    run.filesTransferred = 3;
    run.transferredSize = 4096;
    TransferOutcome outcome;
    outcome.source = "/srv/data";
    outcome.success = true;
    outcome.filesTransferred = 3;
    outcome.transferredBytes = 4096;
    run.results.push_back(outcome);
    return run;
}

} // namespace

class HistoryStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(HistoryStoreTest, MissingFileIsEmpty) {
    HistoryStore store(dir_.file("history.json"));
    EXPECT_TRUE(store.list().empty());
}

TEST_F(HistoryStoreTest, CorruptFileIsEmpty) {
    testsupport::writeFile(dir_.file("history.json"), "{not json");
    HistoryStore store(dir_.file("history.json"));
    EXPECT_TRUE(store.list().empty());
}

TEST_F(HistoryStoreTest, NonArrayFileIsEmpty) {
    testsupport::writeFile(dir_.file("history.json"), "{\"timestamp\": \"x\"}");
    HistoryStore store(dir_.file("history.json"));
    EXPECT_TRUE(store.list().empty());
}

TEST_F(HistoryStoreTest, AppendOverCorruptFileStartsFresh) {
    testsupport::writeFile(dir_.file("history.json"), "garbage");
    HistoryStore store(dir_.file("history.json"));
    ASSERT_TRUE(store.append(makeRun("2026-01-01T00:00:00.000Z")));
    ASSERT_EQ(store.list().size(), 1u);
}

TEST_F(HistoryStoreTest, NewestFirst) {
    HistoryStore store(dir_.file("history.json"));
    ASSERT_TRUE(store.append(makeRun("2026-01-01T00:00:00.000Z")));
    ASSERT_TRUE(store.append(makeRun("2026-01-02T00:00:00.000Z", RunStatus::Partial)));

    auto runs = store.list();
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].timestamp, "2026-01-02T00:00:00.000Z");
    EXPECT_EQ(runs[0].status, RunStatus::Partial);
    EXPECT_EQ(runs[1].timestamp, "2026-01-01T00:00:00.000Z");
}

TEST_F(HistoryStoreTest, CapsAtFiftyEntries) {
    HistoryStore store(dir_.file("history.json"));
    for (int i = 0; i < 55; i++) {
        ASSERT_TRUE(store.append(makeRun("run-" + std::to_string(i))));
    }

    auto runs = store.list();
    ASSERT_EQ(runs.size(), HistoryStore::kMaxEntries);
    EXPECT_EQ(runs.front().timestamp, "run-54");
    EXPECT_EQ(runs.back().timestamp, "run-5");
}

TEST_F(HistoryStoreTest, CreatesParentDirectory) {
    std::string path = dir_.file("nested/dir/history.json");
    HistoryStore store(path);
    ASSERT_TRUE(store.append(makeRun("2026-01-01T00:00:00.000Z")));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(HistoryStoreTest, UnwritablePathReportsFailureWithoutThrowing) {
    // A regular file where the parent directory should be
    testsupport::writeFile(dir_.file("blocker"), "");
    HistoryStore store(dir_.file("blocker/history.json"));
    bool appended = true;
    EXPECT_NO_THROW(appended = store.append(makeRun("2026-01-01T00:00:00.000Z")));
    EXPECT_FALSE(appended);
}

TEST_F(HistoryStoreTest, FailedRunHasNoResults) {
    HistoryStore store(dir_.file("history.json"));
    BackupRun run;
    run.timestamp = "2026-01-01T00:00:00.000Z";
    run.status = RunStatus::Failed;
    run.error = "Failed to mount SMB share: permission denied";
    ASSERT_TRUE(store.append(run));

    json raw = json::parse(testsupport::readFile(dir_.file("history.json")));
    ASSERT_TRUE(raw.is_array());
    EXPECT_EQ(raw[0]["status"], "failed");
    EXPECT_EQ(raw[0]["sourcesCount"], 0);
    EXPECT_FALSE(raw[0].contains("results"));
    EXPECT_EQ(raw[0]["error"], "Failed to mount SMB share: permission denied");
}

TEST_F(HistoryStoreTest, ReadsLegacyKeysAndKeepsUnknownOnes) {
    json legacy = json::array({
        {
            {"timestamp", "2025-06-01T10:00:00.000Z"},
            {"duration", 42000},
            {"status", "partial"},
            {"sourcesCount", 2},
            {"filesTransferred", 10},
            {"transferredSize", 2048},
            {"host", "nas-box"},
            {"results", json::array({
                {{"source", "/a"}, {"success", true}, {"filesTransferred", 10}, {"transferredSize", 2048}},
                {{"source", "/b"}, {"success", false}, {"error", "rsync exited with code 23"}}
            })}
        }
    });
    testsupport::writeFile(dir_.file("history.json"), legacy.dump());

    HistoryStore store(dir_.file("history.json"));
    auto runs = store.list();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].durationMs, 42000);
    ASSERT_EQ(runs[0].results.size(), 2u);
    EXPECT_EQ(runs[0].results[0].transferredBytes, 2048);
    ASSERT_TRUE(runs[0].results[1].error.has_value());
    EXPECT_EQ(*runs[0].results[1].error, "rsync exited with code 23");

    ASSERT_TRUE(store.append(makeRun("2026-01-01T00:00:00.000Z")));
    json raw = json::parse(testsupport::readFile(dir_.file("history.json")));
    ASSERT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw[1]["host"], "nas-box");
}

TEST_F(HistoryStoreTest, SkipsMalformedEntries) {
    json mixed = json::array({42, "text", {{"timestamp", "ok"}, {"status", "success"}}});
    testsupport::writeFile(dir_.file("history.json"), mixed.dump());

    HistoryStore store(dir_.file("history.json"));
    auto runs = store.list();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].timestamp, "ok");
}

TEST_F(HistoryStoreTest, InvalidUtf8InErrorIsStillRecorded) {
    HistoryStore store(dir_.file("history.json"));
    BackupRun run = makeRun("2026-01-01T00:00:00.000Z", RunStatus::Partial);
    run.results[0].success = false;
    run.results[0].error = "rsync: \xa9 bad";

    ASSERT_TRUE(store.append(run));
    auto runs = store.list();
    ASSERT_EQ(runs.size(), 1u);
    ASSERT_TRUE(runs[0].results[0].error.has_value());
    EXPECT_EQ(*runs[0].results[0].error, "rsync: \xef\xbf\xbd bad");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
