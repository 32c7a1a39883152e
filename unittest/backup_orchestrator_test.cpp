#include <gtest/gtest.h>
#include "backup/backup_orchestrator.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using testsupport::EventRecorder;
using testsupport::FakeMount;
using testsupport::TempDir;

namespace {

// Fails any source whose path contains "bad"
const char* kRsyncFailingBadBody =
    "for a in \"$@\"; do src=\"$dst\"; dst=\"$a\"; done\n"
    "case \"$src\" in *bad*) echo \"rsync: read errors mapping $src\" >&2; exit 23;; esac\n"
    "printf 'Number of regular files transferred: 1\\nTotal transferred file size: 100 bytes\\n'\n";

// Exits cleanly on SIGTERM so only the cancellation flag reveals the cancel
const char* kRsyncSlowBody =
    "trap 'exit 0' TERM\n"
    "printf '  1,024  10%%  1.00MB/s  0:00:05\\n'\n"
    "sleep 30 &\n"
    "wait\n";

// Fails with more multibyte stderr than the runner keeps
const char* kRsyncLongUtf8ErrorBody =
    "printf X >&2\n"
    "i=0\n"
    "while [ $i -lt 6000 ]; do printf '\\342\\202\\254' >&2; i=$((i+1)); done\n"
    "exit 23\n";

} // namespace

class BackupOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.elevationCommand.clear();
        settings_.stdbufPath.clear();
        events_ = std::make_shared<EventBus>();
        cancellation_ = std::make_shared<CancellationController>(events_);
        mount_ = std::make_shared<FakeMount>(dir_.file("share"));
        config_ = std::make_shared<SourceConfigStore>(dir_.file("config.json"));
        history_ = std::make_shared<HistoryStore>(dir_.file("history.json"));
        useRsync(testsupport::kRsyncOkBody);
    }

    void useRsync(const std::string& body) {
        settings_.rsyncPath = testsupport::writeScript(dir_, "fake-rsync", body);
        transfer_ = std::make_shared<RsyncTransferRunner>(settings_, cancellation_, events_);
        orchestrator_ = std::make_unique<BackupOrchestrator>(config_, mount_, transfer_, cancellation_,
                                                             history_, events_);
    }

    void configure(const std::vector<std::string>& sources) {
        ASSERT_TRUE(config_->saveSources(sources));
    }

    TempDir dir_;
    EngineSettings settings_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<CancellationController> cancellation_;
    std::shared_ptr<FakeMount> mount_;
    std::shared_ptr<SourceConfigStore> config_;
    std::shared_ptr<HistoryStore> history_;
    std::shared_ptr<TransferRunner> transfer_;
    std::unique_ptr<BackupOrchestrator> orchestrator_;
};

TEST_F(BackupOrchestratorTest, SuccessfulRun) {
    configure({dir_.makeDir("data/photos"), dir_.makeDir("data/documents")});
    EventRecorder recorder(events_);

    RunResult result = orchestrator_->run();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["status"], "success");
    EXPECT_EQ(result.details["message"], "Backup completed successfully");
    EXPECT_EQ(result.details["sourcesBackedUp"], 2);
    EXPECT_EQ(result.details["filesTransferred"], 4);
    EXPECT_EQ(result.details["transferredSize"], 2 * 65536);

    EXPECT_EQ(mount_->ensureCalls.load(), 1);
    EXPECT_EQ(mount_->unmountCalls.load(), 1);

    std::vector<std::string> expected{
        "started",
        "source-start", "progress", "progress", "source-complete",
        "source-start", "progress", "progress", "source-complete",
        "complete"
    };
    EXPECT_EQ(recorder.names(), expected);

    json started = recorder.last("started");
    EXPECT_EQ(started["sources"], json::array({"photos", "documents"}));
    json complete = recorder.last("complete");
    EXPECT_EQ(complete["success"], true);
    EXPECT_EQ(complete["cancelled"], false);
    EXPECT_EQ(complete["totalFiles"], 4);

    auto runs = history_->list();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].status, RunStatus::Success);
    EXPECT_EQ(runs[0].sourcesCount, 2);
    ASSERT_EQ(runs[0].results.size(), 2u);
    EXPECT_TRUE(runs[0].results[0].success);
    EXPECT_EQ(runs[0].timestamp, started["timestamp"].get<std::string>());
    EXPECT_EQ(orchestrator_->phase(), BackupOrchestrator::Phase::Idle);
}

TEST_F(BackupOrchestratorTest, MirrorsIntoBasenameUnderMountPoint) {
    std::string argsFile = dir_.file("args");
    useRsync("echo \"$@\" >> '" + argsFile + "'\n");
    std::string source = dir_.makeDir("data/music");
    configure({source});

    ASSERT_TRUE(orchestrator_->run().success);
    EXPECT_NE(testsupport::readFile(argsFile).find(mount_->mountPoint() + "/music/"), std::string::npos);
}

TEST_F(BackupOrchestratorTest, MissingSourcesAreSkipped) {
    std::string present = dir_.makeDir("data/present");
    configure({dir_.file("data/absent"), present});

    RunResult result = orchestrator_->run();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["sourcesBackedUp"], 1);
    ASSERT_EQ(result.details["results"].size(), 1u);
    EXPECT_EQ(result.details["results"][0]["source"].get<std::string>(), present);
}

TEST_F(BackupOrchestratorTest, NoSourcesConfigured) {
    EventRecorder recorder(events_);
    RunResult result = orchestrator_->run();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "No backup sources configured");
    EXPECT_EQ(mount_->ensureCalls.load(), 0);
    EXPECT_TRUE(history_->list().empty());
    EXPECT_EQ(recorder.names(), (std::vector<std::string>{"error"}));
}

TEST_F(BackupOrchestratorTest, NoValidSources) {
    configure({dir_.file("gone-1"), dir_.file("gone-2")});
    EventRecorder recorder(events_);

    RunResult result = orchestrator_->run();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "No valid backup sources found");
    EXPECT_EQ(mount_->ensureCalls.load(), 0);
    EXPECT_TRUE(history_->list().empty());
    EXPECT_EQ(recorder.last("error")["error"], "No valid backup sources found");
    EXPECT_FALSE(cancellation_->isRunActive());
}

TEST_F(BackupOrchestratorTest, MountFailureRecordsFailedRun) {
    configure({dir_.makeDir("data/photos")});
    mount_->failure = "mount error(112): Host is down";
    EventRecorder recorder(events_);

    RunResult result = orchestrator_->run();
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("Host is down"), std::string::npos);
    EXPECT_EQ(mount_->unmountCalls.load(), 1);

    auto runs = history_->list();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].status, RunStatus::Failed);
    EXPECT_EQ(runs[0].sourcesCount, 0);
    EXPECT_TRUE(runs[0].results.empty());
    ASSERT_TRUE(runs[0].error.has_value());
    EXPECT_NE(runs[0].error->find("Failed to mount SMB share"), std::string::npos);

    EXPECT_EQ(recorder.count("started"), 0u);
    EXPECT_EQ(recorder.count("error"), 1u);
    EXPECT_EQ(recorder.count("complete"), 0u);
}

TEST_F(BackupOrchestratorTest, FailedSourceMakesRunPartial) {
    useRsync(kRsyncFailingBadBody);
    configure({dir_.makeDir("data/good"), dir_.makeDir("data/bad"), dir_.makeDir("data/also-good")});
    EventRecorder recorder(events_);

    RunResult result = orchestrator_->run();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["status"], "partial");
    EXPECT_EQ(result.details["filesTransferred"], 2);

    const json& results = result.details["results"];
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0]["success"].get<bool>());
    EXPECT_FALSE(results[1]["success"].get<bool>());
    EXPECT_NE(results[1]["error"].get<std::string>().find("rsync exited with code 23"), std::string::npos);
    EXPECT_TRUE(results[2]["success"].get<bool>());

    EXPECT_EQ(recorder.count("source-complete"), 2u);
    EXPECT_EQ(recorder.last("complete")["success"], false);
    EXPECT_EQ(history_->list().at(0).status, RunStatus::Partial);
}

TEST_F(BackupOrchestratorTest, CancelStopsRemainingSources) {
    useRsync(kRsyncSlowBody);
    configure({dir_.makeDir("data/first"), dir_.makeDir("data/second")});
    EventRecorder recorder(events_);

    auto pending = ThreadUtils::async([this]() { return orchestrator_->run(); });
    ASSERT_TRUE(recorder.waitFor("progress"));
    ASSERT_TRUE(cancellation_->cancel().success);

    RunResult result = pending.get();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["status"], "cancelled");
    EXPECT_EQ(result.details["message"], "Backup cancelled by user");

    const json& results = result.details["results"];
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0]["success"].get<bool>());
    EXPECT_EQ(results[0]["error"], "Cancelled");

    EXPECT_EQ(recorder.count("source-start"), 1u);
    EXPECT_EQ(recorder.count("cancelled"), 1u);
    json complete = recorder.last("complete");
    EXPECT_EQ(complete["cancelled"], true);
    EXPECT_EQ(complete["success"], false);

    EXPECT_EQ(mount_->unmountCalls.load(), 1);
    EXPECT_EQ(history_->list().at(0).status, RunStatus::Cancelled);
    EXPECT_FALSE(cancellation_->isRunning());
}

TEST_F(BackupOrchestratorTest, NextRunClearsCancellation) {
    useRsync(kRsyncSlowBody);
    configure({dir_.makeDir("data/first")});
    EventRecorder recorder(events_);

    auto pending = ThreadUtils::async([this]() { return orchestrator_->run(); });
    ASSERT_TRUE(recorder.waitFor("progress"));
    ASSERT_TRUE(cancellation_->cancel().success);
    ASSERT_EQ(pending.get().details["status"], "cancelled");

    useRsync(testsupport::kRsyncOkBody);
    RunResult result = orchestrator_->run();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["status"], "success");
}

TEST_F(BackupOrchestratorTest, OverlappingRunIsRejected) {
    configure({dir_.makeDir("data/photos")});
    std::string error;
    ASSERT_TRUE(orchestrator_->claimRun(error));

    RunResult rejected = orchestrator_->run();
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error, "Backup already in progress");
    EXPECT_EQ(mount_->ensureCalls.load(), 0);
    EXPECT_TRUE(history_->list().empty());

    RunResult result = orchestrator_->runClaimed();
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(orchestrator_->claimRun(error));
    cancellation_->endRun();
}

TEST_F(BackupOrchestratorTest, BackToBackRunsAreOrderedNewestFirst) {
    configure({dir_.makeDir("data/photos")});
    ASSERT_TRUE(orchestrator_->run().success);
    ASSERT_TRUE(orchestrator_->run().success);

    auto runs = history_->list();
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_NE(runs[0].timestamp, runs[1].timestamp);
    EXPECT_GT(runs[0].timestamp, runs[1].timestamp);
}

TEST_F(BackupOrchestratorTest, UnwritableHistoryDoesNotChangeOutcome) {
    testsupport::writeFile(dir_.file("blocker"), "");
    history_ = std::make_shared<HistoryStore>(dir_.file("blocker/history.json"));
    orchestrator_ = std::make_unique<BackupOrchestrator>(config_, mount_, transfer_, cancellation_,
                                                         history_, events_);
    configure({dir_.makeDir("data/photos")});

    RunResult result = orchestrator_->run();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["status"], "success");
}

TEST_F(BackupOrchestratorTest, LongMultibyteErrorIsStillRecorded) {
    useRsync(kRsyncLongUtf8ErrorBody);
    configure({dir_.makeDir("data/photos")});

    RunResult result = orchestrator_->run();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.details["status"], "partial");

    auto runs = history_->list();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].status, RunStatus::Partial);
    ASSERT_EQ(runs[0].results.size(), 1u);
    ASSERT_TRUE(runs[0].results[0].error.has_value());
    EXPECT_NE(runs[0].results[0].error->find("rsync exited with code 23"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
