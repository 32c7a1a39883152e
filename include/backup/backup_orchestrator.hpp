#pragma once

#include "backup/backup_types.hpp"
#include "backup/cancellation_controller.hpp"
#include "backup/history_store.hpp"
#include "backup/mount_controller.hpp"
#include "backup/source_config_store.hpp"
#include "backup/transfer_runner.hpp"
#include "common/event_bus.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Validate -> mount -> mirror each source -> unmount -> record -> notify.
class BackupOrchestrator {
public:
    enum class Phase {
        Idle,
        Validating,
        Mounting,
        Syncing,
        Unmounting,
        Recording
    };

    BackupOrchestrator(std::shared_ptr<SourceConfigStore> config,
                       std::shared_ptr<ShareMount> mount,
                       std::shared_ptr<TransferRunner> transfer,
                       std::shared_ptr<CancellationController> cancellation,
                       std::shared_ptr<HistoryStore> history,
                       std::shared_ptr<EventBus> events);

    // claimRun() followed by runClaimed()
    RunResult run();

    // Takes the single run slot. Fails without side effects if a run or a
    // transfer is already active.
    bool claimRun(std::string& error);

    // Executes a run whose slot was taken with claimRun() and releases it.
    RunResult runClaimed();

    Phase phase() const { return phase_.load(); }
    static std::string phaseToString(Phase phase);

    // Configured sources that exist on disk, in configured order
    std::vector<std::string> resolveSources(const std::vector<std::string>& configured) const;

private:
    RunResult execute();
    RunResult abortBeforeTransfer(const std::string& timestamp,
                                  std::chrono::steady_clock::time_point started,
                                  const std::string& error);
    void setPhase(Phase phase);
    std::string nextTimestamp();

    std::shared_ptr<SourceConfigStore> config_;
    std::shared_ptr<ShareMount> mount_;
    std::shared_ptr<TransferRunner> transfer_;
    std::shared_ptr<CancellationController> cancellation_;
    std::shared_ptr<HistoryStore> history_;
    std::shared_ptr<EventBus> events_;

    std::atomic<Phase> phase_{Phase::Idle};
    int64_t lastTimestampMs_{0};
};
