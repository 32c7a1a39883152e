#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_orchestrator.hpp"
#include "backup/backup_types.hpp"
#include "backup/cancellation_controller.hpp"
#include "backup/history_store.hpp"
#include "backup/mount_controller.hpp"
#include "backup/source_config_store.hpp"
#include "backup/transfer_runner.hpp"
#include "common/event_bus.hpp"
#include "common/webhook_notifier.hpp"
#include <nlohmann/json.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Entry point for callers: triggers, status, history and source management.
// Never throws; failures are returned and kept in getLastError().
class BackupManager {
public:
    explicit BackupManager(const EngineSettings& settings,
                           std::shared_ptr<ShareMount> mount = nullptr,
                           std::shared_ptr<TransferRunner> transfer = nullptr);
    ~BackupManager();

    BackupManager(const BackupManager&) = delete;
    BackupManager& operator=(const BackupManager&) = delete;

    // Backup operations
    RunResult startRun();
    std::future<RunResult> startRunAsync();
    CancelResult cancelRun();
    nlohmann::json getStatus() const;
    bool isRunning() const;

    // History
    std::vector<BackupRun> getHistory() const;

    // Configuration
    std::vector<std::string> getSources() const;
    bool setSources(const std::vector<std::string>& sources);
    nlohmann::json getConfigSummary() const;

    // Mounts the share, writes and removes a probe file, and unmounts
    bool testConnection();

    std::shared_ptr<EventBus> events() const { return events_; }
    BackupOrchestrator::Phase phase() const { return orchestrator_->phase(); }

    // Error handling
    std::string getLastError() const;

private:
    void setLastError(const std::string& error);

    EngineSettings settings_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<CancellationController> cancellation_;
    std::shared_ptr<ShareMount> mount_;
    std::shared_ptr<TransferRunner> transfer_;
    std::shared_ptr<HistoryStore> history_;
    std::shared_ptr<SourceConfigStore> config_;
    std::unique_ptr<BackupOrchestrator> orchestrator_;
    std::unique_ptr<WebhookNotifier> webhook_;

    std::string lastError_;
    mutable std::mutex mutex_;
};
