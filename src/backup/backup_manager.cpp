#include "backup/backup_manager.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

BackupManager::BackupManager(const EngineSettings& settings,
                             std::shared_ptr<ShareMount> mount,
                             std::shared_ptr<TransferRunner> transfer)
    : settings_(settings)
    , events_(std::make_shared<EventBus>()) {
    cancellation_ = std::make_shared<CancellationController>(events_, settings_.elevationCommand);
    mount_ = mount ? std::move(mount) : std::make_shared<CifsMountController>(settings_);
    transfer_ = transfer ? std::move(transfer)
                         : std::make_shared<RsyncTransferRunner>(settings_, cancellation_, events_);
    history_ = std::make_shared<HistoryStore>(settings_.historyFile);
    config_ = std::make_shared<SourceConfigStore>(settings_.configFile);
    orchestrator_ = std::make_unique<BackupOrchestrator>(config_, mount_, transfer_, cancellation_,
                                                         history_, events_);
    if (!settings_.webhookUrl.empty()) {
        webhook_ = std::make_unique<WebhookNotifier>(settings_.webhookUrl, events_);
    }
}

BackupManager::~BackupManager() {
    if (webhook_) {
        webhook_->shutdown();
    }
}

RunResult BackupManager::startRun() {
    RunResult result = orchestrator_->run();
    if (!result.success) {
        setLastError(result.error);
    }
    return result;
}

std::future<RunResult> BackupManager::startRunAsync() {
    // The slot is claimed here so a second caller is rejected immediately,
    // not when the worker thread gets scheduled
    std::string error;
    if (!orchestrator_->claimRun(error)) {
        Logger::warning("Rejected backup request: " + error);
        setLastError(error);
        RunResult rejected;
        rejected.success = false;
        rejected.error = error;
        return ThreadUtils::ready(std::move(rejected));
    }

    return ThreadUtils::async([this]() {
        RunResult result = orchestrator_->runClaimed();
        if (!result.success) {
            setLastError(result.error);
        }
        return result;
    });
}

CancelResult BackupManager::cancelRun() {
    CancelResult result = cancellation_->cancel();
    if (!result.success) {
        setLastError(result.message);
    }
    return result;
}

bool BackupManager::isRunning() const {
    return cancellation_->isRunning();
}

json BackupManager::getStatus() const {
    return {
        {"running", cancellation_->isRunning()},
        {"phase", BackupOrchestrator::phaseToString(orchestrator_->phase())}
    };
}

std::vector<BackupRun> BackupManager::getHistory() const {
    return history_->list();
}

std::vector<std::string> BackupManager::getSources() const {
    return config_->loadSources();
}

bool BackupManager::setSources(const std::vector<std::string>& sources) {
    if (!config_->saveSources(sources)) {
        setLastError(config_->getLastError());
        return false;
    }
    Logger::info("Backup sources updated (" + std::to_string(sources.size()) + " source(s))");
    return true;
}

json BackupManager::getConfigSummary() const {
    return {
        {"smbServer", settings_.smbServer},
        {"smbShare", settings_.smbShare},
        {"smbUsername", settings_.smbUsername},
        {"smbPasswordSet", !settings_.smbPassword.empty()},
        {"mountPoint", settings_.mountPoint},
        {"sources", config_->loadSources()}
    };
}

bool BackupManager::testConnection() {
    if (cancellation_->isRunning() || !cancellation_->tryBeginRun()) {
        setLastError("Backup already in progress");
        return false;
    }

    bool ok = false;
    try {
        mount_->ensureMounted();

        auto probe = std::filesystem::path(mount_->mountPoint()) / ".connection-test";
        std::ofstream out(probe);
        out << "ok";
        out.close();
        if (!out) {
            setLastError("Failed to write test file to " + mount_->mountPoint());
        } else {
            std::error_code ec;
            std::filesystem::remove(probe, ec);
            if (ec) {
                Logger::warning("Failed to remove " + probe.string() + ": " + ec.message());
            }
            ok = true;
        }
    } catch (const std::exception& e) {
        setLastError(e.what());
    }

    mount_->unmount();
    cancellation_->endRun();

    if (ok) {
        Logger::info("SMB connection successful");
    } else {
        Logger::error("SMB connection test failed: " + getLastError());
    }
    return ok;
}

std::string BackupManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void BackupManager::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
}
