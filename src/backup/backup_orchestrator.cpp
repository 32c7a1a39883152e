#include "backup/backup_orchestrator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <set>

using json = nlohmann::json;

namespace {

// Releases the run slot however the run ends
class RunSlot {
public:
    explicit RunSlot(CancellationController& cancellation) : cancellation_(cancellation) {}
    ~RunSlot() { cancellation_.endRun(); }

    RunSlot(const RunSlot&) = delete;
    RunSlot& operator=(const RunSlot&) = delete;

private:
    CancellationController& cancellation_;
};

int64_t elapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
}

bool isWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto p = path.lexically_normal();
    auto r = root.lexically_normal();
    auto mismatch = std::mismatch(r.begin(), r.end(), p.begin(), p.end());
    return mismatch.first == r.end() || (std::next(mismatch.first) == r.end() && mismatch.first->empty());
}

} // namespace

BackupOrchestrator::BackupOrchestrator(std::shared_ptr<SourceConfigStore> config,
                                       std::shared_ptr<ShareMount> mount,
                                       std::shared_ptr<TransferRunner> transfer,
                                       std::shared_ptr<CancellationController> cancellation,
                                       std::shared_ptr<HistoryStore> history,
                                       std::shared_ptr<EventBus> events)
    : config_(std::move(config))
    , mount_(std::move(mount))
    , transfer_(std::move(transfer))
    , cancellation_(std::move(cancellation))
    , history_(std::move(history))
    , events_(std::move(events)) {
}

std::string BackupOrchestrator::phaseToString(Phase phase) {
    switch (phase) {
        case Phase::Idle:       return "idle";
        case Phase::Validating: return "validating";
        case Phase::Mounting:   return "mounting";
        case Phase::Syncing:    return "syncing";
        case Phase::Unmounting: return "unmounting";
        case Phase::Recording:  return "recording";
        default:                return "unknown";
    }
}

void BackupOrchestrator::setPhase(Phase phase) {
    phase_.store(phase);
    Logger::debug("Backup phase: " + phaseToString(phase));
}

std::string BackupOrchestrator::nextTimestamp() {
    auto now = std::chrono::system_clock::now();
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    // Two runs in the same millisecond still get distinct, ordered timestamps
    if (ms <= lastTimestampMs_) {
        ms = lastTimestampMs_ + 1;
    }
    lastTimestampMs_ = ms;
    return utils::isoTimestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(ms)));
}

std::vector<std::string> BackupOrchestrator::resolveSources(const std::vector<std::string>& configured) const {
    std::vector<std::string> valid;
    std::set<std::string> seen;
    const std::string mountPoint = mount_ ? mount_->mountPoint() : std::string();

    for (const auto& source : configured) {
        std::error_code ec;
        if (!std::filesystem::exists(source, ec)) {
            Logger::warning("Skipping missing backup source: " + source);
            continue;
        }
        // Both cases are passed through unchanged, only flagged
        if (!seen.insert(source).second) {
            Logger::warning("Backup source listed more than once: " + source);
        }
        if (!mountPoint.empty() && isWithin(mountPoint, source)) {
            Logger::warning("Backup source " + source + " contains the mount point " + mountPoint);
        }
        valid.push_back(source);
    }
    return valid;
}

bool BackupOrchestrator::claimRun(std::string& error) {
    if (cancellation_->isRunning()) {
        error = "Backup already in progress";
        return false;
    }
    if (!cancellation_->tryBeginRun()) {
        error = "Backup already in progress";
        return false;
    }
    return true;
}

RunResult BackupOrchestrator::run() {
    std::string error;
    if (!claimRun(error)) {
        Logger::warning("Rejected backup request: " + error);
        RunResult rejected;
        rejected.success = false;
        rejected.error = error;
        return rejected;
    }
    return runClaimed();
}

RunResult BackupOrchestrator::runClaimed() {
    RunSlot slot(*cancellation_);
    RunResult result = execute();
    setPhase(Phase::Idle);
    return result;
}

RunResult BackupOrchestrator::abortBeforeTransfer(const std::string& timestamp,
                                                  std::chrono::steady_clock::time_point started,
                                                  const std::string& error) {
    setPhase(Phase::Unmounting);
    mount_->unmount();

    setPhase(Phase::Recording);
    BackupRun entry;
    entry.timestamp = timestamp;
    entry.durationMs = elapsedMs(started);
    entry.status = RunStatus::Failed;
    entry.error = error;
    history_->append(entry);

    events_->publish("error", {{"error", error}});

    RunResult result;
    result.success = false;
    result.error = error;
    return result;
}

RunResult BackupOrchestrator::execute() {
    const auto started = std::chrono::steady_clock::now();
    const std::string timestamp = nextTimestamp();

    setPhase(Phase::Validating);
    cancellation_->resetCancelled();

    std::vector<std::string> sources;
    try {
        std::vector<std::string> configured = config_->loadSources();
        if (configured.empty()) {
            throw NoValidSourcesError("No backup sources configured");
        }
        sources = resolveSources(configured);
        if (sources.empty()) {
            throw NoValidSourcesError("No valid backup sources found");
        }
    } catch (const NoValidSourcesError& e) {
        // Nothing was attempted, so nothing is recorded
        Logger::error(std::string("Backup not started: ") + e.what());
        events_->publish("error", {{"error", e.what()}});
        RunResult result;
        result.success = false;
        result.error = e.what();
        return result;
    }

    const int sourcesCount = static_cast<int>(sources.size());
    std::vector<TransferOutcome> results;
    int64_t totalFiles = 0;
    int64_t totalTransferred = 0;

    try {
        setPhase(Phase::Mounting);
        mount_->ensureMounted();
    } catch (const std::exception& e) {
        Logger::error(std::string("Backup aborted: ") + e.what());
        return abortBeforeTransfer(timestamp, started, e.what());
    }

    try {
        json names = json::array();
        for (const auto& source : sources) {
            names.push_back(utils::baseName(source));
        }
        events_->publish("started", {
            {"timestamp", timestamp},
            {"sourcesCount", sourcesCount},
            {"sources", names}
        });
        Logger::info("Backup started with " + std::to_string(sourcesCount) + " source(s)");

        setPhase(Phase::Syncing);
        for (int i = 0; i < sourcesCount; ++i) {
            if (cancellation_->isCancelled()) {
                break;
            }

            const std::string& source = sources[i];
            const std::string sourceName = utils::baseName(source);
            const std::string destPath = (std::filesystem::path(mount_->mountPoint()) / sourceName).string();

            events_->publish("source-start", {
                {"sourceIndex", i},
                {"sourceName", sourceName},
                {"sourcePath", source},
                {"sourcesCount", sourcesCount}
            });

            TransferOutcome outcome;
            outcome.source = source;
            try {
                TransferStats stats = transfer_->runTransfer(source, destPath, i, sourceName, sourcesCount);
                outcome.success = true;
                outcome.filesTransferred = stats.filesTransferred;
                outcome.transferredBytes = stats.transferredBytes;
                results.push_back(outcome);

                totalFiles += stats.filesTransferred;
                totalTransferred += stats.transferredBytes;

                events_->publish("source-complete", {
                    {"sourceIndex", i},
                    {"sourceName", sourceName},
                    {"filesTransferred", stats.filesTransferred},
                    {"transferredSize", stats.transferredBytes}
                });
            } catch (const CancelledError&) {
                outcome.error = "Cancelled";
                results.push_back(outcome);
                break;
            } catch (const std::exception& e) {
                if (cancellation_->isCancelled()) {
                    outcome.error = "Cancelled";
                    results.push_back(outcome);
                    break;
                }
                // One failed source never aborts the others
                Logger::error("Backup of " + source + " failed: " + e.what());
                outcome.error = e.what();
                results.push_back(outcome);
            }
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Backup aborted: ") + e.what());
        return abortBeforeTransfer(timestamp, started, e.what());
    }

    setPhase(Phase::Unmounting);
    mount_->unmount();

    const bool cancelled = cancellation_->isCancelled();
    const bool allSuccess = std::all_of(results.begin(), results.end(),
                                        [](const TransferOutcome& r) { return r.success; });
    RunStatus status = cancelled ? RunStatus::Cancelled : (allSuccess ? RunStatus::Success : RunStatus::Partial);
    const int64_t duration = elapsedMs(started);

    setPhase(Phase::Recording);
    BackupRun entry;
    entry.timestamp = timestamp;
    entry.durationMs = duration;
    entry.status = status;
    entry.sourcesCount = sourcesCount;
    entry.filesTransferred = totalFiles;
    entry.transferredSize = totalTransferred;
    entry.results = results;
    history_->append(entry);

    events_->publish("complete", {
        {"success", !cancelled && allSuccess},
        {"cancelled", cancelled},
        {"duration", duration},
        {"totalFiles", totalFiles},
        {"totalSize", totalTransferred},
        {"results", results}
    });

    std::string message;
    switch (status) {
        case RunStatus::Success:   message = "Backup completed successfully"; break;
        case RunStatus::Partial:   message = "Backup completed with some errors"; break;
        case RunStatus::Cancelled: message = "Backup cancelled by user"; break;
        default:                   break;
    }
    Logger::info(message + " (" + std::to_string(duration) + " ms)");

    RunResult result;
    result.success = true;
    result.details = {
        {"status", runStatusToString(status)},
        {"message", message},
        {"duration", duration},
        {"sourcesBackedUp", sourcesCount},
        {"filesTransferred", totalFiles},
        {"transferredSize", totalTransferred},
        {"results", results}
    };
    return result;
}
