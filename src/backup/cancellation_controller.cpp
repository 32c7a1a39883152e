#include "backup/cancellation_controller.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <nlohmann/json.hpp>

CancellationController::CancellationController(std::shared_ptr<EventBus> events,
                                               std::vector<std::string> elevationCommand,
                                               std::shared_ptr<CommandRunner> runner,
                                               ProcessTree processTree)
    : events_(std::move(events))
    , elevationCommand_(std::move(elevationCommand))
    , runner_(runner ? std::move(runner) : std::make_shared<CommandRunner>())
    , processTree_(std::move(processTree)) {
}

CancelResult CancellationController::cancel() {
    {
        // Held while signalling so the transfer cannot deregister and reap
        // its pid underneath us. Status queries only take mutex_.
        std::lock_guard<std::mutex> signalLock(signalMutex_);
        pid_t pid;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!activePid_) {
                return {false, "No backup in progress"};
            }
            pid = *activePid_;
            cancelled_.store(true);
        }

        Logger::info("Cancelling backup, terminating process tree of pid " + std::to_string(pid));
        signalProcessTree(pid);
    }

    if (events_) {
        events_->publish("cancelled", {{"reason", "user"}});
    }
    return {true, "Backup cancellation requested"};
}

bool CancellationController::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activePid_.has_value();
}

void CancellationController::registerProcess(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    activePid_ = pid;
}

void CancellationController::clearProcess(pid_t pid) {
    // Waits for a cancel() that is still signalling this pid
    std::lock_guard<std::mutex> signalLock(signalMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (activePid_ && *activePid_ == pid) {
        activePid_.reset();
    }
}

bool CancellationController::tryBeginRun() {
    bool expected = false;
    return runActive_.compare_exchange_strong(expected, true);
}

void CancellationController::endRun() {
    runActive_.store(false);
}

void CancellationController::signalProcessTree(pid_t pid) {
    // The wrapper does not reliably forward SIGTERM to the tool it runs, so
    // the descendants are signalled explicitly before the wrapper itself.
    std::vector<pid_t> descendants = processTree_.descendantsOf(pid);
    std::vector<pid_t> denied;

    for (pid_t child : descendants) {
        if (::kill(child, SIGTERM) != 0) {
            if (errno == EPERM) {
                denied.push_back(child);
            } else if (errno != ESRCH) {
                Logger::warning("Failed to signal pid " + std::to_string(child) + ": " + strerror(errno));
            }
        }
    }
    if (!denied.empty() && !signalElevated(denied)) {
        Logger::warning("Could not signal " + std::to_string(denied.size()) + " elevated child process(es)");
    }

    if (::kill(pid, SIGTERM) != 0) {
        if (errno == EPERM) {
            if (!signalElevated({pid})) {
                Logger::warning("Could not signal wrapper pid " + std::to_string(pid));
            }
        } else if (errno != ESRCH) {
            Logger::warning("Failed to signal pid " + std::to_string(pid) + ": " + strerror(errno));
        }
    }
}

bool CancellationController::signalElevated(const std::vector<pid_t>& pids) {
    if (elevationCommand_.empty()) {
        return false;
    }

    std::vector<std::string> argv = elevationCommand_;
    argv.push_back("kill");
    argv.push_back("-TERM");
    for (pid_t pid : pids) {
        argv.push_back(std::to_string(pid));
    }

    CommandResult result = runner_->run(argv, std::chrono::seconds(10));
    if (!result.succeeded()) {
        // A process that exited in the meantime makes kill fail; not an error
        Logger::debug("Elevated kill exited with " + std::to_string(result.exitCode) + ": " + result.errorOutput);
        return false;
    }
    return true;
}
