#pragma once

#include "common/command_runner.hpp"
#include "common/event_bus.hpp"
#include "common/process_tree.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

struct CancelResult {
    bool success{false};
    std::string message;
};

// Process-wide run token: the pid of the transfer currently in flight, the
// cancellation flag, and the slot that keeps runs from overlapping.
class CancellationController {
public:
    CancellationController(std::shared_ptr<EventBus> events,
                           std::vector<std::string> elevationCommand = {},
                           std::shared_ptr<CommandRunner> runner = nullptr,
                           ProcessTree processTree = ProcessTree());

    // Sets the flag and terminates the registered process and all of its
    // descendants. Fails with "No backup in progress" when nothing is
    // registered, without touching the flag.
    CancelResult cancel();

    // True iff a transfer process is registered
    bool isRunning() const;
    bool isCancelled() const { return cancelled_.load(); }
    void resetCancelled() { cancelled_.store(false); }

    void registerProcess(pid_t pid);
    void clearProcess(pid_t pid);

    // At most one run may hold the slot at a time
    bool tryBeginRun();
    void endRun();
    bool isRunActive() const { return runActive_.load(); }

private:
    void signalProcessTree(pid_t pid);
    bool signalElevated(const std::vector<pid_t>& pids);

    std::shared_ptr<EventBus> events_;
    std::vector<std::string> elevationCommand_;
    std::shared_ptr<CommandRunner> runner_;
    ProcessTree processTree_;

    // Always taken before mutex_
    std::mutex signalMutex_;
    mutable std::mutex mutex_;
    std::optional<pid_t> activePid_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> runActive_{false};
};

// Registers a pid for the lifetime of the guard, or until release().
class ProcessRegistration {
public:
    ProcessRegistration(CancellationController& controller, pid_t pid)
        : controller_(controller), pid_(pid), active_(true) {
        controller_.registerProcess(pid_);
    }
    ~ProcessRegistration() { release(); }

    ProcessRegistration(const ProcessRegistration&) = delete;
    ProcessRegistration& operator=(const ProcessRegistration&) = delete;

    void release() {
        if (active_) {
            controller_.clearProcess(pid_);
            active_ = false;
        }
    }

private:
    CancellationController& controller_;
    pid_t pid_;
    bool active_;
};
