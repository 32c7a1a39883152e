#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <cstring>
#include <future>
#include <iomanip>
#include <sstream>
#include <pthread.h>

using json = nlohmann::json;

BackupCLI::BackupCLI(std::shared_ptr<BackupManager> manager, std::ostream& out)
    : manager_(std::move(manager))
    , out_(out) {
}

void BackupCLI::printUsage(std::ostream& out) {
    out << "Usage: sharemirror [options] <command> [args]\n"
        << "Commands:\n"
        << "  run [--json]             Run a backup now (Ctrl-C cancels)\n"
        << "  history [--limit N]      Show recorded runs, newest first\n"
        << "  sources                  List configured backup sources\n"
        << "  sources set <path>...    Replace the configured backup sources\n"
        << "  config                   Show the configuration summary\n"
        << "  test                     Test the SMB connection\n"
        << "\n"
        << "Options:\n"
        << "  --log-file <path>        Log file (default: /tmp/sharemirror.log)\n"
        << "  --log-level <level>      debug, info, warning, error or fatal (default: info)\n"
        << "  --server <host>          SMB server (env SMB_SERVER)\n"
        << "  --share <name>           SMB share (env SMB_SHARE)\n"
        << "  --username <name>        SMB username (env SMB_USERNAME, password from SMB_PASSWORD)\n"
        << "  --mount-point <path>     Local mount point (env SMB_MOUNT_POINT)\n"
        << "  --config-file <path>     Source list file (env BACKUP_CONFIG_FILE)\n"
        << "  --history-file <path>    History file (env BACKUP_HISTORY_FILE)\n"
        << "  --webhook <url>          POST run results to url (env BACKUP_WEBHOOK_URL)\n"
        << "  -h, --help               Show this help message\n"
        << "  -v, --version            Show version information\n";
}

std::string BackupCLI::formatBytes(int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    std::ostringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return ss.str();
}

std::string BackupCLI::formatDuration(int64_t ms) {
    int64_t seconds = ms / 1000;
    std::ostringstream ss;
    if (seconds >= 3600) {
        ss << seconds / 3600 << "h " << (seconds % 3600) / 60 << "m " << seconds % 60 << "s";
    } else if (seconds >= 60) {
        ss << seconds / 60 << "m " << seconds % 60 << "s";
    } else {
        ss << std::fixed << std::setprecision(1) << ms / 1000.0 << "s";
    }
    return ss.str();
}

int BackupCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage(out_);
        return 1;
    }

    const std::string& command = args[0];
    if (command == "run") {
        return handleRunCommand(args);
    } else if (command == "history") {
        return handleHistoryCommand(args);
    } else if (command == "sources") {
        return handleSourcesCommand(args);
    } else if (command == "config") {
        return handleConfigCommand();
    } else if (command == "test") {
        return handleTestCommand();
    }

    Logger::error("Unknown command: " + command);
    printUsage(out_);
    return 1;
}

void BackupCLI::printEvent(const Event& event, bool jsonOutput) {
    if (jsonOutput) {
        out_ << json{{"event", event.name}, {"data", event.payload}}.dump(-1, ' ', false, json::error_handler_t::replace)
             << std::endl;
        return;
    }

    const json& data = event.payload;
    if (event.name == "started") {
        out_ << "Backup started: " << data.value("sourcesCount", 0) << " source(s)" << std::endl;
    } else if (event.name == "source-start") {
        out_ << "[" << data.value("sourceIndex", 0) + 1 << "/" << data.value("sourcesCount", 0) << "] "
             << data.value("sourceName", std::string()) << " (" << data.value("sourcePath", std::string()) << ")"
             << std::endl;
    } else if (event.name == "progress") {
        out_ << "\r  " << std::setw(3) << data.value("percent", 0) << "%  "
             << formatBytes(data.value("transferredBytes", int64_t(0))) << "  "
             << data.value("speed", std::string()) << "        " << std::flush;
    } else if (event.name == "source-complete") {
        out_ << "\n  done: " << data.value("filesTransferred", int64_t(0)) << " file(s), "
             << formatBytes(data.value("transferredSize", int64_t(0))) << std::endl;
    } else if (event.name == "cancelled") {
        out_ << "\nCancelling backup..." << std::endl;
    } else if (event.name == "error") {
        out_ << "Backup failed: " << data.value("error", std::string()) << std::endl;
    }
}

int BackupCLI::handleRunCommand(const std::vector<std::string>& args) {
    bool jsonOutput = false;
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i] == "--json") {
            jsonOutput = true;
        } else {
            Logger::error("Unknown option for run: " + args[i]);
            printUsage(out_);
            return 1;
        }
    }

    // SIGINT and SIGTERM are taken synchronously below. The mask is set
    // before the worker thread exists so it inherits it.
    sigset_t signals;
    sigset_t previous;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, &previous);

    auto events = manager_->events();
    int subscription = events->subscribe([this, jsonOutput](const Event& event) {
        printEvent(event, jsonOutput);
    });

    std::future<RunResult> pending = manager_->startRunAsync();

    // A signal that arrives before the transfer starts is held until there
    // is a process to cancel
    bool cancelRequested = false;
    bool cancelDelivered = false;
    while (pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        struct timespec timeout{0, 200 * 1000 * 1000};
        int sig = sigtimedwait(&signals, nullptr, &timeout);
        if (sig > 0) {
            Logger::info(std::string("Received ") + strsignal(sig) + ", cancelling backup");
            cancelRequested = true;
        }
        if (cancelRequested && !cancelDelivered) {
            CancelResult cancelled = manager_->cancelRun();
            if (cancelled.success) {
                cancelDelivered = true;
            } else {
                Logger::debug("Cancellation pending: " + cancelled.message);
            }
        }
    }

    RunResult result = pending.get();
    events->unsubscribe(subscription);
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);

    if (jsonOutput) {
        out_ << json{{"event", "result"}, {"data", result}}.dump(-1, ' ', false, json::error_handler_t::replace)
             << std::endl;
        return result.success ? 0 : 1;
    }

    if (!result.success) {
        out_ << "Error: " << result.error << std::endl;
        return 1;
    }

    const json& details = result.details;
    out_ << details.value("message", std::string()) << std::endl
         << "  Sources:     " << details.value("sourcesBackedUp", 0) << std::endl
         << "  Files:       " << details.value("filesTransferred", int64_t(0)) << std::endl
         << "  Transferred: " << formatBytes(details.value("transferredSize", int64_t(0))) << std::endl
         << "  Duration:    " << formatDuration(details.value("duration", int64_t(0))) << std::endl;
    for (const auto& outcome : details.value("results", json::array())) {
        if (!outcome.value("success", false)) {
            out_ << "  Failed: " << outcome.value("source", std::string()) << ": "
                 << outcome.value("error", std::string()) << std::endl;
        }
    }
    return 0;
}

int BackupCLI::handleHistoryCommand(const std::vector<std::string>& args) {
    size_t limit = 0;
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i] == "--limit" && i + 1 < args.size()) {
            try {
                int value = std::stoi(args[++i]);
                if (value <= 0) {
                    throw std::invalid_argument("limit");
                }
                limit = static_cast<size_t>(value);
            } catch (const std::exception&) {
                Logger::error("Invalid value for --limit: " + args[i]);
                return 1;
            }
        } else {
            Logger::error("Unknown option for history: " + args[i]);
            printUsage(out_);
            return 1;
        }
    }

    std::vector<BackupRun> runs = manager_->getHistory();
    if (runs.empty()) {
        out_ << "No backups recorded" << std::endl;
        return 0;
    }
    if (limit > 0 && runs.size() > limit) {
        runs.resize(limit);
    }

    out_ << std::left << std::setw(26) << "TIMESTAMP" << std::setw(11) << "STATUS"
         << std::setw(10) << "DURATION" << std::setw(9) << "SOURCES" << std::setw(10) << "FILES"
         << "SIZE" << std::endl;
    for (const auto& run : runs) {
        out_ << std::left << std::setw(26) << run.timestamp << std::setw(11) << runStatusToString(run.status)
             << std::setw(10) << formatDuration(run.durationMs) << std::setw(9) << run.sourcesCount
             << std::setw(10) << run.filesTransferred << formatBytes(run.transferredSize);
        if (run.error) {
            out_ << "  (" << *run.error << ")";
        }
        out_ << std::endl;
    }
    return 0;
}

int BackupCLI::handleSourcesCommand(const std::vector<std::string>& args) {
    if (args.size() > 1 && args[1] == "set") {
        std::vector<std::string> sources(args.begin() + 2, args.end());
        if (sources.empty()) {
            Logger::error("Sources array required");
            return 1;
        }
        if (!manager_->setSources(sources)) {
            Logger::error("Failed to save sources: " + manager_->getLastError());
            return 1;
        }
        out_ << "Saved " << sources.size() << " source(s)" << std::endl;
        return 0;
    }
    if (args.size() > 1) {
        Logger::error("Unknown sources subcommand: " + args[1]);
        printUsage(out_);
        return 1;
    }

    std::vector<std::string> sources = manager_->getSources();
    if (sources.empty()) {
        out_ << "No backup sources configured" << std::endl;
        return 0;
    }
    for (const auto& source : sources) {
        out_ << source << std::endl;
    }
    return 0;
}

int BackupCLI::handleConfigCommand() {
    out_ << manager_->getConfigSummary().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}

int BackupCLI::handleTestCommand() {
    if (!manager_->testConnection()) {
        out_ << "SMB connection failed: " << manager_->getLastError() << std::endl;
        return 1;
    }
    out_ << "SMB connection successful" << std::endl;
    return 0;
}
