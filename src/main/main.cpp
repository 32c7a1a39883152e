#include "backup/backup_cli.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_manager.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

const char* kVersion = "1.0.0";

struct GlobalOptions {
    std::string logFile{"/tmp/sharemirror.log"};
    std::string logLevel{"info"};
    std::string server;
    std::string share;
    std::string username;
    std::string mountPoint;
    std::string configFile;
    std::string historyFile;
    std::string webhook;
};

bool takeValue(int argc, char** argv, int& i, std::string& value) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << argv[i] << " requires a value" << std::endl;
        return false;
    }
    value = argv[++i];
    return true;
}

} // namespace

int main(int argc, char** argv) {
    GlobalOptions options;
    std::vector<std::string> args;

    // Global options come before the command; everything from the command on
    // belongs to the command
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!args.empty()) {
            args.push_back(arg);
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            BackupCLI::printUsage(std::cout);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "sharemirror version " << kVersion << std::endl;
            return 0;
        }

        bool ok = true;
        if (arg == "--log-file") {
            ok = takeValue(argc, argv, i, options.logFile);
        } else if (arg == "--log-level") {
            ok = takeValue(argc, argv, i, options.logLevel);
        } else if (arg == "--server") {
            ok = takeValue(argc, argv, i, options.server);
        } else if (arg == "--share") {
            ok = takeValue(argc, argv, i, options.share);
        } else if (arg == "--username") {
            ok = takeValue(argc, argv, i, options.username);
        } else if (arg == "--mount-point") {
            ok = takeValue(argc, argv, i, options.mountPoint);
        } else if (arg == "--config-file") {
            ok = takeValue(argc, argv, i, options.configFile);
        } else if (arg == "--history-file") {
            ok = takeValue(argc, argv, i, options.historyFile);
        } else if (arg == "--webhook") {
            ok = takeValue(argc, argv, i, options.webhook);
        } else if (arg.rfind("-", 0) == 0) {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            BackupCLI::printUsage(std::cerr);
            return 1;
        } else {
            args.push_back(arg);
        }
        if (!ok) {
            return 1;
        }
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        BackupCLI::printUsage(std::cerr);
        return 1;
    }

    LogLevel level;
    if (!Logger::parseLevel(options.logLevel, level)) {
        std::cerr << "Error: Unknown log level: " << options.logLevel << std::endl;
        return 1;
    }

    // Machine-readable output must not be interleaved with log lines
    bool jsonOutput = false;
    for (const auto& arg : args) {
        if (arg == "--json") {
            jsonOutput = true;
        }
    }
    if (!Logger::initialize(options.logFile, level, !jsonOutput)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    EngineSettings settings = EngineSettings::fromEnvironment();
    if (!options.server.empty()) settings.smbServer = options.server;
    if (!options.share.empty()) settings.smbShare = options.share;
    if (!options.username.empty()) settings.smbUsername = options.username;
    if (!options.mountPoint.empty()) settings.mountPoint = options.mountPoint;
    if (!options.configFile.empty()) settings.configFile = options.configFile;
    if (!options.historyFile.empty()) settings.historyFile = options.historyFile;
    if (!options.webhook.empty()) settings.webhookUrl = options.webhook;

    int exitCode = 1;
    try {
        auto manager = std::make_shared<BackupManager>(settings);
        BackupCLI cli(manager);
        exitCode = cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
    }

    Logger::shutdown();
    return exitCode;
}
