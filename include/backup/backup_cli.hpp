#pragma once

#include "backup/backup_manager.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Subcommands of the sharemirror executable. args[0] is the command name.
class BackupCLI {
public:
    explicit BackupCLI(std::shared_ptr<BackupManager> manager, std::ostream& out = std::cout);

    // Returns the process exit code
    int run(const std::vector<std::string>& args);

    static void printUsage(std::ostream& out);

    static std::string formatBytes(int64_t bytes);
    static std::string formatDuration(int64_t ms);

private:
    int handleRunCommand(const std::vector<std::string>& args);
    int handleHistoryCommand(const std::vector<std::string>& args);
    int handleSourcesCommand(const std::vector<std::string>& args);
    int handleConfigCommand();
    int handleTestCommand();

    void printEvent(const Event& event, bool jsonOutput);

    std::shared_ptr<BackupManager> manager_;
    std::ostream& out_;
};
