#pragma once

#include <chrono>
#include <string>
#include <vector>

struct CommandResult {
    int exitCode{-1};
    bool timedOut{false};
    std::string output;
    std::string errorOutput;

    bool succeeded() const { return !timedOut && exitCode == 0; }
};

// Runs short-lived helper commands (mount, umount, mkdir, kill) to
// completion. Tests override execute() to record commands instead.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Never throws for a command that fails; spawn failures are reported as
    // exit code -1 with the reason in errorOutput.
    CommandResult run(const std::vector<std::string>& argv,
                      std::chrono::seconds timeout = std::chrono::seconds(30));

    // Same as run(), with every occurrence of secret shown as *** in the debug log.
    CommandResult runRedacted(const std::vector<std::string>& argv,
                              const std::string& secret,
                              std::chrono::seconds timeout = std::chrono::seconds(30));

protected:
    virtual CommandResult execute(const std::vector<std::string>& argv, std::chrono::seconds timeout);
};
