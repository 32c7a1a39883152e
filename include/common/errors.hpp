#pragma once

#include <stdexcept>
#include <string>

// The share could not be mounted. Aborts a run before any transfer.
class MountError : public std::runtime_error {
public:
    MountError(const std::string& message, const std::string& toolOutput = "")
        : std::runtime_error(toolOutput.empty() ? message : message + ": " + toolOutput)
        , toolOutput_(toolOutput) {}

    const std::string& toolOutput() const { return toolOutput_; }

private:
    std::string toolOutput_;
};

// Source list empty, or none of the configured paths exist.
class NoValidSourcesError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A mirroring subprocess failed to start or exited non-zero.
class TransferError : public std::runtime_error {
public:
    TransferError(const std::string& message, int exitCode = -1, const std::string& stderrText = "")
        : std::runtime_error(message)
        , exitCode_(exitCode)
        , stderr_(stderrText) {}

    int exitCode() const { return exitCode_; }
    const std::string& stderrText() const { return stderr_; }

private:
    int exitCode_;
    std::string stderr_;
};

class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("Backup cancelled by user") {}
};

class HistoryWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
