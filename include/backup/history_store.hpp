#pragma once

#include "backup/backup_types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>

// Newest-first JSON log of finished runs, capped at maxEntries.
class HistoryStore {
public:
    static constexpr size_t kMaxEntries = 50;

    explicit HistoryStore(std::string historyFile, size_t maxEntries = kMaxEntries);

    // Prepends run and truncates. Never throws: a failed write is logged and
    // reported as false so it can never change the outcome of a run.
    bool append(const BackupRun& run);

    // Missing or corrupt files yield an empty history.
    std::vector<BackupRun> list() const;

    const std::string& path() const { return historyFile_; }

private:
    nlohmann::json readEntries() const;
    void writeEntries(const nlohmann::json& entries) const;

    std::string historyFile_;
    size_t maxEntries_;
    mutable std::mutex mutex_;
};
