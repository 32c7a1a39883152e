#include "backup/history_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <fstream>

using json = nlohmann::json;

HistoryStore::HistoryStore(std::string historyFile, size_t maxEntries)
    : historyFile_(std::move(historyFile))
    , maxEntries_(maxEntries) {
}

json HistoryStore::readEntries() const {
    std::ifstream file(historyFile_);
    if (!file.is_open()) {
        return json::array();
    }

    try {
        json entries = json::parse(file);
        if (!entries.is_array()) {
            Logger::error("Backup history " + historyFile_ + " is not a JSON array, ignoring it");
            return json::array();
        }
        return entries;
    } catch (const std::exception& e) {
        Logger::error("Failed to read backup history " + historyFile_ + ": " + e.what());
        return json::array();
    }
}

void HistoryStore::writeEntries(const json& entries) const {
    try {
        // Tool output is not guaranteed to be valid UTF-8
        utils::writeFileAtomically(historyFile_, entries.dump(2, ' ', false, json::error_handler_t::replace));
    } catch (const std::exception& e) {
        throw HistoryWriteError(e.what());
    }
}

bool HistoryStore::append(const BackupRun& run) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        json entries = readEntries();
        // Existing entries are carried over verbatim, unknown keys included
        entries.insert(entries.begin(), json(run));
        if (entries.size() > maxEntries_) {
            entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(maxEntries_), entries.end());
        }
        writeEntries(entries);
        return true;
    } catch (const HistoryWriteError& e) {
        Logger::error("Failed to save backup history: " + std::string(e.what()));
    } catch (const std::exception& e) {
        Logger::error("Failed to update backup history: " + std::string(e.what()));
    }
    return false;
}

std::vector<BackupRun> HistoryStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<BackupRun> runs;
    json entries = readEntries();
    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            continue;
        }
        try {
            runs.push_back(entry.get<BackupRun>());
        } catch (const std::exception& e) {
            Logger::warning("Skipping unreadable history entry: " + std::string(e.what()));
        }
    }
    return runs;
}
