#pragma once

#include <string>
#include <vector>

// The {"sources": [...]} file listing the directories to back up.
class SourceConfigStore {
public:
    explicit SourceConfigStore(std::string configFile);

    // Missing or malformed files yield an empty list; malformed ones are logged.
    std::vector<std::string> loadSources() const;

    // Rejects relative paths. Returns false with getLastError() set on failure.
    bool saveSources(const std::vector<std::string>& sources);

    const std::string& path() const { return configFile_; }
    std::string getLastError() const { return lastError_; }

private:
    std::string configFile_;
    std::string lastError_;
};
