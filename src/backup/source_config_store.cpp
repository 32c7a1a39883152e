#include "backup/source_config_store.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

SourceConfigStore::SourceConfigStore(std::string configFile)
    : configFile_(std::move(configFile)) {
}

std::vector<std::string> SourceConfigStore::loadSources() const {
    std::vector<std::string> sources;

    std::ifstream file(configFile_);
    if (!file.is_open()) {
        return sources;
    }

    try {
        json config = json::parse(file);
        if (!config.is_object() || !config.contains("sources")) {
            return sources;
        }
        const auto& list = config["sources"];
        if (!list.is_array()) {
            Logger::error("Backup config " + configFile_ + ": 'sources' is not an array");
            return sources;
        }
        for (const auto& item : list) {
            if (item.is_string()) {
                sources.push_back(item.get<std::string>());
            } else {
                Logger::warning("Backup config " + configFile_ + ": ignoring non-string source " + item.dump());
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Failed to read backup config " + configFile_ + ": " + e.what());
        sources.clear();
    }
    return sources;
}

bool SourceConfigStore::saveSources(const std::vector<std::string>& sources) {
    for (const auto& source : sources) {
        if (source.empty() || source.front() != '/') {
            lastError_ = "Source path must be absolute: '" + source + "'";
            return false;
        }
    }

    try {
        json config = {{"sources", sources}};
        utils::writeFileAtomically(configFile_, config.dump(2));
        Logger::info("Saved " + std::to_string(sources.size()) + " backup source(s) to " + configFile_);
        return true;
    } catch (const std::exception& e) {
        lastError_ = e.what();
        Logger::error("Failed to save backup config: " + lastError_);
        return false;
    }
}
