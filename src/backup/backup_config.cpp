#include "backup/backup_config.hpp"
#include <cstdlib>
#include <sstream>

namespace {

bool readEnv(const char* name, std::string& value) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return false;
    }
    value = raw;
    return true;
}

} // namespace

EngineSettings EngineSettings::fromEnvironment() {
    EngineSettings settings;
    std::string value;

    readEnv("SMB_SERVER", settings.smbServer);
    readEnv("SMB_SHARE", settings.smbShare);
    readEnv("SMB_USERNAME", settings.smbUsername);
    readEnv("SMB_PASSWORD", settings.smbPassword);
    if (readEnv("SMB_MOUNT_POINT", value) && !value.empty()) {
        settings.mountPoint = value;
    }
    if (readEnv("BACKUP_CONFIG_FILE", value) && !value.empty()) {
        settings.configFile = value;
    }
    if (readEnv("BACKUP_HISTORY_FILE", value) && !value.empty()) {
        settings.historyFile = value;
    }

    // "sudo -n" style values are split on whitespace; an empty value disables elevation
    if (readEnv("BACKUP_ELEVATION", value)) {
        settings.elevationCommand.clear();
        std::istringstream words(value);
        std::string word;
        while (words >> word) {
            settings.elevationCommand.push_back(word);
        }
    }
    if (readEnv("BACKUP_RSYNC", value) && !value.empty()) {
        settings.rsyncPath = value;
    }
    readEnv("BACKUP_STDBUF", settings.stdbufPath);
    readEnv("BACKUP_WEBHOOK_URL", settings.webhookUrl);

    return settings;
}
