#pragma once

#include <chrono>
#include <string>
#include <vector>

struct EngineSettings {
    // SMB share
    std::string smbServer;
    std::string smbShare;
    std::string smbUsername;       // empty means guest
    std::string smbPassword;
    std::string mountPoint{"/mnt/smb_backup"};
    std::chrono::seconds mountTimeout{30};
    std::string mountTablePath{"/proc/mounts"};

    // Persisted state
    std::string configFile{"/var/lib/server-dashboard/backup-config.json"};
    std::string historyFile{"/var/lib/server-dashboard/backup-history.json"};

    // Tooling
    std::vector<std::string> elevationCommand{"sudo"};  // empty runs tools directly
    std::string rsyncPath{"rsync"};
    std::string stdbufPath{"stdbuf"};                   // empty skips line buffering

    std::string webhookUrl;

    static EngineSettings fromEnvironment();
};
