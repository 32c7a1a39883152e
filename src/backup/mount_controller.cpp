#include "backup/mount_controller.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace {

std::string stripTrailingSlashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

// /proc/mounts encodes space, tab, newline and backslash as \ooo
std::string decodeMountField(const std::string& field) {
    std::string decoded;
    decoded.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            decoded += static_cast<char>((field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0'));
            i += 3;
        } else {
            decoded += field[i];
        }
    }
    return decoded;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

CifsMountController::CifsMountController(const EngineSettings& settings,
                                         std::shared_ptr<CommandRunner> runner)
    : settings_(settings)
    , runner_(runner ? std::move(runner) : std::make_shared<CommandRunner>()) {
}

bool CifsMountController::mountTableContains(const std::string& tablePath, const std::string& mountPoint) {
    std::ifstream table(tablePath);
    if (!table.is_open()) {
        Logger::warning("Cannot read mount table " + tablePath);
        return false;
    }

    const std::string wanted = stripTrailingSlashes(mountPoint);
    std::string line;
    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string target;
        if (!(fields >> device >> target)) {
            continue;
        }
        if (stripTrailingSlashes(decodeMountField(target)) == wanted) {
            return true;
        }
    }
    return false;
}

bool CifsMountController::isMounted() const {
    if (settings_.mountPoint.empty()) {
        return false;
    }
    return mountTableContains(settings_.mountTablePath, settings_.mountPoint);
}

std::string CifsMountController::escapeOptionValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        escaped += c;
        if (c == ',') {
            escaped += ',';
        }
    }
    return escaped;
}

std::vector<std::string> CifsMountController::elevated(std::vector<std::string> argv) const {
    std::vector<std::string> full = settings_.elevationCommand;
    full.insert(full.end(), argv.begin(), argv.end());
    return full;
}

std::vector<std::string> CifsMountController::buildMountCommand() const {
    const std::string ids = "uid=" + std::to_string(getuid()) + ",gid=" + std::to_string(getgid());

    std::string options;
    if (!settings_.smbUsername.empty()) {
        options = "username=" + escapeOptionValue(settings_.smbUsername) +
                  ",password=" + escapeOptionValue(settings_.smbPassword) +
                  ",vers=3.0,sec=ntlmssp," + ids;
    } else {
        options = "guest,vers=3.0," + ids;
    }

    return elevated({
        "mount", "-t", "cifs",
        "//" + settings_.smbServer + "/" + settings_.smbShare,
        settings_.mountPoint,
        "-o", options
    });
}

void CifsMountController::ensureMounted() {
    if (settings_.smbServer.empty() || settings_.smbShare.empty()) {
        throw MountError("SMB server or share not configured");
    }
    if (settings_.mountPoint.empty()) {
        throw MountError("SMB mount point not configured");
    }

    if (isMounted()) {
        Logger::debug("Share already mounted at " + settings_.mountPoint);
        return;
    }

    std::error_code ec;
    if (!std::filesystem::exists(settings_.mountPoint, ec)) {
        CommandResult mkdir = runner_->run(elevated({"mkdir", "-p", settings_.mountPoint}));
        if (!mkdir.succeeded()) {
            throw MountError("Failed to create mount point " + settings_.mountPoint, trim(mkdir.errorOutput));
        }
    }

    Logger::info("Mounting //" + settings_.smbServer + "/" + settings_.smbShare + " on " + settings_.mountPoint +
                 (settings_.smbUsername.empty() ? " as guest" : " as " + settings_.smbUsername));

    CommandResult result = runner_->runRedacted(buildMountCommand(),
                                                "password=" + escapeOptionValue(settings_.smbPassword),
                                                settings_.mountTimeout);
    if (!result.succeeded()) {
        std::string detail = trim(result.errorOutput);
        if (detail.empty()) {
            detail = "mount exited with code " + std::to_string(result.exitCode);
        }
        Logger::error("Failed to mount SMB share: " + detail);
        throw MountError("Failed to mount SMB share", detail);
    }

    Logger::info("Mounted SMB share at " + settings_.mountPoint);
}

void CifsMountController::unmount() {
    try {
        if (!isMounted()) {
            return;
        }
        CommandResult result = runner_->run(elevated({"umount", settings_.mountPoint}));
        if (!result.succeeded()) {
            Logger::warning("Failed to unmount " + settings_.mountPoint + ": " + trim(result.errorOutput));
            return;
        }
        Logger::info("Unmounted " + settings_.mountPoint);
    } catch (const std::exception& e) {
        Logger::warning("Failed to unmount " + settings_.mountPoint + ": " + e.what());
    }
}
