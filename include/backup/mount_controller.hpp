#pragma once

#include "backup/backup_config.hpp"
#include "common/command_runner.hpp"
#include <memory>
#include <string>
#include <vector>

// Makes the remote share reachable as a local directory.
class ShareMount {
public:
    virtual ~ShareMount() = default;

    // Checked against the OS mount table on every call, never cached.
    virtual bool isMounted() const = 0;

    // Idempotent. Throws MountError when the share cannot be mounted.
    virtual void ensureMounted() = 0;

    // Idempotent and best-effort: failures are logged, never thrown.
    virtual void unmount() = 0;

    virtual std::string mountPoint() const = 0;
};

class CifsMountController : public ShareMount {
public:
    explicit CifsMountController(const EngineSettings& settings,
                                 std::shared_ptr<CommandRunner> runner = nullptr);
    ~CifsMountController() override = default;

    bool isMounted() const override;
    void ensureMounted() override;
    void unmount() override;
    std::string mountPoint() const override { return settings_.mountPoint; }

    // mount -t cifs argv, elevation included. Run without a shell, so only
    // the option separator needs escaping.
    std::vector<std::string> buildMountCommand() const;

    // Doubles commas, the mount.cifs escape for a literal ',' in a value.
    static std::string escapeOptionValue(const std::string& value);

    // True if mountPoint appears as the target of any entry in a
    // /proc/mounts formatted file.
    static bool mountTableContains(const std::string& tablePath, const std::string& mountPoint);

private:
    std::vector<std::string> elevated(std::vector<std::string> argv) const;

    EngineSettings settings_;
    std::shared_ptr<CommandRunner> runner_;
};
