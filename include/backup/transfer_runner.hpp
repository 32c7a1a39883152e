#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_types.hpp"
#include "backup/cancellation_controller.hpp"
#include "common/event_bus.hpp"
#include <memory>
#include <string>
#include <vector>

class TransferRunner {
public:
    virtual ~TransferRunner() = default;

    // Mirrors sourcePath onto destPath. Throws CancelledError if the run was
    // cancelled while the transfer was in flight, TransferError otherwise.
    virtual TransferStats runTransfer(const std::string& sourcePath,
                                      const std::string& destPath,
                                      int sourceIndex,
                                      const std::string& sourceName,
                                      int sourcesCount) = 0;
};

class RsyncTransferRunner : public TransferRunner {
public:
    RsyncTransferRunner(const EngineSettings& settings,
                        std::shared_ptr<CancellationController> cancellation,
                        std::shared_ptr<EventBus> events);

    TransferStats runTransfer(const std::string& sourcePath,
                              const std::string& destPath,
                              int sourceIndex,
                              const std::string& sourceName,
                              int sourcesCount) override;

    std::vector<std::string> buildCommand(const std::string& sourcePath, const std::string& destPath) const;

private:
    EngineSettings settings_;
    std::shared_ptr<CancellationController> cancellation_;
    std::shared_ptr<EventBus> events_;
};
