#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class RunStatus {
    Success,
    Partial,
    Cancelled,
    Failed
};

std::string runStatusToString(RunStatus status);
bool runStatusFromString(const std::string& text, RunStatus& status);

// Summary block of one finished rsync invocation
struct TransferStats {
    int64_t filesTransferred{0};
    int64_t transferredBytes{0};
};

// Result of mirroring one source within a run
struct TransferOutcome {
    std::string source;
    bool success{false};
    int64_t filesTransferred{0};
    int64_t transferredBytes{0};
    std::optional<std::string> error;
};

// Live progress for the source currently being mirrored. Never persisted.
struct ProgressSample {
    int sourceIndex{0};
    std::string sourceName;
    int sourcesCount{0};
    int percent{0};
    int64_t transferredBytes{0};
    std::string speed;
};

// One history entry. Immutable once written.
struct BackupRun {
    std::string timestamp;
    int64_t durationMs{0};
    RunStatus status{RunStatus::Failed};
    int sourcesCount{0};
    int64_t filesTransferred{0};
    int64_t transferredSize{0};
    std::vector<TransferOutcome> results;
    std::optional<std::string> error;
};

// What the caller of a run gets back
struct RunResult {
    bool success{false};
    std::string error;
    nlohmann::json details;
};

void to_json(nlohmann::json& j, const TransferOutcome& outcome);
void from_json(const nlohmann::json& j, TransferOutcome& outcome);
void to_json(nlohmann::json& j, const ProgressSample& sample);
void to_json(nlohmann::json& j, const BackupRun& run);
void from_json(const nlohmann::json& j, BackupRun& run);
void to_json(nlohmann::json& j, const RunResult& result);
