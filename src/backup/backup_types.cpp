#include "backup/backup_types.hpp"

using json = nlohmann::json;

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Success:   return "success";
        case RunStatus::Partial:   return "partial";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed:    return "failed";
        default:                   return "failed";
    }
}

bool runStatusFromString(const std::string& text, RunStatus& status) {
    if (text == "success") {
        status = RunStatus::Success;
    } else if (text == "partial") {
        status = RunStatus::Partial;
    } else if (text == "cancelled") {
        status = RunStatus::Cancelled;
    } else if (text == "failed") {
        status = RunStatus::Failed;
    } else {
        return false;
    }
    return true;
}

void to_json(json& j, const TransferOutcome& outcome) {
    j = json{
        {"source", outcome.source},
        {"success", outcome.success},
        {"filesTransferred", outcome.filesTransferred},
        {"transferredBytes", outcome.transferredBytes}
    };
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
}

void from_json(const json& j, TransferOutcome& outcome) {
    outcome.source = j.value("source", std::string());
    outcome.success = j.value("success", false);
    outcome.filesTransferred = j.value("filesTransferred", int64_t{0});
    // Older history files used transferredSize for the per-source byte count
    outcome.transferredBytes = j.contains("transferredBytes")
        ? j.value("transferredBytes", int64_t{0})
        : j.value("transferredSize", int64_t{0});
    if (j.contains("error") && j["error"].is_string()) {
        outcome.error = j["error"].get<std::string>();
    } else {
        outcome.error.reset();
    }
}

void to_json(json& j, const ProgressSample& sample) {
    j = json{
        {"sourceIndex", sample.sourceIndex},
        {"sourceName", sample.sourceName},
        {"sourcesCount", sample.sourcesCount},
        {"percent", sample.percent},
        {"transferredBytes", sample.transferredBytes},
        {"speed", sample.speed}
    };
}

void to_json(json& j, const BackupRun& run) {
    j = json{
        {"timestamp", run.timestamp},
        {"durationMs", run.durationMs},
        {"status", runStatusToString(run.status)},
        {"sourcesCount", run.sourcesCount},
        {"filesTransferred", run.filesTransferred},
        {"transferredSize", run.transferredSize}
    };
    // A run that never reached the source loop has no results at all
    if (run.status != RunStatus::Failed || !run.results.empty()) {
        j["results"] = run.results;
    }
    if (run.error) {
        j["error"] = *run.error;
    }
}

void from_json(const json& j, BackupRun& run) {
    run.timestamp = j.value("timestamp", std::string());
    run.durationMs = j.contains("durationMs")
        ? j.value("durationMs", int64_t{0})
        : j.value("duration", int64_t{0});

    RunStatus status = RunStatus::Failed;
    if (!runStatusFromString(j.value("status", std::string()), status)) {
        status = RunStatus::Failed;
    }
    run.status = status;

    run.sourcesCount = j.value("sourcesCount", 0);
    run.filesTransferred = j.value("filesTransferred", int64_t{0});
    run.transferredSize = j.value("transferredSize", int64_t{0});

    run.results.clear();
    if (j.contains("results") && j["results"].is_array()) {
        for (const auto& item : j["results"]) {
            if (item.is_object()) {
                run.results.push_back(item.get<TransferOutcome>());
            }
        }
    }

    if (j.contains("error") && j["error"].is_string()) {
        run.error = j["error"].get<std::string>();
    } else {
        run.error.reset();
    }
}

void to_json(json& j, const RunResult& result) {
    j = json{{"success", result.success}};
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    if (!result.details.is_null()) {
        j["details"] = result.details;
    }
}
