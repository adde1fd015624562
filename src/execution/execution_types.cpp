#include "execution/execution_types.hpp"

#include <stdexcept>

namespace codebox::execution {

std::string StatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Queued: return "QUEUED";
        case ExecutionStatus::Running: return "RUNNING";
        case ExecutionStatus::Completed: return "COMPLETED";
        case ExecutionStatus::Error: return "ERROR";
    }
    return "UNKNOWN";
}

ExecutionStatus StatusFromString(const std::string& value) {
    if (value == "QUEUED") {
        return ExecutionStatus::Queued;
    }
    if (value == "RUNNING") {
        return ExecutionStatus::Running;
    }
    if (value == "COMPLETED") {
        return ExecutionStatus::Completed;
    }
    if (value == "ERROR") {
        return ExecutionStatus::Error;
    }
    throw std::invalid_argument("Unknown execution status: " + value);
}

std::string ReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None: return "none";
        case TerminationReason::Exited: return "exited";
        case TerminationReason::Terminated: return "terminated";
        case TerminationReason::ResourceLimit: return "resource_limit";
        case TerminationReason::RuntimeFailure: return "runtime_failure";
        case TerminationReason::LaunchFailed: return "launch_failed";
    }
    return "none";
}

TerminationReason ReasonFromString(const std::string& value) {
    if (value == "none") {
        return TerminationReason::None;
    }
    if (value == "exited") {
        return TerminationReason::Exited;
    }
    if (value == "terminated") {
        return TerminationReason::Terminated;
    }
    if (value == "resource_limit") {
        return TerminationReason::ResourceLimit;
    }
    if (value == "runtime_failure") {
        return TerminationReason::RuntimeFailure;
    }
    if (value == "launch_failed") {
        return TerminationReason::LaunchFailed;
    }
    throw std::invalid_argument("Unknown termination reason: " + value);
}

nlohmann::json ToJson(const ExecutionRecord& record) {
    nlohmann::json json = {
        {"id", record.id},
        {"projectId", record.project_id},
        {"entryFile", record.entry_file},
        {"status", StatusToString(record.status)},
        {"stdout", record.stdout_text},
        {"stderr", record.stderr_text},
        {"exitCode", nullptr},
        {"startedAt", utils::FormatIsoUtc(record.started_at)},
        {"completedAt", nullptr},
        {"resourceUsage", {
            {"memoryUsageMb", record.resource_usage.memory_usage_mb},
            {"cpuTimeS", record.resource_usage.cpu_time_s}
        }},
        {"terminationReason", ReasonToString(record.termination_reason)}
    };
    if (record.exit_code) {
        json["exitCode"] = *record.exit_code;
    }
    if (record.completed_at) {
        json["completedAt"] = utils::FormatIsoUtc(*record.completed_at);
    }
    return json;
}

}  // namespace codebox::execution
