#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace codebox::execution {

enum class ExecutionStatus {
    Queued,
    Running,
    Completed,
    Error
};

std::string StatusToString(ExecutionStatus status);

// Throws std::invalid_argument for names outside the fixed set.
ExecutionStatus StatusFromString(const std::string& value);

inline bool IsTerminal(ExecutionStatus status) {
    return status == ExecutionStatus::Completed || status == ExecutionStatus::Error;
}

// Why an execution left the running state. ERROR covers several of these.
enum class TerminationReason {
    None,
    Exited,
    Terminated,
    ResourceLimit,
    RuntimeFailure,
    LaunchFailed
};

std::string ReasonToString(TerminationReason reason);
TerminationReason ReasonFromString(const std::string& value);

struct ResourceUsage {
    double memory_usage_mb = 0.0;
    double cpu_time_s = 0.0;
};

struct ExecutionRecord {
    std::string id;
    std::string project_id;
    std::string entry_file;
    ExecutionStatus status = ExecutionStatus::Queued;
    std::string stdout_text;
    std::string stderr_text;
    // Set exactly when the status is terminal, as is completed_at.
    std::optional<int> exit_code;
    utils::TimePoint started_at{};
    std::optional<utils::TimePoint> completed_at;
    ResourceUsage resource_usage;
    TerminationReason termination_reason = TerminationReason::None;
};

nlohmann::json ToJson(const ExecutionRecord& record);

}  // namespace codebox::execution
