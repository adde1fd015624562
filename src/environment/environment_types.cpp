#include "environment/environment_types.hpp"

#include <stdexcept>

namespace codebox::environment {

std::string StateToString(EnvironmentState state) {
    switch (state) {
        case EnvironmentState::Created: return "CREATED";
        case EnvironmentState::Ready: return "READY";
        case EnvironmentState::Destroyed: return "DESTROYED";
    }
    return "UNKNOWN";
}

EnvironmentState StateFromString(const std::string& value) {
    if (value == "CREATED") {
        return EnvironmentState::Created;
    }
    if (value == "READY") {
        return EnvironmentState::Ready;
    }
    if (value == "DESTROYED") {
        return EnvironmentState::Destroyed;
    }
    throw std::invalid_argument("Unknown environment state: " + value);
}

nlohmann::json ToJson(const EnvironmentRecord& record) {
    return nlohmann::json{
        {"envId", record.env_id},
        {"projectId", record.project_id},
        {"root", record.root.string()},
        {"dependencies", record.dependencies},
        {"state", StateToString(record.state)},
        {"createdAt", utils::FormatIsoUtc(record.created_at)}
    };
}

}  // namespace codebox::environment
