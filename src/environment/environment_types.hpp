#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace codebox::environment {

enum class EnvironmentState {
    Created,
    Ready,
    Destroyed
};

std::string StateToString(EnvironmentState state);

// Throws std::invalid_argument for names outside the fixed set.
EnvironmentState StateFromString(const std::string& value);

struct EnvironmentRecord {
    std::string env_id;
    std::string project_id;
    std::filesystem::path root;
    // Verbatim specifiers in install order, without duplicates.
    std::vector<std::string> dependencies;
    EnvironmentState state = EnvironmentState::Created;
    utils::TimePoint created_at{};
};

nlohmann::json ToJson(const EnvironmentRecord& record);

}  // namespace codebox::environment
