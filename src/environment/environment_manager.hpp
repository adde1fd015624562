#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "environment/dependency_policy.hpp"
#include "environment/environment_types.hpp"

namespace codebox::environment {

struct EnvironmentOptions {
    std::filesystem::path base_path = "/tmp/codebox/venvs";
    std::string interpreter = "python3";
    std::string package_manager = "pip";
    std::chrono::seconds create_timeout{300};
    std::chrono::seconds install_timeout{600};
    std::vector<std::string> blocked_packages;

    static EnvironmentOptions FromConfig(const config::EnvironmentsConfig& config);
};

// Per-project virtual environments under base_path/env_<project_id>.
// Operations on one environment are serialized; distinct environments
// proceed concurrently.
class EnvironmentManager {
public:
    explicit EnvironmentManager(EnvironmentOptions options = {});

    EnvironmentManager(const EnvironmentManager&) = delete;
    EnvironmentManager& operator=(const EnvironmentManager&) = delete;

    // Returns the new env id. Throws SecurityError for a project id that is
    // not a plain name, DuplicateError while the id is tracked, and
    // EnvironmentError when the venv cannot be created.
    std::string CreateEnvironment(const std::string& project_id);

    // Validates every specifier, then runs `<root>/bin/<package_manager>
    // install` with all of them. Throws NotFoundError, SecurityError or
    // DependencyError (with the installer's stderr). No retries.
    void InstallDependencies(const std::string& env_id, const std::vector<std::string>& dependencies);

    // Removes the environment from disk and forgets it. Throws NotFoundError
    // for unknown ids, EnvironmentError when the directory cannot be removed.
    void CleanupEnvironment(const std::string& env_id);

    EnvironmentRecord GetEnvironment(const std::string& env_id) const;
    std::vector<EnvironmentRecord> ListEnvironments() const;

    // Interpreter of the project's environment, if it has a usable one.
    std::optional<std::filesystem::path> FindInterpreter(const std::string& project_id) const;

    // Best effort removal of every environment; failures are logged.
    void Cleanup();

    const EnvironmentOptions& Options() const { return options_; }

    static std::string EnvIdFor(const std::string& project_id) { return "env_" + project_id; }

private:
    struct Slot {
        // Serializes create/install/cleanup of one environment.
        std::mutex operation_mutex;
        // Guarded by mutex_.
        EnvironmentRecord record;
    };

    std::shared_ptr<Slot> FindSlot(const std::string& env_id) const;
    void Forget(const std::string& env_id, const std::shared_ptr<Slot>& slot);

    EnvironmentOptions options_;
    DependencyPolicy policy_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace codebox::environment
