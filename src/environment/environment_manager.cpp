#include "environment/environment_manager.hpp"

#include <algorithm>
#include <cctype>

#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "sandbox/command_runner.hpp"
#include "utils/logging.hpp"

namespace codebox::environment {
namespace {

void ValidateProjectId(const std::string& project_id) {
    if (project_id.empty() || project_id == "." || project_id == "..") {
        throw SecurityError("Invalid project id: '" + project_id + "'");
    }
    for (const char ch : project_id) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_' || ch == '.';
        if (!allowed) {
            throw SecurityError("Invalid project id: '" + project_id + "'");
        }
    }
}

std::string Describe(const sandbox::CommandResult& result) {
    const auto error = utils::Trim(result.error);
    return error.empty() ? utils::Trim(result.output) : error;
}

}  // namespace

EnvironmentOptions EnvironmentOptions::FromConfig(const config::EnvironmentsConfig& config) {
    EnvironmentOptions options;
    options.base_path = config::ExpandHome(config.base_path);
    options.interpreter = config.interpreter;
    options.package_manager = config.package_manager;
    if (config.install_timeout_s > 0) {
        options.install_timeout = std::chrono::seconds(config.install_timeout_s);
    }
    options.blocked_packages = config.blocked_packages;
    return options;
}

EnvironmentManager::EnvironmentManager(EnvironmentOptions options)
    : options_(std::move(options))
    , policy_(options_.blocked_packages) {}

std::string EnvironmentManager::CreateEnvironment(const std::string& project_id) {
    ValidateProjectId(project_id);
    const auto env_id = EnvIdFor(project_id);

    auto slot = std::make_shared<Slot>();
    slot->record.env_id = env_id;
    slot->record.project_id = project_id;
    slot->record.root = options_.base_path / env_id;
    slot->record.state = EnvironmentState::Created;
    slot->record.created_at = utils::Now();
    // Held until the venv exists, so concurrent callers wait for the outcome.
    std::unique_lock<std::mutex> operation(slot->operation_mutex);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slots_.count(env_id) > 0) {
            throw DuplicateError("Environment already exists: " + env_id);
        }
        slots_.emplace(env_id, slot);
    }

    const auto root = slot->record.root;
    try {
        std::error_code ec;
        if (std::filesystem::exists(root, ec)) {
            utils::Log(utils::LogLevel::kWarn, "env", "replacing stale environment directory", {
                {"env", env_id},
                {"root", root.string()}
            });
            std::filesystem::remove_all(root, ec);
            if (ec) {
                throw EnvironmentError("Failed to remove stale environment " + root.string() + ": " + ec.message());
            }
        }
        std::filesystem::create_directories(options_.base_path, ec);
        if (ec) {
            throw EnvironmentError("Failed to create " + options_.base_path.string() + ": " + ec.message());
        }

        sandbox::CommandResult result;
        try {
            result = sandbox::CommandRunner::Run(
                {options_.interpreter, "-m", "venv", root.string()},
                options_.base_path,
                options_.create_timeout);
        } catch (const ExecutionError& ex) {
            throw EnvironmentError("Failed to create environment " + env_id + ": " + ex.what());
        }
        if (result.timed_out) {
            throw EnvironmentError("Creating environment " + env_id + " timed out");
        }
        if (result.exit_code != 0) {
            throw EnvironmentError("Failed to create environment " + env_id + ": " + Describe(result));
        }
    } catch (const EnvironmentError&) {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "env", "partial environment left on disk", {
                {"root", root.string()},
                {"error", ec.message()}
            });
        }
        Forget(env_id, slot);
        throw;
    }

    utils::Log(utils::LogLevel::kInfo, "env", "environment created", {
        {"env", env_id},
        {"root", root.string()}
    });
    return env_id;
}

void EnvironmentManager::InstallDependencies(const std::string& env_id,
                                             const std::vector<std::string>& dependencies) {
    auto slot = FindSlot(env_id);
    policy_.ValidateAll(dependencies);

    std::lock_guard<std::mutex> operation(slot->operation_mutex);
    std::filesystem::path root;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->record.state == EnvironmentState::Destroyed) {
            throw NotFoundError("Environment not found: " + env_id);
        }
        root = slot->record.root;
    }
    if (dependencies.empty()) {
        return;
    }

    const auto package_manager = root / "bin" / options_.package_manager;
    std::error_code ec;
    if (!std::filesystem::exists(package_manager, ec)) {
        throw DependencyError("Package manager missing in " + env_id + ": " + package_manager.string(), "");
    }

    std::vector<std::string> argv = {package_manager.string(), "install"};
    argv.insert(argv.end(), dependencies.begin(), dependencies.end());
    utils::Log(utils::LogLevel::kInfo, "env", "installing dependencies", {
        {"env", env_id},
        {"packages", utils::Join(dependencies, ",")}
    });

    sandbox::CommandResult result;
    try {
        result = sandbox::CommandRunner::Run(
            argv,
            root,
            options_.install_timeout,
            {{"VIRTUAL_ENV", root.string()}, {"PIP_DISABLE_PIP_VERSION_CHECK", "1"}});
    } catch (const ExecutionError& ex) {
        throw DependencyError(std::string("Failed to run package manager: ") + ex.what(), "");
    }
    if (result.timed_out) {
        throw DependencyError("Dependency installation timed out after " +
                                  std::to_string(options_.install_timeout.count()) + "s",
                              result.error);
    }
    if (result.exit_code != 0) {
        utils::Log(utils::LogLevel::kWarn, "env", "dependency installation failed", {
            {"env", env_id},
            {"exit", std::to_string(result.exit_code)}
        });
        throw DependencyError("Dependency installation failed with exit code " +
                                  std::to_string(result.exit_code),
                              result.error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& installed = slot->record.dependencies;
    for (const auto& dependency : dependencies) {
        if (std::find(installed.begin(), installed.end(), dependency) == installed.end()) {
            installed.push_back(dependency);
        }
    }
    slot->record.state = EnvironmentState::Ready;
}

void EnvironmentManager::CleanupEnvironment(const std::string& env_id) {
    auto slot = FindSlot(env_id);
    std::lock_guard<std::mutex> operation(slot->operation_mutex);
    std::filesystem::path root;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->record.state == EnvironmentState::Destroyed) {
            throw NotFoundError("Environment not found: " + env_id);
        }
        root = slot->record.root;
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    if (ec) {
        throw EnvironmentError("Failed to remove environment " + env_id + ": " + ec.message());
    }
    Forget(env_id, slot);
    utils::Log(utils::LogLevel::kInfo, "env", "environment removed", {{"env", env_id}});
}

EnvironmentRecord EnvironmentManager::GetEnvironment(const std::string& env_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(env_id);
    if (it == slots_.end()) {
        throw NotFoundError("Environment not found: " + env_id);
    }
    return it->second->record;
}

std::vector<EnvironmentRecord> EnvironmentManager::ListEnvironments() const {
    std::vector<EnvironmentRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(slots_.size());
        for (const auto& [env_id, slot] : slots_) {
            records.push_back(slot->record);
        }
    }
    std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.env_id < b.env_id;
    });
    return records;
}

std::optional<std::filesystem::path> EnvironmentManager::FindInterpreter(const std::string& project_id) const {
    std::filesystem::path root;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(EnvIdFor(project_id));
        if (it == slots_.end() || it->second->record.state == EnvironmentState::Destroyed) {
            return std::nullopt;
        }
        root = it->second->record.root;
    }
    const auto interpreter = root / "bin" / "python";
    std::error_code ec;
    if (!std::filesystem::exists(interpreter, ec)) {
        return std::nullopt;
    }
    return interpreter;
}

void EnvironmentManager::Cleanup() {
    std::vector<std::string> env_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [env_id, slot] : slots_) {
            env_ids.push_back(env_id);
        }
    }
    for (const auto& env_id : env_ids) {
        try {
            CleanupEnvironment(env_id);
        } catch (const NotFoundError&) {
            // Removed concurrently.
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "env", "cleanup failed", {
                {"env", env_id},
                {"error", ex.what()}
            });
        }
    }
}

std::shared_ptr<EnvironmentManager::Slot> EnvironmentManager::FindSlot(const std::string& env_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(env_id);
    if (it == slots_.end()) {
        throw NotFoundError("Environment not found: " + env_id);
    }
    return it->second;
}

void EnvironmentManager::Forget(const std::string& env_id, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot->record.state = EnvironmentState::Destroyed;
    auto it = slots_.find(env_id);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
}

}  // namespace codebox::environment
