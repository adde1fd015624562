#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplySandboxConfig(SandboxConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "backend", target.backend);
    ReadString(source, "memoryLimit", target.memory_limit);
    if (source.contains("cpus") && source["cpus"].is_number()) {
        target.cpus = source["cpus"].get<double>();
    }
    ReadString(source, "interpreter", target.interpreter);
    ReadString(source, "image", target.image);
    ReadString(source, "workspace", target.workspace);
    ReadInt(source, "stopGraceS", target.stop_grace_s);
    if (source.contains("maxOutputBytes") && source["maxOutputBytes"].is_number_unsigned()) {
        target.max_output_bytes = source["maxOutputBytes"].get<std::uint64_t>();
    }
    ReadInt(source, "maxConcurrent", target.max_concurrent);
    ReadInt(source, "pollIntervalMs", target.poll_interval_ms);
    ReadString(source, "dockerBinary", target.docker_binary);
    if (source.contains("networkDisabled") && source["networkDisabled"].is_boolean()) {
        target.network_disabled = source["networkDisabled"].get<bool>();
    }
}

void ApplyEnvironmentsConfig(EnvironmentsConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "basePath", target.base_path);
    ReadString(source, "interpreter", target.interpreter);
    ReadString(source, "packageManager", target.package_manager);
    ReadInt(source, "installTimeoutS", target.install_timeout_s);
    if (source.contains("blockedPackages") && source["blockedPackages"].is_array()) {
        target.blocked_packages.clear();
        for (const auto& item : source["blockedPackages"]) {
            if (item.is_string()) {
                target.blocked_packages.push_back(item.get<std::string>());
            }
        }
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("sandbox")) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }
    if (data.contains("environments")) {
        ApplyEnvironmentsConfig(config.environments, data["environments"]);
    }
    if (data.contains("storage") && data["storage"].is_object()) {
        ReadString(data["storage"], "databasePath", config.storage.database_path);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::uint64_t ParseUnsigned(const std::string& value, std::uint64_t fallback) {
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyEnvOverrides(Config& config) {
    const auto backend = GetEnvFallback("CODEBOX_SANDBOX__BACKEND", "CODEBOX_SANDBOX_BACKEND");
    if (!backend.empty()) {
        config.sandbox.backend = backend;
    }

    const auto memory_limit = GetEnvFallback(
        "CODEBOX_SANDBOX__MEMORY_LIMIT",
        "CODEBOX_SANDBOX_MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        config.sandbox.memory_limit = memory_limit;
    }

    const auto cpus = GetEnvFallback("CODEBOX_SANDBOX__CPUS", "CODEBOX_SANDBOX_CPUS");
    if (!cpus.empty()) {
        config.sandbox.cpus = ParseDouble(cpus, config.sandbox.cpus);
    }

    const auto interpreter = GetEnvFallback(
        "CODEBOX_SANDBOX__INTERPRETER",
        "CODEBOX_SANDBOX_INTERPRETER");
    if (!interpreter.empty()) {
        config.sandbox.interpreter = interpreter;
    }

    const auto image = GetEnvFallback("CODEBOX_SANDBOX__IMAGE", "CODEBOX_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto workspace = GetEnvFallback("CODEBOX_SANDBOX__WORKSPACE", "CODEBOX_SANDBOX_WORKSPACE");
    if (!workspace.empty()) {
        config.sandbox.workspace = workspace;
    }

    const auto stop_grace = GetEnvFallback(
        "CODEBOX_SANDBOX__STOP_GRACE_S",
        "CODEBOX_SANDBOX_STOP_GRACE_S");
    if (!stop_grace.empty()) {
        config.sandbox.stop_grace_s = ParseInt(stop_grace, config.sandbox.stop_grace_s);
    }

    const auto max_output = GetEnvFallback(
        "CODEBOX_SANDBOX__MAX_OUTPUT_BYTES",
        "CODEBOX_SANDBOX_MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        config.sandbox.max_output_bytes = ParseUnsigned(max_output, config.sandbox.max_output_bytes);
    }

    const auto max_concurrent = GetEnvFallback(
        "CODEBOX_SANDBOX__MAX_CONCURRENT",
        "CODEBOX_SANDBOX_MAX_CONCURRENT");
    if (!max_concurrent.empty()) {
        config.sandbox.max_concurrent = ParseInt(max_concurrent, config.sandbox.max_concurrent);
    }

    const auto docker_binary = GetEnvFallback(
        "CODEBOX_SANDBOX__DOCKER_BINARY",
        "CODEBOX_SANDBOX_DOCKER_BINARY");
    if (!docker_binary.empty()) {
        config.sandbox.docker_binary = docker_binary;
    }

    const auto network_disabled = GetEnvFallback(
        "CODEBOX_SANDBOX__NETWORK_DISABLED",
        "CODEBOX_SANDBOX_NETWORK_DISABLED");
    if (!network_disabled.empty()) {
        config.sandbox.network_disabled = ParseBool(network_disabled);
    }

    const auto env_base = GetEnvFallback(
        "CODEBOX_ENVIRONMENTS__BASE_PATH",
        "CODEBOX_ENVIRONMENTS_BASE_PATH");
    if (!env_base.empty()) {
        config.environments.base_path = env_base;
    }

    const auto env_interpreter = GetEnvFallback(
        "CODEBOX_ENVIRONMENTS__INTERPRETER",
        "CODEBOX_ENVIRONMENTS_INTERPRETER");
    if (!env_interpreter.empty()) {
        config.environments.interpreter = env_interpreter;
    }

    const auto package_manager = GetEnvFallback(
        "CODEBOX_ENVIRONMENTS__PACKAGE_MANAGER",
        "CODEBOX_ENVIRONMENTS_PACKAGE_MANAGER");
    if (!package_manager.empty()) {
        config.environments.package_manager = package_manager;
    }

    const auto install_timeout = GetEnvFallback(
        "CODEBOX_ENVIRONMENTS__INSTALL_TIMEOUT_S",
        "CODEBOX_ENVIRONMENTS_INSTALL_TIMEOUT_S");
    if (!install_timeout.empty()) {
        config.environments.install_timeout_s = ParseInt(
            install_timeout,
            config.environments.install_timeout_s);
    }

    const auto blocked = GetEnvFallback(
        "CODEBOX_ENVIRONMENTS__BLOCKED_PACKAGES",
        "CODEBOX_ENVIRONMENTS_BLOCKED_PACKAGES");
    if (!blocked.empty()) {
        config.environments.blocked_packages = SplitCsv(blocked);
    }

    const auto database_path = GetEnvFallback(
        "CODEBOX_STORAGE__DATABASE_PATH",
        "CODEBOX_STORAGE_DATABASE_PATH");
    if (!database_path.empty()) {
        config.storage.database_path = database_path;
    }

    const auto log_level = GetEnvFallback("CODEBOX_LOGGING__LEVEL", "CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".codebox" / "config.json";
}

std::filesystem::path ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring malformed config",
                       {{"path", path.string()}});
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

void ConfigureLogging(const LoggingConfig& config) {
    utils::LogConfig log_config;
    log_config.min_level = utils::LogLevelFromString(config.level);
    utils::SetLogConfig(log_config);
}

Config LoadConfig() {
    return LoadConfigFromFile(DefaultConfigPath());
}

}  // namespace codebox::config
