#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace codebox::config {

struct SandboxConfig {
    // "process" or "docker"
    std::string backend = "process";
    std::string memory_limit = "512m";
    double cpus = 1.0;
    std::string interpreter = "python3";
    std::string image = "python:3.9-slim";
    std::string workspace = "/tmp/codebox/executions";
    int stop_grace_s = 1;
    std::uint64_t max_output_bytes = 16 * 1024 * 1024;
    int max_concurrent = 0;
    int poll_interval_ms = 200;
    std::string docker_binary = "docker";
    bool network_disabled = true;
};

struct EnvironmentsConfig {
    std::string base_path = "/tmp/codebox/venvs";
    std::string interpreter = "python3";
    std::string package_manager = "pip";
    int install_timeout_s = 600;
    std::vector<std::string> blocked_packages;
};

struct StorageConfig {
    std::string database_path = "~/.codebox/codebox.db";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    EnvironmentsConfig environments;
    StorageConfig storage;
    LoggingConfig logging;
};

}  // namespace codebox::config
