#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/resource_limits.hpp"
#include "utils/common.hpp"

namespace codebox::sandbox {

struct SandboxSpec {
    std::string execution_id;
    // Per-execution scratch space; holds the snapshot and the output logs.
    std::filesystem::path scratch_dir;
    // Read-only snapshot of the project, the program's working directory.
    std::filesystem::path code_dir;
    // Relative to code_dir.
    std::string entry_file;
    std::string interpreter;
    // Container image; ignored by the process backend.
    std::string image;
    std::map<std::string, std::string> environment;
    ResourceLimits limits;
    bool network_disabled = true;
};

struct SandboxState {
    bool running = true;
    std::optional<int> exit_code;
    std::optional<utils::TimePoint> finished_at;
    // Killed by a limit the backend can attribute (CPU, output size, OOM).
    bool resource_limit = false;
    double memory_usage_mb = 0.0;
    double cpu_time_s = 0.0;
};

struct SandboxOutput {
    std::string stdout_text;
    std::string stderr_text;
};

// A launched sandbox. Owned exclusively by the execution engine.
class SandboxHandle {
public:
    virtual ~SandboxHandle() = default;

    // Live state. Throws ExecutionError when the runtime cannot be queried
    // (runtime unreachable, sandbox vanished).
    virtual SandboxState Inspect() = 0;

    // Output captured so far. Same failure contract as Inspect().
    virtual SandboxOutput ReadOutput() = 0;

    // Stop signal, up to `grace` for a clean exit, then force kill. Returns
    // once the sandbox is no longer running. Throws ExecutionError when the
    // stop primitive fails. No-op on an exited sandbox.
    virtual void Stop(std::chrono::seconds grace) = 0;

    // Force kill and release runtime resources. Idempotent. Throws
    // ExecutionError on failure; callers tearing down treat it as best effort.
    virtual void Remove() = 0;
};

class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;
    virtual std::string Name() const = 0;

    // Starts the entry program and returns without waiting for it. Throws
    // ExecutionError when the sandbox cannot be created.
    virtual std::unique_ptr<SandboxHandle> Launch(const SandboxSpec& spec) = 0;
};

// "process" or "docker". Throws ExecutionError for other names.
std::unique_ptr<SandboxRuntime> CreateRuntime(const config::SandboxConfig& config);

}  // namespace codebox::sandbox
