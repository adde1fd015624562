#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "environment/environment_manager.hpp"
#include "execution/execution_types.hpp"
#include "execution/snapshot.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "storage/storage.hpp"

namespace codebox::execution {

struct EngineOptions {
    std::filesystem::path workspace = "/tmp/codebox/executions";
    std::string interpreter = "python3";
    std::string image = "python:3.9-slim";
    sandbox::ResourceLimits limits;
    std::chrono::seconds stop_grace{1};
    // 0 = launch every execution immediately.
    std::size_t max_concurrent = 0;
    std::chrono::milliseconds poll_interval{200};
    bool network_disabled = true;
    // Extra variables for every sandbox.
    std::map<std::string, std::string> environment;

    // Throws ResourceError for an invalid memory limit or CPU budget.
    static EngineOptions FromConfig(const config::SandboxConfig& config);
};

// Runs project entry files in sandboxes and tracks them by execution id.
//
// Execute() returns as soon as the sandbox is started (or queued when
// max_concurrent is reached); GetStatus() polls the sandbox and caches the
// record once it is terminal. Every public method is safe to call from any
// thread. Lock order: mutex_ before an entry's mutex, never the reverse.
class ExecutionEngine {
public:
    // `environments` is optional and must outlive the engine. When set, a
    // project with an environment runs under that environment's interpreter
    // (process backend only).
    ExecutionEngine(std::shared_ptr<storage::FileStorage> files,
                    std::unique_ptr<sandbox::SandboxRuntime> runtime,
                    EngineOptions options = {},
                    environment::EnvironmentManager* environments = nullptr);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Throws SecurityError for an unsafe entry path, NotFoundError when the
    // project has no such file, ExecutionError when the sandbox cannot be
    // started. Storage errors propagate unchanged. Nothing is retained on
    // failure.
    ExecutionRecord Execute(const std::string& project_id, const std::string& entry_file);

    // Never throws for runtime failures; they turn the record into ERROR.
    // Throws NotFoundError for unknown ids.
    ExecutionRecord GetStatus(const std::string& execution_id);

    // Stops the sandbox (grace period, then kill) and marks the record
    // ERROR. No-op on a terminal record. Throws NotFoundError, or
    // ExecutionError when the sandbox cannot be stopped.
    ExecutionRecord Terminate(const std::string& execution_id);

    std::vector<ExecutionRecord> ListExecutions() const;

    // Kills the sandbox if needed and forgets the execution.
    void Release(const std::string& execution_id);

    // Best effort teardown of every execution and the dispatcher. Errors are
    // logged, never thrown.
    void Cleanup();

    std::size_t RunningCount() const { return running_count_.load(); }
    const EngineOptions& Options() const { return options_; }

private:
    struct Entry {
        std::mutex mutex;
        ExecutionRecord record;
        sandbox::SandboxSpec spec;
        std::unique_ptr<sandbox::SandboxHandle> handle;
        ScratchDir scratch;
        // Holds one of the max_concurrent slots.
        bool counted = false;
    };

    std::shared_ptr<Entry> FindEntry(const std::string& execution_id) const;
    sandbox::SandboxSpec BuildSpec(const std::string& execution_id,
                                   const std::string& project_id,
                                   const std::filesystem::path& scratch_dir,
                                   const std::string& entry_file) const;

    // The helpers below expect the entry's mutex to be held.
    void Launch(Entry& entry);
    void Refresh(Entry& entry);
    void Degrade(Entry& entry, const std::string& error);
    void Reclaim(Entry& entry);

    void DispatchLoop();
    void RefreshRunning();
    void LaunchQueued();

    std::shared_ptr<storage::FileStorage> files_;
    std::unique_ptr<sandbox::SandboxRuntime> runtime_;
    EngineOptions options_;
    environment::EnvironmentManager* environments_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::deque<std::string> queue_;
    bool stopping_ = false;
    std::atomic<std::size_t> running_count_{0};
    std::condition_variable dispatch_cv_;
    std::thread dispatcher_;
};

}  // namespace codebox::execution
