#pragma once

#include <condition_variable>
#include <mutex>
#include <thread>
#include <sys/types.h>

#include "sandbox/sandbox_runtime.hpp"

namespace codebox::sandbox {

// Local process sandbox: the interpreter runs in its own session and
// process group with RLIMIT_AS, RLIMIT_FSIZE, a CPU affinity mask and a
// minimal environment, inside new mount, pid and (when network_disabled)
// network namespaces. The workspace is hidden except for the execution's
// own snapshot, which is mounted read-only. Launch throws ExecutionError
// when the namespaces cannot be set up. A watcher thread reaps the sandbox
// with wait4().
class ProcessSandboxRuntime : public SandboxRuntime {
public:
    std::string Name() const override { return "process"; }
    std::unique_ptr<SandboxHandle> Launch(const SandboxSpec& spec) override;

    // Whether this host lets the process create the namespaces Launch needs.
    static bool NamespacesAvailable();
};

// SIGKILLs the process group led by `pid` and reaps the leader.
void KillProcessGroup(pid_t pid);

class ProcessSandbox : public SandboxHandle {
public:
    ProcessSandbox(pid_t pid, std::filesystem::path stdout_path, std::filesystem::path stderr_path);
    ~ProcessSandbox() override;

    ProcessSandbox(const ProcessSandbox&) = delete;
    ProcessSandbox& operator=(const ProcessSandbox&) = delete;

    SandboxState Inspect() override;
    SandboxOutput ReadOutput() override;
    void Stop(std::chrono::seconds grace) override;
    void Remove() override;

    pid_t Pid() const { return pid_; }

private:
    void Watch();
    void SignalGroup(int signal);
    bool WaitExited(std::unique_lock<std::mutex>& lock, std::chrono::milliseconds timeout);

    pid_t pid_;
    std::filesystem::path stdout_path_;
    std::filesystem::path stderr_path_;
    std::mutex mutex_;
    std::condition_variable exited_cv_;
    bool exited_ = false;
    SandboxState final_state_;
    std::thread watcher_;
};

}  // namespace codebox::sandbox
