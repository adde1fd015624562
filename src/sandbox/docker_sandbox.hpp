#pragma once

#include "sandbox/sandbox_runtime.hpp"

namespace codebox::sandbox {

// Containers driven through the docker CLI. The snapshot is bind-mounted
// read-only at /code.
class DockerSandboxRuntime : public SandboxRuntime {
public:
    explicit DockerSandboxRuntime(std::string docker_binary = "docker");

    std::string Name() const override { return "docker"; }
    std::unique_ptr<SandboxHandle> Launch(const SandboxSpec& spec) override;

    // "docker run" argument vector for a spec, without the binary.
    static std::vector<std::string> BuildRunArgs(const SandboxSpec& spec);

private:
    std::string docker_binary_;
};

class DockerSandbox : public SandboxHandle {
public:
    DockerSandbox(std::string docker_binary, std::string container_id);
    ~DockerSandbox() override;

    SandboxState Inspect() override;
    SandboxOutput ReadOutput() override;
    void Stop(std::chrono::seconds grace) override;
    void Remove() override;

    const std::string& ContainerId() const { return container_id_; }

private:
    std::string docker_binary_;
    std::string container_id_;
    bool removed_ = false;
};

// Parses `docker inspect --format` output produced with kInspectFormat:
// "<status>|<exit code>|<finished at>|<oom killed>".
SandboxState ParseDockerState(const std::string& text);

}  // namespace codebox::sandbox
