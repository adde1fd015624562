#include "sandbox/sandbox_runtime.hpp"

#include "core/errors.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/process_sandbox.hpp"

namespace codebox::sandbox {

std::unique_ptr<SandboxRuntime> CreateRuntime(const config::SandboxConfig& config) {
    const auto backend = utils::ToLower(utils::Trim(config.backend));
    if (backend == "process") {
        return std::make_unique<ProcessSandboxRuntime>();
    }
    if (backend == "docker") {
        return std::make_unique<DockerSandboxRuntime>(config.docker_binary);
    }
    throw ExecutionError("Unknown sandbox backend: " + config.backend);
}

}  // namespace codebox::sandbox
