#include "sandbox/docker_sandbox.hpp"

#include <sstream>

#include "core/errors.hpp"
#include "sandbox/command_runner.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

constexpr const char* kInspectFormat =
    "{{.State.Status}}|{{.State.ExitCode}}|{{.State.FinishedAt}}|{{.State.OOMKilled}}";
constexpr auto kCommandTimeout = std::chrono::seconds(30);
constexpr auto kRunTimeout = std::chrono::seconds(300);

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << (cpus > 0.0 ? cpus : 1.0);
    return oss.str();
}

std::string Describe(const CommandResult& result) {
    auto message = utils::Trim(result.error);
    if (message.empty()) {
        message = utils::Trim(result.output);
    }
    if (result.timed_out) {
        return "timed out";
    }
    return message.empty() ? "exit code " + std::to_string(result.exit_code) : message;
}

}  // namespace

DockerSandboxRuntime::DockerSandboxRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

std::vector<std::string> DockerSandboxRuntime::BuildRunArgs(const SandboxSpec& spec) {
    std::vector<std::string> args = {
        "run",
        "--detach",
        "--label", "codebox.execution=" + spec.execution_id,
        "--memory", std::to_string(spec.limits.memory_bytes) + "b",
        "--memory-swap", std::to_string(spec.limits.memory_bytes) + "b",
        "--cpus", FormatCpus(spec.limits.cpus),
        "--workdir", "/code",
        "--volume", spec.code_dir.string() + ":/code:ro"
    };
    if (spec.network_disabled) {
        args.push_back("--network");
        args.push_back("none");
    }
    for (const auto& [key, value] : spec.environment) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }
    args.push_back(spec.image);
    args.push_back(spec.interpreter);
    args.push_back("/code/" + spec.entry_file);
    return args;
}

std::unique_ptr<SandboxHandle> DockerSandboxRuntime::Launch(const SandboxSpec& spec) {
    std::vector<std::string> argv = {docker_binary_};
    const auto args = BuildRunArgs(spec);
    argv.insert(argv.end(), args.begin(), args.end());

    const auto result = CommandRunner::Run(argv, spec.scratch_dir, kRunTimeout);
    if (result.exit_code != 0) {
        throw ExecutionError("docker run failed: " + Describe(result));
    }
    const auto container_id = utils::Trim(result.output);
    if (container_id.empty()) {
        throw ExecutionError("docker run returned no container id");
    }
    utils::Log(utils::LogLevel::kDebug, "sandbox", "container started", {
        {"id", spec.execution_id},
        {"container", container_id.substr(0, 12)},
        {"image", spec.image}
    });
    return std::make_unique<DockerSandbox>(docker_binary_, container_id);
}

SandboxState ParseDockerState(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream stream(utils::Trim(text));
    std::string part;
    while (std::getline(stream, part, '|')) {
        parts.push_back(part);
    }
    if (parts.size() != 4) {
        throw ExecutionError("Unexpected docker inspect output: " + text);
    }

    SandboxState state{};
    const auto& status = parts[0];
    state.running = !(status == "exited" || status == "dead");
    if (state.running) {
        return state;
    }
    try {
        state.exit_code = std::stoi(parts[1]);
    } catch (const std::exception&) {
        throw ExecutionError("Unexpected docker exit code: " + parts[1]);
    }
    state.finished_at = utils::ParseIsoUtc(parts[2]);
    state.resource_limit = parts[3] == "true";
    return state;
}

DockerSandbox::DockerSandbox(std::string docker_binary, std::string container_id)
    : docker_binary_(std::move(docker_binary))
    , container_id_(std::move(container_id)) {}

DockerSandbox::~DockerSandbox() {
    try {
        Remove();
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "sandbox", "container teardown failed", {
            {"container", container_id_.substr(0, 12)},
            {"error", ex.what()}
        });
    }
}

SandboxState DockerSandbox::Inspect() {
    const auto result = CommandRunner::Run(
        {docker_binary_, "inspect", "--format", kInspectFormat, container_id_},
        std::filesystem::temp_directory_path(),
        kCommandTimeout);
    if (result.exit_code != 0) {
        throw ExecutionError("docker inspect failed: " + Describe(result));
    }
    return ParseDockerState(result.output);
}

SandboxOutput DockerSandbox::ReadOutput() {
    const auto result = CommandRunner::Run(
        {docker_binary_, "logs", container_id_},
        std::filesystem::temp_directory_path(),
        kCommandTimeout);
    if (result.exit_code != 0) {
        throw ExecutionError("docker logs failed: " + Describe(result));
    }
    SandboxOutput output{};
    output.stdout_text = result.output;
    output.stderr_text = result.error;
    return output;
}

void DockerSandbox::Stop(std::chrono::seconds grace) {
    const auto result = CommandRunner::Run(
        {docker_binary_, "stop", "--time", std::to_string(grace.count()), container_id_},
        std::filesystem::temp_directory_path(),
        kCommandTimeout + grace);
    if (result.exit_code != 0) {
        throw ExecutionError("docker stop failed: " + Describe(result));
    }
}

void DockerSandbox::Remove() {
    if (removed_) {
        return;
    }
    const auto result = CommandRunner::Run(
        {docker_binary_, "rm", "--force", container_id_},
        std::filesystem::temp_directory_path(),
        kCommandTimeout);
    if (result.exit_code != 0) {
        throw ExecutionError("docker rm failed: " + Describe(result));
    }
    removed_ = true;
}

}  // namespace codebox::sandbox
