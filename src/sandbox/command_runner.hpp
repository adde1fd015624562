#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codebox::sandbox {

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

// Runs argv[0] (resolved through PATH when it has no '/') synchronously with
// the caller's environment plus `env_overrides`, capturing stdout and stderr.
// On timeout the process gets SIGTERM, two seconds, then SIGKILL, and
// exit_code is 124. Throws ExecutionError when the command cannot be started.
class CommandRunner {
public:
    static CommandResult Run(const std::vector<std::string>& argv,
                             const std::filesystem::path& working_dir,
                             std::chrono::seconds timeout,
                             const std::map<std::string, std::string>& env_overrides = {});
};

// Absolute path of an executable name or path. Empty when not found.
std::filesystem::path ResolveExecutable(const std::string& name);

}  // namespace codebox::sandbox
