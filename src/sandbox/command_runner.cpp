#include "sandbox/command_runner.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "sandbox/boost_process.hpp"
#include "utils/common.hpp"

namespace codebox::sandbox {

std::filesystem::path ResolveExecutable(const std::string& name) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        std::error_code ec;
        const auto path = std::filesystem::absolute(name, ec);
        if (ec || !std::filesystem::exists(path, ec)) {
            return {};
        }
        return path;
    }
    const auto found = bp::search_path(name);
    if (found.empty()) {
        return {};
    }
    return std::filesystem::path(found.string());
}

CommandResult CommandRunner::Run(const std::vector<std::string>& argv,
                                 const std::filesystem::path& working_dir,
                                 std::chrono::seconds timeout,
                                 const std::map<std::string, std::string>& env_overrides) {
    if (argv.empty()) {
        throw ExecutionError("Empty command");
    }
    const auto executable = ResolveExecutable(argv.front());
    if (executable.empty()) {
        throw ExecutionError("Executable not found: " + argv.front());
    }

    CommandResult result{};
    const auto stamp = utils::GenerateUuid();
    const auto stdout_path = std::filesystem::temp_directory_path() / ("codebox_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("codebox_stderr_" + stamp + ".log");

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : env_overrides) {
        env[key] = value;
    }

    try {
        bp::child child_process(
            bp::exe = executable.string(),
            bp::args = std::vector<std::string>(argv.begin() + 1, argv.end()),
            env,
            bp::start_dir = working_dir.string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());
        const pid_t pid = child_process.id();
        child_process.detach();

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool finished = false;
        int status = 0;
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0 && errno != EINTR) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            const auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < grace_deadline) {
                const auto waited = ::waitpid(pid, &status, WNOHANG);
                if (waited == pid) {
                    finished = true;
                    break;
                }
                if (waited < 0 && errno != EINTR) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }

        if (result.timed_out) {
            result.exit_code = 124;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    } catch (const bp::process_error& ex) {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
        throw ExecutionError(std::string("exec failed: ") + ex.what());
    }

    auto read_file = [](const std::filesystem::path& path) {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            return std::string();
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        return buffer.str();
    };
    result.output = read_file(stdout_path);
    result.error = read_file(stderr_path);

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace codebox::sandbox
