#include "sandbox/process_sandbox.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <fcntl.h>
#include <linux/capability.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statfs.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "sandbox/boost_process.hpp"
#include "sandbox/command_runner.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";
constexpr auto kKillTimeout = std::chrono::seconds(5);
constexpr const char* kProcFdPrefix = "/proc/self/fd/";

// Everything from here to SandboxSetup runs in forked children of a
// multithreaded process: no allocation, async-signal-safe calls only.

template <class Executor>
[[noreturn]] void Fail(Executor& exec, const char* what) {
    const std::error_code ec(errno, std::system_category());
    exec.set_error(ec, what);
    ::_exit(EXIT_FAILURE);
}

std::size_t AppendNumber(char* out, std::size_t pos, unsigned long value) {
    char digits[24];
    std::size_t count = 0;
    do {
        digits[count++] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    while (count > 0) {
        out[pos++] = digits[--count];
    }
    return pos;
}

bool WriteProcFile(const char* path, const char* data, std::size_t size) {
    const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const bool written = ::write(fd, data, size) == static_cast<ssize_t>(size);
    const int saved = errno;
    ::close(fd);
    errno = saved;
    return written;
}

// "<id> <id> 1": the caller keeps its own id inside the namespace.
bool WriteIdMap(const char* path, unsigned long id) {
    char line[64];
    std::size_t pos = AppendNumber(line, 0, id);
    line[pos++] = ' ';
    pos = AppendNumber(line, pos, id);
    line[pos++] = ' ';
    line[pos++] = '1';
    line[pos++] = '\n';
    return WriteProcFile(path, line, pos);
}

// New mount, pid and (optionally) network namespaces. Root unshares them
// directly; everyone else, or root without CAP_SYS_ADMIN, goes through a
// user namespace first. The root mount is made private so nothing mounted
// afterwards reaches the host.
bool UnshareNamespaces(bool network_disabled) {
    const unsigned long uid = ::geteuid();
    const unsigned long gid = ::getegid();
    int flags = CLONE_NEWNS | CLONE_NEWPID;
    if (network_disabled) {
        flags |= CLONE_NEWNET;
    }
    bool user_ns = uid != 0;
    if (!user_ns && ::unshare(flags) != 0) {
        if (errno != EPERM) {
            return false;
        }
        user_ns = true;
    }
    if (user_ns) {
        if (::unshare(flags | CLONE_NEWUSER) != 0) {
            return false;
        }
        if (!WriteProcFile("/proc/self/setgroups", "deny", 4) && errno != ENOENT) {
            return false;
        }
        if (!WriteIdMap("/proc/self/uid_map", uid) || !WriteIdMap("/proc/self/gid_map", gid)) {
            return false;
        }
    }
    return ::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0;
}

// Closes every descriptor above stderr except `keep`, so the parent's
// exec-status pipe only stays open in the process that execs.
void CloseInheritedFds(int keep) {
#ifdef SYS_close_range
    const bool below = keep <= 3 || ::syscall(SYS_close_range, 3u, static_cast<unsigned>(keep - 1), 0u) == 0;
    if (below && ::syscall(SYS_close_range, static_cast<unsigned>(keep + 1), ~0u, 0u) == 0) {
        return;
    }
#endif
    struct rlimit rl {};
    rlim_t limit = 1024;
    if (::getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        limit = std::min<rlim_t>(rl.rlim_cur, 1 << 20);
    }
    for (int fd = 3; static_cast<rlim_t>(fd) < limit; ++fd) {
        if (fd != keep) {
            ::close(fd);
        }
    }
}

[[noreturn]] void ExitLike(int status) {
    if (WIFSIGNALED(status)) {
        const int signo = WTERMSIG(status);
        struct rlimit no_core {};
        ::setrlimit(RLIMIT_CORE, &no_core);
        ::signal(signo, SIG_DFL);
        sigset_t unblock;
        ::sigemptyset(&unblock);
        ::sigaddset(&unblock, signo);
        ::sigprocmask(SIG_UNBLOCK, &unblock, nullptr);
        ::kill(::getpid(), signo);
    }
    ::_exit(WIFEXITED(status) ? WEXITSTATUS(status) : EXIT_FAILURE);
}

// The process the engine waits on. It stays in the host pid namespace and
// exits the way the program did, so wait4() sees the program's status and
// the rusage of the whole tree. Stop signals reach the program through the
// process group.
[[noreturn]] void RelayProgramExit(pid_t init, int status_fd) {
    CloseInheritedFds(status_fd);
    ::signal(SIGTERM, SIG_IGN);
    ::signal(SIGINT, SIG_IGN);
    ::signal(SIGHUP, SIG_IGN);
    int init_status = 0;
    while (::waitpid(init, &init_status, 0) < 0 && errno == EINTR) {
    }
    int program_status = 0;
    ssize_t got = -1;
    do {
        got = ::read(status_fd, &program_status, sizeof(program_status));
    } while (got < 0 && errno == EINTR);
    ExitLike(got == static_cast<ssize_t>(sizeof(program_status)) ? program_status : init_status);
}

// pid 1 of the sandbox: reaps orphans, reports the program's wait status.
// Its exit kills whatever is left in the namespace.
[[noreturn]] void ReapNamespace(pid_t program, int status_fd) {
    CloseInheritedFds(status_fd);
    int program_status = W_EXITCODE(EXIT_FAILURE, 0);
    for (;;) {
        int status = 0;
        const pid_t reaped = ::waitpid(-1, &status, 0);
        if (reaped == program) {
            program_status = status;
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            break;
        }
    }
    ssize_t put = -1;
    do {
        put = ::write(status_fd, &program_status, sizeof(program_status));
    } while (put < 0 && errno == EINTR);
    ::_exit(EXIT_SUCCESS);
}

// Per-mount flags of the filesystem behind `fd` that a bind remount inside
// a user namespace has to repeat.
bool MountFlagsOf(int fd, unsigned long& flags) {
    struct statfs info {};
    if (::fstatfs(fd, &info) != 0) {
        return false;
    }
    flags = 0;
    if (info.f_flags & ST_NOEXEC) {
        flags |= MS_NOEXEC;
    }
    if (info.f_flags & ST_NODIRATIME) {
        flags |= MS_NODIRATIME;
    }
    if (info.f_flags & ST_NOATIME) {
        flags |= MS_NOATIME;
    } else if (info.f_flags & ST_RELATIME) {
        flags |= MS_RELATIME;
    } else {
        flags |= MS_STRICTATIME;
    }
    return true;
}

bool DropCapabilities() {
    for (int cap = 0; cap < 64; ++cap) {
        if (::prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EINVAL) {
            return false;
        }
    }
    if (::prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) != 0 && errno != EINVAL) {
        return false;
    }
    __user_cap_header_struct header {};
    header.version = _LINUX_CAPABILITY_VERSION_3;
    __user_cap_data_struct data[2] {};
    if (::syscall(SYS_capget, &header, data) != 0) {
        return false;
    }
    data[0].inheritable = 0;
    data[1].inheritable = 0;
    if (::syscall(SYS_capset, &header, data) != 0) {
        return false;
    }
    return ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == 0;
}

// Runs in the forked child right before exec. The child becomes a relay,
// forks pid 1 of a fresh pid namespace, which forks the program. The
// program sees an empty read-only workspace holding only its own snapshot,
// mounted read-only, and a /proc of its own namespace.
struct SandboxSetup : bp::extend::handler {
    std::uint64_t memory_bytes = 0;
    std::uint64_t max_output_bytes = 0;
    int cpu_slots = 1;
    bool network_disabled = true;
    std::string workspace;
    std::string scratch_dir;
    std::string code_dir;

    template <class Executor>
    void on_exec_setup(Executor& exec) const {
        if (::setsid() < 0) {
            Fail(exec, "setsid failed");
        }
        if (memory_bytes > 0) {
            struct rlimit rl;
            rl.rlim_cur = memory_bytes;
            rl.rlim_max = memory_bytes;
            if (::setrlimit(RLIMIT_AS, &rl) != 0) {
                Fail(exec, "setrlimit(RLIMIT_AS) failed");
            }
        }
        if (max_output_bytes > 0) {
            struct rlimit rl;
            rl.rlim_cur = max_output_bytes;
            rl.rlim_max = max_output_bytes;
            if (::setrlimit(RLIMIT_FSIZE, &rl) != 0) {
                Fail(exec, "setrlimit(RLIMIT_FSIZE) failed");
            }
        }
        cpu_set_t allowed;
        CPU_ZERO(&allowed);
        if (::sched_getaffinity(0, sizeof(allowed), &allowed) == 0) {
            cpu_set_t pinned;
            CPU_ZERO(&pinned);
            int taken = 0;
            for (int cpu = 0; cpu < CPU_SETSIZE && taken < cpu_slots; ++cpu) {
                if (CPU_ISSET(cpu, &allowed)) {
                    CPU_SET(cpu, &pinned);
                    ++taken;
                }
            }
            if (taken > 0 && ::sched_setaffinity(0, sizeof(pinned), &pinned) != 0) {
                Fail(exec, "sched_setaffinity failed");
            }
        }

        const int code_fd = ::open(code_dir.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC);
        if (code_fd < 0) {
            Fail(exec, "open snapshot failed");
        }
        if (!UnshareNamespaces(network_disabled)) {
            Fail(exec, "unshare failed");
        }
        int status_pipe[2];
        if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
            Fail(exec, "pipe2 failed");
        }
        const pid_t init = ::fork();
        if (init < 0) {
            Fail(exec, "fork of sandbox init failed");
        }
        if (init > 0) {
            ::close(status_pipe[1]);
            RelayProgramExit(init, status_pipe[0]);
        }
        const pid_t program = ::fork();
        if (program < 0) {
            Fail(exec, "fork of sandbox program failed");
        }
        if (program > 0) {
            ::close(status_pipe[0]);
            ReapNamespace(program, status_pipe[1]);
        }
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        EnterSnapshot(exec, code_fd);
    }

    template <class Executor>
    void EnterSnapshot(Executor& exec, int code_fd) const {
        unsigned long code_flags = 0;
        if (!MountFlagsOf(code_fd, code_flags)) {
            Fail(exec, "fstatfs on snapshot failed");
        }
        if (::mount("tmpfs", workspace.c_str(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC,
                    "size=64k,mode=0755") != 0) {
            Fail(exec, "mounting over workspace failed");
        }
        if (::mkdir(scratch_dir.c_str(), 0755) != 0 || ::mkdir(code_dir.c_str(), 0755) != 0) {
            Fail(exec, "mkdir in sandbox workspace failed");
        }
        char source[48];
        const std::size_t prefix = std::strlen(kProcFdPrefix);
        std::memcpy(source, kProcFdPrefix, prefix);
        source[AppendNumber(source, prefix, static_cast<unsigned long>(code_fd))] = '\0';
        if (::mount(source, code_dir.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            Fail(exec, "bind mount of snapshot failed");
        }
        if (::mount(nullptr, code_dir.c_str(), nullptr,
                    MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV | code_flags, nullptr) != 0) {
            Fail(exec, "read-only remount of snapshot failed");
        }
        if (::mount(nullptr, workspace.c_str(), nullptr,
                    MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0) {
            Fail(exec, "read-only remount of workspace failed");
        }
        ::close(code_fd);
        // The host /proc would expose other sandboxes through /proc/<pid>/root
        // and /proc/<pid>/fd; an empty one is the fallback.
        if (::mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0 &&
            ::mount("tmpfs", "/proc", "tmpfs", MS_RDONLY | MS_NOSUID | MS_NODEV | MS_NOEXEC,
                    "size=4k,mode=0555") != 0) {
            Fail(exec, "replacing /proc failed");
        }
        if (::chdir(code_dir.c_str()) != 0) {
            Fail(exec, "chdir into snapshot failed");
        }
        if (!DropCapabilities()) {
            Fail(exec, "dropping capabilities failed");
        }
    }
};

std::string ReadLog(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ExecutionError("Sandbox output unavailable: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

std::unique_ptr<SandboxHandle> ProcessSandboxRuntime::Launch(const SandboxSpec& spec) {
    const auto interpreter = ResolveExecutable(spec.interpreter);
    if (interpreter.empty()) {
        throw ExecutionError("Interpreter not found: " + spec.interpreter);
    }

    const auto stdout_path = spec.scratch_dir / "stdout.log";
    const auto stderr_path = spec.scratch_dir / "stderr.log";

    bp::environment env;
    env["PATH"] = kDefaultPath;
    env["HOME"] = spec.code_dir.string();
    env["LANG"] = "C.UTF-8";
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    for (const auto& [key, value] : spec.environment) {
        env[key] = value;
    }

    SandboxSetup setup;
    setup.memory_bytes = spec.limits.memory_bytes;
    setup.max_output_bytes = spec.limits.max_output_bytes;
    setup.cpu_slots = CpuSlots(spec.limits.cpus);
    setup.network_disabled = spec.network_disabled;
    const auto scratch_dir = std::filesystem::absolute(spec.scratch_dir).lexically_normal();
    setup.workspace = scratch_dir.parent_path().string();
    setup.scratch_dir = scratch_dir.string();
    setup.code_dir = std::filesystem::absolute(spec.code_dir).lexically_normal().string();

    pid_t pid = -1;
    try {
        bp::child child_process(
            bp::exe = interpreter.string(),
            bp::args = std::vector<std::string>{spec.entry_file},
            env,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            setup);
        pid = child_process.id();
        child_process.detach();
    } catch (const bp::process_error& ex) {
        throw ExecutionError(std::string("Failed to start sandbox: ") + ex.what());
    }

    utils::Log(utils::LogLevel::kDebug, "sandbox", "process started", {
        {"id", spec.execution_id},
        {"pid", std::to_string(pid)},
        {"interpreter", interpreter.string()}
    });
    try {
        return std::make_unique<ProcessSandbox>(pid, stdout_path, stderr_path);
    } catch (const std::exception& ex) {
        KillProcessGroup(pid);
        throw ExecutionError(std::string("Failed to track sandbox: ") + ex.what());
    }
}

bool ProcessSandboxRuntime::NamespacesAvailable() {
    const pid_t pid = ::fork();
    if (pid < 0) {
        return false;
    }
    if (pid == 0) {
        ::_exit(UnshareNamespaces(true) ? EXIT_SUCCESS : EXIT_FAILURE);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS;
}

void KillProcessGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
    }
}

ProcessSandbox::ProcessSandbox(pid_t pid,
                               std::filesystem::path stdout_path,
                               std::filesystem::path stderr_path)
    : pid_(pid)
    , stdout_path_(std::move(stdout_path))
    , stderr_path_(std::move(stderr_path)) {
    watcher_ = std::thread([this]() { Watch(); });
}

ProcessSandbox::~ProcessSandbox() {
    try {
        Remove();
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "sandbox", "teardown failed", {
            {"pid", std::to_string(pid_)},
            {"error", ex.what()}
        });
    }
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

void ProcessSandbox::Watch() {
    int status = 0;
    struct rusage usage {};
    pid_t waited = -1;
    do {
        waited = ::wait4(pid_, &status, 0, &usage);
    } while (waited < 0 && errno == EINTR);

    SandboxState state{};
    state.running = false;
    state.finished_at = utils::Now();
    if (waited == pid_) {
        if (WIFEXITED(status)) {
            state.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            const int signal = WTERMSIG(status);
            state.exit_code = 128 + signal;
            state.resource_limit = signal == SIGXCPU || signal == SIGXFSZ;
        }
        // ru_maxrss is in kilobytes on Linux.
        state.memory_usage_mb = static_cast<double>(usage.ru_maxrss) / 1024.0;
        state.cpu_time_s =
            static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
            static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
        // Leftover background processes of the program share its group.
        ::kill(-pid_, SIGKILL);
    } else {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "wait4 failed", {
            {"pid", std::to_string(pid_)},
            {"error", std::strerror(errno)}
        });
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        final_state_ = state;
        exited_ = true;
    }
    exited_cv_.notify_all();
}

SandboxState ProcessSandbox::Inspect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_) {
        SandboxState state{};
        state.running = true;
        return state;
    }
    if (!final_state_.exit_code.has_value()) {
        throw ExecutionError("Lost track of sandbox process " + std::to_string(pid_));
    }
    return final_state_;
}

SandboxOutput ProcessSandbox::ReadOutput() {
    SandboxOutput output{};
    output.stdout_text = ReadLog(stdout_path_);
    output.stderr_text = ReadLog(stderr_path_);
    return output;
}

void ProcessSandbox::Stop(std::chrono::seconds grace) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (exited_) {
        return;
    }
    SignalGroup(SIGTERM);
    if (WaitExited(lock, grace)) {
        return;
    }
    SignalGroup(SIGKILL);
    if (!WaitExited(lock, kKillTimeout)) {
        throw ExecutionError("Sandbox process " + std::to_string(pid_) + " did not exit after SIGKILL");
    }
}

void ProcessSandbox::Remove() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!exited_) {
            SignalGroup(SIGKILL);
            if (!WaitExited(lock, kKillTimeout)) {
                throw ExecutionError("Sandbox process " + std::to_string(pid_) + " did not exit after SIGKILL");
            }
        }
    }
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

void ProcessSandbox::SignalGroup(int signal) {
    if (::kill(-pid_, signal) == 0) {
        return;
    }
    // The group is gone; the watcher reports the exit.
    if (errno == ESRCH) {
        return;
    }
    throw ExecutionError("kill(" + std::to_string(pid_) + ", " + std::to_string(signal) +
                         ") failed: " + std::strerror(errno));
}

bool ProcessSandbox::WaitExited(std::unique_lock<std::mutex>& lock, std::chrono::milliseconds timeout) {
    return exited_cv_.wait_for(lock, timeout, [this] { return exited_; });
}

}  // namespace codebox::sandbox
