#include <gtest/gtest.h>

#include <future>
#include <iterator>
#include <set>
#include <unistd.h>

#include "core/errors.hpp"
#include "environment/environment_manager.hpp"
#include "execution/execution_engine.hpp"
#include "sandbox/process_sandbox.hpp"
#include "storage/memory_storage.hpp"
#include "test_util.hpp"

using codebox::ExecutionError;
using codebox::NotFoundError;
using codebox::SecurityError;
using codebox::execution::EngineOptions;
using codebox::execution::ExecutionEngine;
using codebox::execution::ExecutionRecord;
using codebox::execution::ExecutionStatus;
using codebox::execution::TerminationReason;
using codebox::storage::MemoryFileStorage;
using codebox::test::MakeFile;
using codebox::test::TempDirectory;
using codebox::test::WaitFor;

namespace fs = std::filesystem;
namespace sandbox = codebox::sandbox;

namespace {

// Scripted sandbox shared between a test and the handles it launches.
struct FakeControl {
    std::mutex mutex;
    bool running = true;
    int exit_code = 0;
    bool fail_inspect = false;
    bool fail_stop = false;
    bool fail_launch = false;
    std::string stdout_text;
    int launched = 0;
    int removed = 0;
};

class FakeHandle : public sandbox::SandboxHandle {
public:
    explicit FakeHandle(std::shared_ptr<FakeControl> control)
        : control_(std::move(control)) {}

    sandbox::SandboxState Inspect() override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        if (control_->fail_inspect) {
            throw ExecutionError("runtime unreachable");
        }
        sandbox::SandboxState state;
        state.running = control_->running;
        if (!control_->running) {
            state.exit_code = control_->exit_code;
        }
        return state;
    }

    sandbox::SandboxOutput ReadOutput() override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        return {control_->stdout_text, ""};
    }

    void Stop(std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        if (control_->fail_stop) {
            throw ExecutionError("stop refused");
        }
        control_->running = false;
        control_->exit_code = 143;
    }

    void Remove() override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        ++control_->removed;
    }

private:
    std::shared_ptr<FakeControl> control_;
};

class FakeRuntime : public sandbox::SandboxRuntime {
public:
    explicit FakeRuntime(std::shared_ptr<FakeControl> control)
        : control_(std::move(control)) {}

    std::string Name() const override { return "fake"; }

    std::unique_ptr<sandbox::SandboxHandle> Launch(const sandbox::SandboxSpec&) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        if (control_->fail_launch) {
            throw ExecutionError("no capacity");
        }
        ++control_->launched;
        return std::make_unique<FakeHandle>(control_);
    }

private:
    std::shared_ptr<FakeControl> control_;
};

class ExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        files_ = std::make_shared<MemoryFileStorage>();
        options_.workspace = dir_.Path() / "work";
        options_.interpreter = "/bin/sh";
        options_.stop_grace = std::chrono::seconds(1);
        options_.poll_interval = std::chrono::milliseconds(20);
    }

    void AddFile(const std::string& project_id, const std::string& path, const std::string& content) {
        files_->SaveFile(MakeFile(project_id, path, content));
    }

    std::unique_ptr<ExecutionEngine> MakeEngine() {
        return std::make_unique<ExecutionEngine>(
            files_, std::make_unique<sandbox::ProcessSandboxRuntime>(), options_);
    }

    std::unique_ptr<ExecutionEngine> MakeFakeEngine() {
        return std::make_unique<ExecutionEngine>(files_, std::make_unique<FakeRuntime>(control_), options_);
    }

    static ExecutionRecord WaitTerminal(ExecutionEngine& engine, const std::string& id) {
        ExecutionRecord record;
        WaitFor([&]() {
            record = engine.GetStatus(id);
            return codebox::execution::IsTerminal(record.status);
        });
        return record;
    }

    std::size_t WorkspaceEntries() const {
        std::error_code ec;
        if (!fs::exists(options_.workspace, ec)) {
            return 0;
        }
        return static_cast<std::size_t>(
            std::distance(fs::directory_iterator(options_.workspace), fs::directory_iterator()));
    }

    TempDirectory dir_;
    std::shared_ptr<MemoryFileStorage> files_;
    std::shared_ptr<FakeControl> control_ = std::make_shared<FakeControl>();
    EngineOptions options_;
};

// Runs against the real process backend, which needs mount, pid and
// network namespaces.
class ProcessEngineTest : public ExecutionEngineTest {
protected:
    void SetUp() override {
        if (!sandbox::ProcessSandboxRuntime::NamespacesAvailable()) {
            GTEST_SKIP() << "namespaces are not available to this process";
        }
        ExecutionEngineTest::SetUp();
    }
};

}  // namespace

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, hello_world) {
    AddFile("p1", "main.sh", "echo \"Hello, World!\"\n");
    auto engine = MakeEngine();

    const auto started = engine->Execute("p1", "main.sh");
    EXPECT_EQ(started.status, ExecutionStatus::Running);
    EXPECT_EQ(started.project_id, "p1");
    EXPECT_FALSE(started.exit_code.has_value());
    EXPECT_FALSE(started.completed_at.has_value());

    const auto record = WaitTerminal(*engine, started.id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_NE(record.stdout_text.find("Hello, World!"), std::string::npos);
    ASSERT_TRUE(record.completed_at.has_value());
    EXPECT_GE(*record.completed_at + std::chrono::seconds(1), record.started_at);
    EXPECT_EQ(record.termination_reason, TerminationReason::Exited);
    EXPECT_FALSE(fs::exists(options_.workspace / started.id));
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, status_is_idempotent_once_terminal) {
    AddFile("p1", "main.sh", "echo done\n");
    auto engine = MakeEngine();
    const auto id = engine->Execute("p1", "main.sh").id;
    const auto first = WaitTerminal(*engine, id);
    const auto second = engine->GetStatus(id);
    EXPECT_EQ(second.status, first.status);
    EXPECT_EQ(second.exit_code, first.exit_code);
    EXPECT_EQ(second.completed_at, first.completed_at);
    EXPECT_EQ(second.stdout_text, first.stdout_text);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, non_zero_exit_is_error) {
    AddFile("p1", "main.sh", "echo oops >&2\nexit 3\n");
    auto engine = MakeEngine();
    const auto record = WaitTerminal(*engine, engine->Execute("p1", "main.sh").id);
    EXPECT_EQ(record.status, ExecutionStatus::Error);
    EXPECT_EQ(record.exit_code, 3);
    EXPECT_NE(record.stderr_text.find("oops"), std::string::npos);
    EXPECT_EQ(record.termination_reason, TerminationReason::Exited);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, runs_nested_entry_with_snapshot_as_cwd) {
    AddFile("p1", "app/main.sh", "cat data/input.txt\n");
    AddFile("p1", "data/input.txt", "from snapshot");
    auto engine = MakeEngine();
    const auto record = WaitTerminal(*engine, engine->Execute("p1", "app/main.sh").id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_EQ(record.stdout_text, "from snapshot");
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, terminate_running) {
    AddFile("p1", "main.sh", "while true; do sleep 0.1; done\n");
    auto engine = MakeEngine();
    const auto id = engine->Execute("p1", "main.sh").id;

    const auto terminated = engine->Terminate(id);
    EXPECT_EQ(terminated.status, ExecutionStatus::Error);
    EXPECT_TRUE(terminated.exit_code.has_value());
    EXPECT_TRUE(terminated.completed_at.has_value());
    EXPECT_EQ(terminated.termination_reason, TerminationReason::Terminated);

    const auto status = engine->GetStatus(id);
    EXPECT_EQ(status.status, ExecutionStatus::Error);
    EXPECT_EQ(status.exit_code, terminated.exit_code);

    const auto again = engine->Terminate(id);
    EXPECT_EQ(again.status, ExecutionStatus::Error);
    EXPECT_EQ(again.completed_at, terminated.completed_at);
    EXPECT_EQ(engine->RunningCount(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, terminate_finished_keeps_outcome) {
    AddFile("p1", "main.sh", "echo ok\n");
    auto engine = MakeEngine();
    const auto id = engine->Execute("p1", "main.sh").id;
    const auto finished = WaitTerminal(*engine, id);
    const auto after = engine->Terminate(id);
    EXPECT_EQ(after.status, ExecutionStatus::Completed);
    EXPECT_EQ(after.exit_code, 0);
    EXPECT_EQ(after.completed_at, finished.completed_at);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, unknown_ids) {
    auto engine = MakeEngine();
    EXPECT_THROW(engine->GetStatus("nonexistent"), NotFoundError);
    EXPECT_THROW(engine->Terminate("nonexistent"), NotFoundError);
    EXPECT_THROW(engine->Release("nonexistent"), NotFoundError);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, rejects_bad_entry) {
    AddFile("p1", "main.sh", "echo hi\n");
    auto engine = MakeEngine();
    EXPECT_THROW(engine->Execute("p1", "missing.sh"), NotFoundError);
    EXPECT_THROW(engine->Execute("empty-project", "main.sh"), NotFoundError);
    EXPECT_THROW(engine->Execute("p1", "../main.sh"), SecurityError);
    EXPECT_THROW(engine->Execute("p1", "/etc/passwd"), SecurityError);
    EXPECT_TRUE(engine->ListExecutions().empty());
    EXPECT_EQ(WorkspaceEntries(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, launch_failure_leaves_nothing) {
    AddFile("p1", "main.sh", "echo hi\n");
    options_.interpreter = (dir_.Path() / "no-such-interpreter").string();
    auto engine = MakeEngine();
    EXPECT_THROW(engine->Execute("p1", "main.sh"), ExecutionError);
    EXPECT_TRUE(engine->ListExecutions().empty());
    EXPECT_EQ(WorkspaceEntries(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, projects_are_isolated) {
    AddFile("p1", "main.sh", "cat data.txt\n");
    AddFile("p1", "data.txt", "alpha");
    AddFile("p2", "main.sh", "cat data.txt\n");
    AddFile("p2", "data.txt", "beta");
    auto engine = MakeEngine();

    auto first = std::async(std::launch::async, [&]() { return engine->Execute("p1", "main.sh").id; });
    auto second = std::async(std::launch::async, [&]() { return engine->Execute("p2", "main.sh").id; });
    const auto first_id = first.get();
    const auto second_id = second.get();
    ASSERT_NE(first_id, second_id);

    EXPECT_EQ(WaitTerminal(*engine, first_id).stdout_text, "alpha");
    EXPECT_EQ(WaitTerminal(*engine, second_id).stdout_text, "beta");
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, executions_cannot_reach_each_other) {
    AddFile("p1", "main.sh", "sleep 1; echo from-A\n");
    AddFile("p2", "main.sh",
            "for f in ../../*/stdout.log /proc/*/fd/1; do echo INJECTED >> \"$f\"; done 2>/dev/null\n"
            "cat ../../*/code/main.sh /proc/*/root/*/code/main.sh 2>/dev/null\n"
            "ls ../..\n");
    auto engine = MakeEngine();

    const auto first = engine->Execute("p1", "main.sh").id;
    const auto second = engine->Execute("p2", "main.sh").id;
    const auto intruder = WaitTerminal(*engine, second);
    EXPECT_EQ(intruder.stdout_text.find("from-A"), std::string::npos);
    // Only its own scratch directory is visible in the workspace.
    EXPECT_NE(intruder.stdout_text.find(second), std::string::npos);
    EXPECT_EQ(intruder.stdout_text.find(first), std::string::npos);

    const auto victim = WaitTerminal(*engine, first);
    EXPECT_EQ(victim.status, ExecutionStatus::Completed);
    EXPECT_EQ(victim.stdout_text, "from-A\n");
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, network_namespace_follows_option) {
    const auto host = fs::read_symlink("/proc/self/ns/net").string();
    AddFile("p1", "main.sh", "readlink /proc/self/ns/net\n");

    auto isolated = MakeEngine();
    const auto record = WaitTerminal(*isolated, isolated->Execute("p1", "main.sh").id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_NE(record.stdout_text, "");
    EXPECT_NE(record.stdout_text, host + "\n");

    options_.network_disabled = false;
    auto shared = MakeEngine();
    const auto open = WaitTerminal(*shared, shared->Execute("p1", "main.sh").id);
    EXPECT_EQ(open.stdout_text, host + "\n");
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, background_processes_die_with_the_program) {
    AddFile("p1", "main.sh", "(sleep 30; echo late) &\necho done\n");
    auto engine = MakeEngine();
    const auto record = WaitTerminal(*engine, engine->Execute("p1", "main.sh").id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_EQ(record.stdout_text, "done\n");
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, concurrent_executions_of_one_project) {
    AddFile("p1", "main.sh", "echo run\n");
    auto engine = MakeEngine();
    std::vector<std::future<std::string>> launches;
    for (int i = 0; i < 6; ++i) {
        launches.push_back(std::async(std::launch::async, [&]() { return engine->Execute("p1", "main.sh").id; }));
    }
    std::set<std::string> ids;
    for (auto& launch : launches) {
        ids.insert(launch.get());
    }
    ASSERT_EQ(ids.size(), 6u);
    for (const auto& id : ids) {
        const auto record = WaitTerminal(*engine, id);
        EXPECT_EQ(record.status, ExecutionStatus::Completed);
        EXPECT_EQ(record.stdout_text, "run\n");
    }
    EXPECT_EQ(engine->ListExecutions().size(), 6u);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, snapshot_is_read_only) {
    AddFile("p1", "main.sh", "if (echo x >> main.sh) 2>/dev/null; then echo writable; else echo readonly; fi\n");
    auto engine = MakeEngine();
    const auto record = WaitTerminal(*engine, engine->Execute("p1", "main.sh").id);
    EXPECT_EQ(record.stdout_text, "readonly\n");
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, output_limit_is_resource_error) {
    AddFile("p1", "main.sh", "exec head -c 100000 /dev/zero\n");
    options_.limits.max_output_bytes = 1024;
    auto engine = MakeEngine();
    const auto record = WaitTerminal(*engine, engine->Execute("p1", "main.sh").id);
    EXPECT_EQ(record.status, ExecutionStatus::Error);
    EXPECT_EQ(record.termination_reason, TerminationReason::ResourceLimit);
    EXPECT_LE(record.stdout_text.size(), 1024u);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, queued_beyond_max_concurrent) {
    AddFile("p1", "slow.sh", "sleep 1\necho slow\n");
    AddFile("p1", "fast.sh", "echo fast\n");
    options_.max_concurrent = 1;
    auto engine = MakeEngine();

    const auto slow = engine->Execute("p1", "slow.sh");
    const auto fast = engine->Execute("p1", "fast.sh");
    EXPECT_EQ(slow.status, ExecutionStatus::Running);
    EXPECT_EQ(fast.status, ExecutionStatus::Queued);
    EXPECT_FALSE(fast.exit_code.has_value());

    const auto record = WaitTerminal(*engine, fast.id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_EQ(record.stdout_text, "fast\n");
    EXPECT_EQ(engine->GetStatus(slow.id).status, ExecutionStatus::Completed);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, terminate_queued) {
    AddFile("p1", "loop.sh", "while true; do sleep 0.1; done\n");
    options_.max_concurrent = 1;
    auto engine = MakeEngine();

    const auto running = engine->Execute("p1", "loop.sh");
    const auto queued = engine->Execute("p1", "loop.sh");
    ASSERT_EQ(queued.status, ExecutionStatus::Queued);

    const auto dequeued = engine->Terminate(queued.id);
    EXPECT_EQ(dequeued.status, ExecutionStatus::Error);
    EXPECT_EQ(dequeued.termination_reason, TerminationReason::Terminated);
    EXPECT_TRUE(dequeued.exit_code.has_value());

    engine->Terminate(running.id);
    EXPECT_EQ(engine->GetStatus(queued.id).status, ExecutionStatus::Error);
    EXPECT_TRUE(WaitFor([&]() { return engine->RunningCount() == 0; }));
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, deferred_launch_failure) {
    AddFile("p1", "main.sh", "");
    options_.max_concurrent = 1;
    auto engine = MakeFakeEngine();

    const auto first = engine->Execute("p1", "main.sh");
    const auto second = engine->Execute("p1", "main.sh");
    ASSERT_EQ(second.status, ExecutionStatus::Queued);
    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->fail_launch = true;
        control_->running = false;
    }

    const auto record = WaitTerminal(*engine, second.id);
    EXPECT_EQ(record.status, ExecutionStatus::Error);
    EXPECT_EQ(record.termination_reason, TerminationReason::LaunchFailed);
    EXPECT_NE(record.stderr_text.find("no capacity"), std::string::npos);
    EXPECT_EQ(engine->GetStatus(first.id).status, ExecutionStatus::Completed);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, running_then_exited) {
    AddFile("p1", "main.py", "print('hi')");
    auto engine = MakeFakeEngine();
    const auto id = engine->Execute("p1", "main.py").id;
    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->stdout_text = "partial";
    }

    auto record = engine->GetStatus(id);
    EXPECT_EQ(record.status, ExecutionStatus::Running);
    EXPECT_EQ(record.stdout_text, "partial");
    EXPECT_FALSE(record.exit_code.has_value());

    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->running = false;
        control_->exit_code = 0;
        control_->stdout_text = "partial and done";
    }
    record = engine->GetStatus(id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_EQ(record.stdout_text, "partial and done");
    ASSERT_TRUE(record.completed_at.has_value());
    EXPECT_EQ(control_->removed, 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, runtime_failure_degrades_to_error) {
    AddFile("p1", "main.py", "");
    auto engine = MakeFakeEngine();
    const auto id = engine->Execute("p1", "main.py").id;
    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->fail_inspect = true;
    }

    const auto record = engine->GetStatus(id);
    EXPECT_EQ(record.status, ExecutionStatus::Error);
    EXPECT_EQ(record.exit_code, 1);
    EXPECT_TRUE(record.completed_at.has_value());
    EXPECT_NE(record.stderr_text.find("Error getting execution status"), std::string::npos);
    EXPECT_EQ(record.termination_reason, TerminationReason::RuntimeFailure);

    const auto again = engine->GetStatus(id);
    EXPECT_EQ(again.stderr_text, record.stderr_text);
    EXPECT_EQ(again.completed_at, record.completed_at);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, stop_failure_is_reported) {
    AddFile("p1", "main.py", "");
    auto engine = MakeFakeEngine();
    const auto id = engine->Execute("p1", "main.py").id;
    {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->fail_stop = true;
    }
    EXPECT_THROW(engine->Terminate(id), ExecutionError);
    EXPECT_EQ(engine->GetStatus(id).status, ExecutionStatus::Running);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, release_and_cleanup) {
    AddFile("p1", "main.py", "");
    auto engine = MakeFakeEngine();
    const auto first = engine->Execute("p1", "main.py").id;
    const auto second = engine->Execute("p1", "main.py").id;
    const auto third = engine->Execute("p1", "main.py").id;
    EXPECT_EQ(WorkspaceEntries(), 3u);

    engine->Release(first);
    EXPECT_THROW(engine->GetStatus(first), NotFoundError);
    EXPECT_EQ(control_->removed, 1);
    EXPECT_EQ(WorkspaceEntries(), 2u);

    engine->Cleanup();
    EXPECT_EQ(control_->removed, 3);
    EXPECT_TRUE(engine->ListExecutions().empty());
    EXPECT_THROW(engine->GetStatus(second), NotFoundError);
    EXPECT_THROW(engine->GetStatus(third), NotFoundError);
    EXPECT_EQ(WorkspaceEntries(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ExecutionEngineTest, list_executions_in_start_order) {
    AddFile("p1", "main.py", "");
    auto engine = MakeFakeEngine();
    const auto first = engine->Execute("p1", "main.py").id;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const auto second = engine->Execute("p1", "main.py").id;
    const auto records = engine->ListExecutions();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, first);
    EXPECT_EQ(records[1].id, second);
}

// NOLINTNEXTLINE
TEST_F(ProcessEngineTest, uses_project_environment) {
    const auto interpreter = dir_.Path() / "fake-python";
    codebox::test::WriteScript(interpreter, "mkdir -p \"$3/bin\" && ln -s /bin/sh \"$3/bin/python\"\n");
    codebox::environment::EnvironmentOptions env_options;
    env_options.base_path = dir_.Path() / "venvs";
    env_options.interpreter = interpreter.string();
    codebox::environment::EnvironmentManager environments(env_options);
    environments.CreateEnvironment("p1");

    AddFile("p1", "main.sh", "echo \"$VIRTUAL_ENV\"\n");
    AddFile("p2", "main.sh", "echo plain\n");
    options_.interpreter = (dir_.Path() / "no-such-interpreter").string();
    ExecutionEngine engine(files_, std::make_unique<sandbox::ProcessSandboxRuntime>(), options_, &environments);

    const auto record = WaitTerminal(engine, engine.Execute("p1", "main.sh").id);
    EXPECT_EQ(record.status, ExecutionStatus::Completed);
    EXPECT_EQ(record.stdout_text, (env_options.base_path / "env_p1").string() + "\n");
    EXPECT_THROW(engine.Execute("p2", "main.sh"), ExecutionError);
}
