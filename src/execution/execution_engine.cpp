#include "execution/execution_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace codebox::execution {
namespace {

// Exit code recorded for a forced stop when the sandbox reports none.
constexpr int kKilledExitCode = 137;
constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

void AppendLine(std::string& text, const std::string& line) {
    if (!text.empty() && text.back() != '\n') {
        text.push_back('\n');
    }
    text += line;
}

}  // namespace

EngineOptions EngineOptions::FromConfig(const config::SandboxConfig& config) {
    EngineOptions options;
    options.workspace = config::ExpandHome(config.workspace);
    options.interpreter = config.interpreter;
    options.image = config.image;
    options.limits.memory_bytes = sandbox::ParseMemoryLimit(config.memory_limit);
    if (!(config.cpus > 0.0)) {
        throw ResourceError("CPU budget must be positive: " + std::to_string(config.cpus));
    }
    options.limits.cpus = config.cpus;
    options.limits.max_output_bytes = config.max_output_bytes;
    options.stop_grace = std::chrono::seconds(std::max(0, config.stop_grace_s));
    options.max_concurrent = static_cast<std::size_t>(std::max(0, config.max_concurrent));
    options.poll_interval = std::chrono::milliseconds(std::max(10, config.poll_interval_ms));
    options.network_disabled = config.network_disabled;
    return options;
}

ExecutionEngine::ExecutionEngine(std::shared_ptr<storage::FileStorage> files,
                                 std::unique_ptr<sandbox::SandboxRuntime> runtime,
                                 EngineOptions options,
                                 environment::EnvironmentManager* environments)
    : files_(std::move(files))
    , runtime_(std::move(runtime))
    , options_(std::move(options))
    , environments_(environments) {
    if (!files_ || !runtime_) {
        throw std::invalid_argument("ExecutionEngine requires file storage and a sandbox runtime");
    }
    if (options_.limits.memory_bytes == 0) {
        throw ResourceError("Memory limit must be positive");
    }
    if (!(options_.limits.cpus > 0.0)) {
        throw ResourceError("CPU budget must be positive");
    }
    if (options_.max_concurrent > 0) {
        dispatcher_ = std::thread([this]() { DispatchLoop(); });
    }
    utils::Log(utils::LogLevel::kDebug, "engine", "started", {
        {"backend", runtime_->Name()},
        {"workspace", options_.workspace.string()},
        {"max_concurrent", std::to_string(options_.max_concurrent)}
    });
}

ExecutionEngine::~ExecutionEngine() {
    Cleanup();
}

ExecutionRecord ExecutionEngine::Execute(const std::string& project_id, const std::string& entry_file) {
    const auto entry_path = ValidateRelativePath(entry_file);
    const auto files = files_->ListFiles(project_id);
    const bool has_entry = std::any_of(files.begin(), files.end(), [&](const storage::File& file) {
        return std::filesystem::path(file.path).lexically_normal() == entry_path;
    });
    if (!has_entry) {
        throw NotFoundError("Entry file '" + entry_file + "' not found in project " + project_id);
    }

    auto entry = std::make_shared<Entry>();
    const auto execution_id = utils::GenerateUuid();
    ScratchDir scratch(options_.workspace / execution_id);
    MaterializeSnapshot(files, scratch.Path() / "code");

    entry->spec = BuildSpec(execution_id, project_id, scratch.Path(), entry_path.generic_string());
    entry->record.id = execution_id;
    entry->record.project_id = project_id;
    entry->record.entry_file = entry_path.generic_string();
    entry->record.started_at = utils::Now();

    bool reserved = false;
    if (options_.max_concurrent > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ExecutionError("Execution engine is shut down");
        }
        if (queue_.empty() && running_count_.load() < options_.max_concurrent) {
            ++running_count_;
            reserved = true;
        } else {
            entry->record.status = ExecutionStatus::Queued;
            entry->scratch = std::move(scratch);
            const auto record = entry->record;
            entries_.emplace(execution_id, entry);
            queue_.push_back(execution_id);
            dispatch_cv_.notify_all();
            utils::Log(utils::LogLevel::kInfo, "engine", "queued", {
                {"id", execution_id},
                {"project", project_id},
                {"position", std::to_string(queue_.size())}
            });
            return record;
        }
    }

    entry->counted = reserved;
    try {
        Launch(*entry);
    } catch (const std::exception&) {
        if (reserved) {
            --running_count_;
        }
        throw;
    }
    entry->scratch = std::move(scratch);

    const auto record = entry->record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace(execution_id, std::move(entry));
    }
    return record;
}

ExecutionRecord ExecutionEngine::GetStatus(const std::string& execution_id) {
    auto entry = FindEntry(execution_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    Refresh(*entry);
    return entry->record;
}

ExecutionRecord ExecutionEngine::Terminate(const std::string& execution_id) {
    auto entry = FindEntry(execution_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    auto& record = entry->record;

    if (record.status == ExecutionStatus::Queued) {
        // The dispatcher skips entries that are no longer queued.
        record.status = ExecutionStatus::Error;
        record.exit_code = kKilledExitCode;
        record.completed_at = utils::Now();
        record.termination_reason = TerminationReason::Terminated;
        Reclaim(*entry);
        utils::Log(utils::LogLevel::kInfo, "engine", "dequeued", {{"id", execution_id}});
        return record;
    }

    // A sandbox that already finished keeps its own outcome.
    Refresh(*entry);
    if (IsTerminal(record.status)) {
        return record;
    }

    try {
        entry->handle->Stop(options_.stop_grace);
    } catch (const std::exception& ex) {
        throw ExecutionError("Failed to terminate execution " + execution_id + ": " + ex.what());
    }

    std::optional<int> exit_code;
    try {
        const auto state = entry->handle->Inspect();
        exit_code = state.exit_code;
        record.resource_usage.memory_usage_mb = state.memory_usage_mb;
        record.resource_usage.cpu_time_s = state.cpu_time_s;
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "engine", "inspect after stop failed", {
            {"id", execution_id},
            {"error", ex.what()}
        });
    }
    try {
        const auto output = entry->handle->ReadOutput();
        record.stdout_text = output.stdout_text;
        record.stderr_text = output.stderr_text;
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "engine", "output after stop unavailable", {
            {"id", execution_id},
            {"error", ex.what()}
        });
    }

    record.status = ExecutionStatus::Error;
    record.exit_code = exit_code.value_or(kKilledExitCode);
    record.completed_at = utils::Now();
    record.termination_reason = TerminationReason::Terminated;
    Reclaim(*entry);
    utils::Log(utils::LogLevel::kInfo, "engine", "terminated", {
        {"id", execution_id},
        {"exit", std::to_string(*record.exit_code)}
    });
    return record;
}

std::vector<ExecutionRecord> ExecutionEngine::ListExecutions() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            entries.push_back(entry);
        }
    }
    std::vector<ExecutionRecord> records;
    records.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        records.push_back(entry->record);
    }
    std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
        if (a.started_at != b.started_at) {
            return a.started_at < b.started_at;
        }
        return a.id < b.id;
    });
    return records;
}

void ExecutionEngine::Release(const std::string& execution_id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(execution_id);
        if (it == entries_.end()) {
            throw NotFoundError("Execution not found: " + execution_id);
        }
        entry = std::move(it->second);
        entries_.erase(it);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    Reclaim(*entry);
    utils::Log(utils::LogLevel::kDebug, "engine", "released", {{"id", execution_id}});
}

void ExecutionEngine::Cleanup() {
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        entries.swap(entries_);
        queue_.clear();
    }
    dispatch_cv_.notify_all();
    if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id()) {
        dispatcher_.join();
    }

    for (auto& [id, entry] : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        Reclaim(*entry);
    }
    if (!entries.empty()) {
        utils::Log(utils::LogLevel::kInfo, "engine", "cleaned up", {
            {"executions", std::to_string(entries.size())}
        });
    }
}

std::shared_ptr<ExecutionEngine::Entry> ExecutionEngine::FindEntry(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(execution_id);
    if (it == entries_.end()) {
        throw NotFoundError("Execution not found: " + execution_id);
    }
    return it->second;
}

sandbox::SandboxSpec ExecutionEngine::BuildSpec(const std::string& execution_id,
                                                const std::string& project_id,
                                                const std::filesystem::path& scratch_dir,
                                                const std::string& entry_file) const {
    sandbox::SandboxSpec spec;
    spec.execution_id = execution_id;
    spec.scratch_dir = scratch_dir;
    spec.code_dir = scratch_dir / "code";
    spec.entry_file = entry_file;
    spec.interpreter = options_.interpreter;
    spec.image = options_.image;
    spec.environment = options_.environment;
    spec.limits = options_.limits;
    spec.network_disabled = options_.network_disabled;

    if (environments_ && runtime_->Name() == "process") {
        if (const auto interpreter = environments_->FindInterpreter(project_id)) {
            const auto root = interpreter->parent_path().parent_path();
            spec.interpreter = interpreter->string();
            spec.environment["VIRTUAL_ENV"] = root.string();
            spec.environment["PATH"] = (root / "bin").string() + ":" + kDefaultPath;
        }
    }
    return spec;
}

void ExecutionEngine::Launch(Entry& entry) {
    entry.handle = runtime_->Launch(entry.spec);
    entry.record.status = ExecutionStatus::Running;
    utils::Log(utils::LogLevel::kInfo, "engine", "launched", {
        {"id", entry.record.id},
        {"project", entry.record.project_id},
        {"entry", entry.record.entry_file},
        {"backend", runtime_->Name()}
    });
}

void ExecutionEngine::Refresh(Entry& entry) {
    auto& record = entry.record;
    if (record.status != ExecutionStatus::Running) {
        return;
    }
    if (!entry.handle) {
        Degrade(entry, "sandbox handle missing");
        return;
    }

    try {
        const auto state = entry.handle->Inspect();
        const auto output = entry.handle->ReadOutput();
        record.stdout_text = output.stdout_text;
        record.stderr_text = output.stderr_text;
        if (state.running) {
            return;
        }
        if (!state.exit_code) {
            Degrade(entry, "sandbox exited without an exit code");
            return;
        }
        record.exit_code = state.exit_code;
        record.completed_at = state.finished_at.value_or(utils::Now());
        record.resource_usage.memory_usage_mb = state.memory_usage_mb;
        record.resource_usage.cpu_time_s = state.cpu_time_s;
        record.status = *state.exit_code == 0 ? ExecutionStatus::Completed : ExecutionStatus::Error;
        record.termination_reason =
            state.resource_limit ? TerminationReason::ResourceLimit : TerminationReason::Exited;
    } catch (const std::exception& ex) {
        Degrade(entry, ex.what());
        return;
    }

    Reclaim(entry);
    utils::Log(utils::LogLevel::kInfo, "engine", "finished", {
        {"id", record.id},
        {"status", StatusToString(record.status)},
        {"exit", std::to_string(*record.exit_code)},
        {"reason", ReasonToString(record.termination_reason)}
    });
}

void ExecutionEngine::Degrade(Entry& entry, const std::string& error) {
    auto& record = entry.record;
    record.status = ExecutionStatus::Error;
    record.exit_code = 1;
    record.completed_at = utils::Now();
    record.termination_reason = TerminationReason::RuntimeFailure;
    AppendLine(record.stderr_text, "Error getting execution status: " + error);
    Reclaim(entry);
    utils::Log(utils::LogLevel::kWarn, "engine", "status unavailable", {
        {"id", record.id},
        {"error", error}
    });
}

void ExecutionEngine::Reclaim(Entry& entry) {
    if (entry.handle) {
        try {
            entry.handle->Remove();
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kError, "engine", "sandbox removal failed", {
                {"id", entry.record.id},
                {"error", ex.what()}
            });
        }
        entry.handle.reset();
    }
    if (entry.counted) {
        entry.counted = false;
        --running_count_;
        dispatch_cv_.notify_all();
    }
    entry.scratch.Reset();
}

void ExecutionEngine::DispatchLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            dispatch_cv_.wait_for(lock, options_.poll_interval, [this]() {
                return stopping_ || (!queue_.empty() && running_count_.load() < options_.max_concurrent);
            });
            if (stopping_) {
                return;
            }
        }
        RefreshRunning();
        LaunchQueued();
    }
}

void ExecutionEngine::RefreshRunning() {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            entries.push_back(entry);
        }
    }
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        Refresh(*entry);
    }
}

void ExecutionEngine::LaunchQueued() {
    while (true) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            while (!queue_.empty() && running_count_.load() < options_.max_concurrent) {
                const auto id = queue_.front();
                queue_.pop_front();
                auto it = entries_.find(id);
                if (it != entries_.end()) {
                    entry = it->second;
                    ++running_count_;
                    break;
                }
            }
        }
        if (!entry) {
            return;
        }

        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->record.status != ExecutionStatus::Queued) {
            --running_count_;
            continue;
        }
        entry->counted = true;
        try {
            Launch(*entry);
        } catch (const std::exception& ex) {
            auto& record = entry->record;
            record.status = ExecutionStatus::Error;
            record.exit_code = 1;
            record.completed_at = utils::Now();
            record.termination_reason = TerminationReason::LaunchFailed;
            AppendLine(record.stderr_text, ex.what());
            Reclaim(*entry);
            utils::Log(utils::LogLevel::kError, "engine", "deferred launch failed", {
                {"id", record.id},
                {"error", ex.what()}
            });
        }
    }
}

}  // namespace codebox::execution
