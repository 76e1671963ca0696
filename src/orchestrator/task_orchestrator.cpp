#include "orchestrator/task_orchestrator.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::orchestrator {
namespace {

constexpr int kTotalSteps = 5;
constexpr std::size_t kTitleChars = 72;

int StepOf(core::TaskState state) {
    switch (state) {
        case core::TaskState::kSubmitted: return 1;
        case core::TaskState::kProvisioning: return 2;
        case core::TaskState::kRunning: return 3;
        case core::TaskState::kFinalizing: return 4;
        default: return 5;
    }
}

bool HasSupportedScheme(const std::string& url) {
    static const char* kPrefixes[] = {"https://", "http://", "git@", "ssh://", "file://", "/"};
    for (const auto* prefix : kPrefixes) {
        if (url.rfind(prefix, 0) == 0 && url.size() > std::char_traits<char>::length(prefix)) {
            return true;
        }
    }
    return false;
}

std::string PublishTitle(const std::string& instructions) {
    auto line = utils::Trim(instructions.substr(0, instructions.find('\n')));
    if (line.size() > kTitleChars) {
        line = line.substr(0, kTitleChars - 3) + "...";
    }
    return "agentyard: " + line;
}

std::string HandleId(const sandbox::LedgerEntry& entry) {
    switch (entry.kind) {
        case core::ResourceKind::kCredential: return entry.handle.value("serial", "");
        case core::ResourceKind::kDatabaseClone: return entry.handle.value("name", "");
        case core::ResourceKind::kRepoCheckout: return entry.handle.value("path", "");
    }
    return {};
}

}  // namespace

TaskOrchestrator::TaskOrchestrator(config::OrchestratorConfig config,
                                   agent::RunnerRegistry& runners,
                                   sandbox::SandboxProvisioner& provisioner,
                                   sandbox::ResourceLedger& ledger,
                                   results::ResultCollector& collector,
                                   TaskStore& store)
    : config_(std::move(config))
    , runners_(runners)
    , provisioner_(provisioner)
    , ledger_(ledger)
    , collector_(collector)
    , store_(store) {}

TaskOrchestrator::~TaskOrchestrator() {
    Stop();
}

void TaskOrchestrator::Start() {
    std::unordered_set<std::string> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dispatcher_.joinable()) {
            return;
        }
        for (const auto& [task_id, record] : tasks_) {
            owned.insert(task_id);
        }
    }

    for (const auto& snapshot : store_.RecoverInterrupted(owned)) {
        collector_.Finish(snapshot.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
    dispatcher_ = std::thread([this] { DispatchLoop(); });
    utils::LogInfo("orchestrator") << "started, max concurrent tasks=" << config_.max_concurrent_tasks;
}

void TaskOrchestrator::Stop() {
    std::vector<RecordPtr> records;
    std::vector<std::pair<agent::AgentRunner*, std::shared_ptr<agent::AgentRun>>> runs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (const auto& [task_id, record] : tasks_) {
            if (core::IsActive(record->snapshot.state)) {
                record->cancel_requested = true;
                if (record->run && record->runner) {
                    runs.emplace_back(record->runner, record->run);
                }
            }
            records.push_back(record);
        }
    }
    dispatch_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    for (auto& [runner, run] : runs) {
        runner->Cancel(*run);
    }
    for (auto& record : records) {
        if (record->worker.joinable()) {
            record->worker.join();
        }
    }
}

void TaskOrchestrator::ValidateDescriptor(const core::TaskDescriptor& descriptor) const {
    static const std::regex kTemplateName("^[A-Za-z_][A-Za-z0-9_]*$");
    static const std::regex kBranchName("^[A-Za-z0-9._/-]+$");

    if (utils::Trim(descriptor.instructions).empty()) {
        throw core::ValidationError("instructions must not be empty");
    }
    if (!HasSupportedScheme(descriptor.repository.url)) {
        throw core::ValidationError("unsupported repository url: " + descriptor.repository.url);
    }
    if (!descriptor.repository.base_branch.empty() &&
        (descriptor.repository.base_branch.front() == '-' ||
         !std::regex_match(descriptor.repository.base_branch, kBranchName))) {
        throw core::ValidationError("invalid base branch: " + descriptor.repository.base_branch);
    }
    if (!std::regex_match(descriptor.database_template, kTemplateName)) {
        throw core::ValidationError("invalid database template: " + descriptor.database_template);
    }
    if (descriptor.deadline) {
        const auto seconds = descriptor.deadline->count();
        if (seconds <= 0 || seconds > config_.max_task_duration_s) {
            throw core::ValidationError("deadline must be between 1 and " +
                                        std::to_string(config_.max_task_duration_s) + " seconds");
        }
    }
    if (!runners_.Has(descriptor.backend)) {
        throw core::ValidationError(std::string("no runner registered for backend ") +
                                    core::ToString(descriptor.backend));
    }
}

std::string TaskOrchestrator::Submit(const core::TaskDescriptor& descriptor) {
    ValidateDescriptor(descriptor);

    auto record = std::make_shared<TaskRecord>();
    auto& snapshot = record->snapshot;
    snapshot.descriptor = descriptor;
    if (snapshot.descriptor.repository.base_branch.empty()) {
        snapshot.descriptor.repository.base_branch = "main";
    }
    snapshot.created_at = utils::Now();
    snapshot.state = core::TaskState::kSubmitted;
    snapshot.history.push_back(StateTransition{.state = core::TaskState::kSubmitted, .at = snapshot.created_at});

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        snapshot.id = "task-" + utils::GenerateId(12);
    } while (tasks_.count(snapshot.id) > 0);
    snapshot.sandbox_id = sandbox::SandboxIdFor(snapshot.id);

    collector_.Open(snapshot.id);
    tasks_.emplace(snapshot.id, record);
    PersistLocked(*record);
    queue_.push_back(snapshot.id);
    utils::LogInfo("task") << snapshot.id << " step 1/" << kTotalSteps << " Submitted backend="
                           << core::ToString(descriptor.backend)
                           << " repo=" << descriptor.repository.url;
    dispatch_cv_.notify_all();
    return snapshot.id;
}

std::optional<TaskSnapshot> TaskOrchestrator::GetStatus(const std::string& task_id) const {
    std::optional<TaskSnapshot> snapshot;
    if (auto record = Find(task_id)) {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = record->snapshot;
    } else {
        snapshot = store_.Load(task_id);
    }
    if (!snapshot) {
        return std::nullopt;
    }
    return Decorate(std::move(*snapshot));
}

std::vector<TaskSnapshot> TaskOrchestrator::List() const {
    std::unordered_map<std::string, TaskSnapshot> merged;
    for (auto& snapshot : store_.LoadAll()) {
        merged.insert_or_assign(snapshot.id, std::move(snapshot));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [task_id, record] : tasks_) {
            merged.insert_or_assign(task_id, record->snapshot);
        }
    }
    std::vector<TaskSnapshot> snapshots;
    for (auto& [task_id, snapshot] : merged) {
        snapshots.push_back(Decorate(std::move(snapshot)));
    }
    std::sort(snapshots.begin(), snapshots.end(), [](const TaskSnapshot& a, const TaskSnapshot& b) {
        return a.created_at < b.created_at;
    });
    return snapshots;
}

CancelAck TaskOrchestrator::Cancel(const std::string& task_id) {
    CancelAck ack{};
    agent::AgentRunner* runner = nullptr;
    std::shared_ptr<agent::AgentRun> run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            const auto stored = store_.Load(task_id);
            if (!stored) {
                throw core::TaskNotFoundError(task_id);
            }
            // Another process owns non-terminal stored tasks.
            ack.observed_state = stored->state;
            ack.result = core::IsTerminal(stored->state)
                ? CancelResult::kAlreadyTerminal
                : CancelResult::kAlreadyFinalizing;
            return ack;
        }

        auto& record = *it->second;
        const auto state = record.snapshot.state;
        ack.observed_state = state;
        if (core::IsTerminal(state)) {
            ack.result = CancelResult::kAlreadyTerminal;
            return ack;
        }
        if (state == core::TaskState::kFinalizing) {
            ack.result = CancelResult::kAlreadyFinalizing;
            return ack;
        }

        ack.result = CancelResult::kAccepted;
        record.cancel_requested = true;
        utils::LogInfo("task") << task_id << " cancel requested in " << core::ToString(state);
        if (state == core::TaskState::kSubmitted) {
            // Never dequeued: no resource was touched.
            TransitionLocked(record, core::TaskState::kCancelled);
        } else if (state == core::TaskState::kRunning) {
            runner = record.runner;
            run = record.run;
        }
    }
    if (runner && run) {
        runner->Cancel(*run);
    }
    return ack;
}

std::unique_ptr<results::OutputReader> TaskOrchestrator::StreamOutput(const std::string& task_id) {
    if (!Find(task_id) && !store_.Load(task_id)) {
        throw core::TaskNotFoundError(task_id);
    }
    auto reader = collector_.OpenReader(task_id);
    if (!reader) {
        throw core::TaskNotFoundError(task_id);
    }
    return reader;
}

std::optional<TaskSnapshot> TaskOrchestrator::WaitForTerminal(const std::string& task_id,
                                                              std::chrono::milliseconds timeout) {
    if (auto record = Find(task_id)) {
        std::unique_lock<std::mutex> lock(mutex_);
        state_cv_.wait_for(lock, timeout, [&record] {
            return core::IsTerminal(record->snapshot.state);
        });
    }
    return GetStatus(task_id);
}

std::size_t TaskOrchestrator::PurgeExpired() {
    const auto cutoff = utils::Now() - std::chrono::seconds(config_.retention_s);
    std::vector<RecordPtr> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            const auto& snapshot = it->second->snapshot;
            const bool worker_finished = it->second->worker_done.load() || !it->second->worker.joinable();
            if (core::IsTerminal(snapshot.state) && snapshot.finished_at &&
                *snapshot.finished_at < cutoff && worker_finished) {
                expired.push_back(it->second);
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::unordered_set<std::string> purged;
    for (auto& record : expired) {
        if (record->worker.joinable()) {
            record->worker.join();
        }
        purged.insert(record->snapshot.id);
    }
    for (const auto& task_id : store_.ListFinishedBefore(cutoff)) {
        if (!Find(task_id)) {
            purged.insert(task_id);
        }
    }
    for (const auto& task_id : purged) {
        store_.Delete(task_id);
        collector_.Purge(task_id);
    }
    if (!purged.empty()) {
        utils::LogInfo("orchestrator") << "purged " << purged.size() << " expired task(s)";
    }
    return purged.size();
}

std::vector<sandbox::LedgerEntry> TaskOrchestrator::Audit() const {
    return ledger_.Audit([this](const std::string& task_id) { return IsTaskLive(task_id); });
}

ReconcileReport TaskOrchestrator::Reconcile() {
    ReconcileReport report{};
    for (auto& entry : Audit()) {
        const auto error = provisioner_.ReleaseEntry(entry);
        if (error.empty()) {
            ++report.released;
            utils::LogInfo("orchestrator") << "reconciled " << core::ToString(entry.kind)
                                           << " of " << entry.sandbox_id;
        } else {
            entry.last_error = error;
            report.still_leaked.push_back(std::move(entry));
        }
    }
    return report;
}

std::size_t TaskOrchestrator::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void TaskOrchestrator::DispatchLoop() {
    const auto limit = static_cast<std::size_t>(std::max(1, config_.max_concurrent_tasks));
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        dispatch_cv_.wait(lock, [&] {
            return stopping_ || (!queue_.empty() && active_ < limit);
        });
        if (stopping_) {
            break;
        }
        ReapFinishedWorkersLocked();

        const auto task_id = queue_.front();
        queue_.pop_front();
        auto it = tasks_.find(task_id);
        if (it == tasks_.end() || it->second->snapshot.state != core::TaskState::kSubmitted) {
            continue;
        }
        auto record = it->second;
        record->runner = runners_.Get(record->snapshot.descriptor.backend);
        TransitionLocked(*record, core::TaskState::kProvisioning);
        record->worker = std::thread([this, record] { RunTask(record); });
    }
}

void TaskOrchestrator::RunTask(const RecordPtr& record) {
    std::optional<sandbox::Sandbox> sandbox;
    try {
        if (ProvisionTask(record, sandbox)) {
            const auto outcome = RunAgent(record, *sandbox);
            bool cancelled = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                record->snapshot.outcome = outcome;
                record->run.reset();
                cancelled = record->cancel_requested.load();
                TransitionLocked(*record, core::TaskState::kFinalizing);
            }
            try {
                collector_.SaveOutcome(record->snapshot.id, outcome);
            } catch (const store::StoreError& ex) {
                utils::LogError("task") << record->snapshot.id << " saving outcome failed: " << ex.what();
            }

            if (outcome.kind == agent::OutcomeKind::kSuccess && !cancelled) {
                PublishIfRequested(record, *sandbox);
            }
            TeardownSandbox(record, *sandbox);

            auto final_state = core::TaskState::kFailed;
            if (cancelled || outcome.kind == agent::OutcomeKind::kCancelled) {
                final_state = core::TaskState::kCancelled;
            } else if (outcome.kind == agent::OutcomeKind::kSuccess) {
                final_state = core::TaskState::kSucceeded;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            TransitionLocked(*record, final_state);
        }
    } catch (const std::exception& ex) {
        utils::LogError("task") << record->snapshot.id << " worker failed: " << ex.what();
        if (sandbox && sandbox->HasLiveHandles()) {
            TeardownSandbox(record, *sandbox);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!core::IsTerminal(record->snapshot.state)) {
            record->snapshot.failure_cause = ex.what();
            TransitionLocked(*record, core::TaskState::kFailed);
        }
    }
    record->worker_done = true;
    dispatch_cv_.notify_all();
}

bool TaskOrchestrator::ProvisionTask(const RecordPtr& record, std::optional<sandbox::Sandbox>& sandbox) {
    const auto& descriptor = record->snapshot.descriptor;
    sandbox::ProvisionRequest request{
        .task_id = record->snapshot.id,
        .repository = descriptor.repository,
        .database_template = descriptor.database_template,
        .max_task_duration = std::chrono::seconds(config_.max_task_duration_s)};
    const auto should_stop = [&record] { return record->cancel_requested.load(); };
    const int attempts = std::max(1, config_.provision_attempts);

    sandbox::ProvisionResult result{};
    for (int attempt = 1;; ++attempt) {
        request.attempt = attempt;
        if (attempt > 1) {
            std::lock_guard<std::mutex> lock(mutex_);
            record->snapshot.sandbox_id = sandbox::SandboxIdFor(record->snapshot.id, attempt);
            PersistLocked(*record);
        }
        result = provisioner_.Provision(request, should_stop);
        if (result.Ok() || result.error->stopped || attempt >= attempts || should_stop()) {
            break;
        }
        // A handle whose rollback failed still holds its resource; another
        // attempt would only stack a second set on top of it.
        if (!result.error->rollback_failures.empty()) {
            utils::LogWarn("task") << record->snapshot.id << " provisioning attempt " << attempt
                                   << " left " << result.error->rollback_failures.size()
                                   << " handle(s) behind, not retrying";
            break;
        }
        utils::LogWarn("task") << record->snapshot.id << " provisioning attempt " << attempt << "/"
                               << attempts << " failed at " << core::ToString(result.error->failing_resource)
                               << ": " << result.error->cause << ", retrying";
    }

    if (result.Ok()) {
        sandbox = std::move(result.sandbox);
        {
            // Cancel() sets cancel_requested under this lock, so a request
            // that lands after this block is seen as a Running cancellation.
            std::lock_guard<std::mutex> lock(mutex_);
            if (!record->cancel_requested.load()) {
                TransitionLocked(*record, core::TaskState::kRunning);
                return true;
            }
        }
        TeardownSandbox(record, *sandbox);
        std::lock_guard<std::mutex> lock(mutex_);
        TransitionLocked(*record, core::TaskState::kCancelled);
        return false;
    }

    auto& error = *result.error;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& warning : error.rollback_failures) {
        AddWarningLocked(*record, std::move(warning));
    }
    if (error.stopped || record->cancel_requested.load()) {
        TransitionLocked(*record, core::TaskState::kCancelled);
        return false;
    }
    record->snapshot.failing_resource = error.failing_resource;
    record->snapshot.failure_cause = error.cause;
    TransitionLocked(*record, core::TaskState::kFailed);
    return false;
}

agent::Outcome TaskOrchestrator::RunAgent(const RecordPtr& record, const sandbox::Sandbox& sandbox) {
    const auto& descriptor = record->snapshot.descriptor;
    auto* runner = record->runner;

    agent::RunOptions options{};
    options.idle_timeout = std::chrono::seconds(config_.idle_timeout_s);
    options.cancel_grace = std::chrono::seconds(config_.cancel_grace_s);
    options.model = descriptor.model;
    const auto deadline_s = descriptor.deadline
        ? *descriptor.deadline
        : std::chrono::seconds(std::min(config_.default_deadline_s, config_.max_task_duration_s));
    const auto deadline = std::chrono::steady_clock::now() + deadline_s;

    if (record->cancel_requested.load()) {
        return agent::Outcome{.kind = agent::OutcomeKind::kCancelled, .detail = "cancelled before start"};
    }

    std::shared_ptr<agent::AgentRun> run;
    try {
        run = runner->Start(sandbox, descriptor.instructions, options);
    } catch (const std::exception& ex) {
        utils::LogError("task") << record->snapshot.id << " launch failed: " << ex.what();
        return agent::Outcome{.kind = agent::OutcomeKind::kFailure, .detail = ex.what()};
    }

    bool cancel_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->run = run;
        cancel_now = record->cancel_requested.load();
    }
    if (cancel_now) {
        runner->Cancel(*run);
    }

    const auto task_id = record->snapshot.id;
    runner->OnOutput(*run, [this, task_id](const std::string& chunk) {
        try {
            collector_.Append(task_id, chunk);
        } catch (const store::StoreError& ex) {
            utils::LogError("task") << task_id << " output lost: " << ex.what();
        }
    });
    return runner->AwaitOutcome(*run, deadline);
}

void TaskOrchestrator::PublishIfRequested(const RecordPtr& record, const sandbox::Sandbox& sandbox) {
    const auto& descriptor = record->snapshot.descriptor;
    if (!descriptor.publish_changes.value_or(config_.publish_changes) || !sandbox.checkout) {
        return;
    }
    try {
        auto result = provisioner_.Fetcher().PublishChanges(*sandbox.checkout, PublishTitle(descriptor.instructions));
        std::lock_guard<std::mutex> lock(mutex_);
        utils::LogInfo("task") << record->snapshot.id << " published: " << result.message;
        record->snapshot.publish = std::move(result);
    } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        AddWarningLocked(*record, core::TaskWarning{
            .kind = core::WarningKind::kPublishFailed,
            .resource = core::ResourceKind::kRepoCheckout,
            .message = ex.what()});
    }
}

void TaskOrchestrator::TeardownSandbox(const RecordPtr& record, sandbox::Sandbox& sandbox) {
    const auto report = provisioner_.Teardown(sandbox);
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto warning : report.Warnings()) {
        AddWarningLocked(*record, std::move(warning));
    }
}

void TaskOrchestrator::TransitionLocked(TaskRecord& record, core::TaskState state) {
    auto& snapshot = record.snapshot;
    if (core::IsTerminal(snapshot.state)) {
        utils::LogError("task") << snapshot.id << " ignoring transition " << core::ToString(snapshot.state)
                                << " -> " << core::ToString(state);
        return;
    }

    const auto previous = snapshot.state;
    const auto now = utils::Now();
    snapshot.state = state;
    snapshot.history.push_back(StateTransition{.state = state, .at = now});
    if (state == core::TaskState::kRunning) {
        snapshot.started_at = now;
    }
    if (core::IsTerminal(state)) {
        snapshot.finished_at = now;
    }

    if (!core::IsActive(previous) && core::IsActive(state)) {
        ++active_;
    } else if (core::IsActive(previous) && !core::IsActive(state)) {
        --active_;
        dispatch_cv_.notify_all();
    }

    if (state == core::TaskState::kFinalizing || core::IsTerminal(state)) {
        try {
            collector_.Finish(snapshot.id);
            snapshot.output_bytes = collector_.Bytes(snapshot.id);
        } catch (const store::StoreError& ex) {
            utils::LogError("task") << snapshot.id << " closing output failed: " << ex.what();
        }
    }

    auto line = utils::LogInfo("task");
    line << snapshot.id << " step " << StepOf(state) << "/" << kTotalSteps << " " << core::ToString(state);
    if (snapshot.failing_resource && state == core::TaskState::kFailed) {
        line << " failing=" << core::ToString(*snapshot.failing_resource);
    }
    if (!snapshot.warnings.empty() && core::IsTerminal(state)) {
        line << " warnings=" << snapshot.warnings.size();
    }

    PersistLocked(record);
    state_cv_.notify_all();
}

void TaskOrchestrator::AddWarningLocked(TaskRecord& record, core::TaskWarning warning) {
    utils::LogWarn("task") << record.snapshot.id << " " << core::ToString(warning.kind)
                           << (warning.resource ? std::string(" ") + core::ToString(*warning.resource) : "")
                           << ": " << warning.message;
    record.snapshot.warnings.push_back(std::move(warning));
    PersistLocked(record);
}

void TaskOrchestrator::PersistLocked(const TaskRecord& record) {
    try {
        store_.Save(record.snapshot);
    } catch (const store::StoreError& ex) {
        utils::LogError("task") << record.snapshot.id << " persisting snapshot failed: " << ex.what();
    }
}

TaskOrchestrator::RecordPtr TaskOrchestrator::Find(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

TaskSnapshot TaskOrchestrator::Decorate(TaskSnapshot snapshot) const {
    try {
        snapshot.output_bytes = collector_.Bytes(snapshot.id);
        snapshot.resources.clear();
        for (const auto& entry : ledger_.EntriesForTask(snapshot.id)) {
            snapshot.resources.push_back(ResourceSummary{
                .kind = entry.kind,
                .id = HandleId(entry),
                .last_error = entry.last_error});
        }
    } catch (const store::StoreError& ex) {
        utils::LogWarn("task") << snapshot.id << " status incomplete: " << ex.what();
    }
    return snapshot;
}

bool TaskOrchestrator::IsTaskLive(const std::string& task_id) const {
    if (auto record = Find(task_id)) {
        std::lock_guard<std::mutex> lock(mutex_);
        return !core::IsTerminal(record->snapshot.state);
    }
    const auto stored = store_.Load(task_id);
    return stored && !core::IsTerminal(stored->state);
}

void TaskOrchestrator::ReapFinishedWorkersLocked() {
    for (auto& [task_id, record] : tasks_) {
        if (record->worker_done.load() && record->worker.joinable()) {
            record->worker.join();
        }
    }
}

}  // namespace agentyard::orchestrator
