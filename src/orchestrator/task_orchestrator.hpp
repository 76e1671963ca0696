#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "agent/runner_registry.hpp"
#include "config/config_schema.hpp"
#include "orchestrator/task_snapshot.hpp"
#include "orchestrator/task_store.hpp"
#include "results/result_collector.hpp"
#include "sandbox/resource_ledger.hpp"
#include "sandbox/sandbox_provisioner.hpp"

namespace agentyard::orchestrator {

struct ReconcileReport {
    std::size_t released = 0;
    std::vector<sandbox::LedgerEntry> still_leaked;
};

// Drives every task through Submitted -> Provisioning -> Running ->
// Finalizing -> {Succeeded, Failed, Cancelled}. A dispatcher thread admits
// queued tasks while fewer than maxConcurrentTasks are Provisioning or
// Running; each admitted task is owned by one worker thread.
class TaskOrchestrator {
public:
    TaskOrchestrator(config::OrchestratorConfig config,
                     agent::RunnerRegistry& runners,
                     sandbox::SandboxProvisioner& provisioner,
                     sandbox::ResourceLedger& ledger,
                     results::ResultCollector& collector,
                     TaskStore& store);
    ~TaskOrchestrator();

    TaskOrchestrator(const TaskOrchestrator&) = delete;
    TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

    // Recovers interrupted tasks from the store, then starts dispatching.
    void Start();
    // Cancels active tasks and joins every worker. Queued tasks stay Submitted.
    void Stop();

    // Throws core::ValidationError for a malformed descriptor.
    std::string Submit(const core::TaskDescriptor& descriptor);

    std::optional<TaskSnapshot> GetStatus(const std::string& task_id) const;
    std::vector<TaskSnapshot> List() const;

    // Throws core::TaskNotFoundError for an unknown id.
    CancelAck Cancel(const std::string& task_id);

    // Throws core::TaskNotFoundError for an unknown id.
    std::unique_ptr<results::OutputReader> StreamOutput(const std::string& task_id);

    std::optional<TaskSnapshot> WaitForTerminal(const std::string& task_id, std::chrono::milliseconds timeout);

    // Drops terminal tasks older than the retention window. Returns how many.
    std::size_t PurgeExpired();

    // Ledger entries whose task is terminal or unknown.
    std::vector<sandbox::LedgerEntry> Audit() const;
    ReconcileReport Reconcile();

    std::size_t ActiveCount() const;

    void ValidateDescriptor(const core::TaskDescriptor& descriptor) const;

private:
    struct TaskRecord {
        TaskSnapshot snapshot;
        std::atomic<bool> cancel_requested{false};
        agent::AgentRunner* runner = nullptr;
        std::shared_ptr<agent::AgentRun> run;
        std::thread worker;
        std::atomic<bool> worker_done{false};
    };
    using RecordPtr = std::shared_ptr<TaskRecord>;

    void DispatchLoop();
    void RunTask(const RecordPtr& record);
    // Returns false when cancellation ended provisioning early.
    bool ProvisionTask(const RecordPtr& record, std::optional<sandbox::Sandbox>& sandbox);
    agent::Outcome RunAgent(const RecordPtr& record, const sandbox::Sandbox& sandbox);
    void PublishIfRequested(const RecordPtr& record, const sandbox::Sandbox& sandbox);
    void TeardownSandbox(const RecordPtr& record, sandbox::Sandbox& sandbox);

    // Caller holds mutex_.
    void TransitionLocked(TaskRecord& record, core::TaskState state);
    void AddWarningLocked(TaskRecord& record, core::TaskWarning warning);
    void PersistLocked(const TaskRecord& record);

    RecordPtr Find(const std::string& task_id) const;
    TaskSnapshot Decorate(TaskSnapshot snapshot) const;
    bool IsTaskLive(const std::string& task_id) const;
    void ReapFinishedWorkersLocked();

    config::OrchestratorConfig config_;
    agent::RunnerRegistry& runners_;
    sandbox::SandboxProvisioner& provisioner_;
    sandbox::ResourceLedger& ledger_;
    results::ResultCollector& collector_;
    TaskStore& store_;

    mutable std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    mutable std::condition_variable state_cv_;
    std::unordered_map<std::string, RecordPtr> tasks_;
    std::deque<std::string> queue_;
    std::size_t active_ = 0;
    bool stopping_ = false;
    std::thread dispatcher_;
};

}  // namespace agentyard::orchestrator
