#include "orchestrator/task_orchestrator.hpp"

#include <gtest/gtest.h>

#include <algorithm>

#include "agent/abacus_cli_runner.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using agentyard::agent::AbacusCliRunner;
using agentyard::agent::OutcomeKind;
using agentyard::agent::RunnerRegistry;
using agentyard::core::AgentBackend;
using agentyard::core::ResourceKind;
using agentyard::core::TaskDescriptor;
using agentyard::core::TaskState;
using agentyard::core::WarningKind;
using agentyard::orchestrator::CancelAck;
using agentyard::orchestrator::CancelResult;
using agentyard::orchestrator::TaskOrchestrator;
using agentyard::orchestrator::TaskSnapshot;
using agentyard::orchestrator::TaskStore;
using agentyard::results::OutputReader;
using agentyard::results::ResultCollector;
using agentyard::sandbox::ResourceLedger;
using agentyard::sandbox::SandboxProvisioner;
using agentyard::store::Database;
using namespace agentyard::testing;

namespace {

constexpr const char* kChatty = "echo \"working on $1\"; echo step; echo done";
constexpr const char* kLooping = "while true; do echo tick; sleep 0.05; done";

// Abacus runner that notes each cancellation in the shared call log.
class LoggingRunner : public AbacusCliRunner {
public:
    LoggingRunner(CallLog& log, const std::string& script)
        : AbacusCliRunner(ShellBackend(script))
        , log_(log) {}

    void Cancel(agentyard::agent::AgentRun& run) override {
        log_.Add("cancel agent");
        AbacusCliRunner::Cancel(run);
    }

private:
    CallLog& log_;
};

std::size_t CountPrefix(const std::vector<std::string>& entries, const std::string& prefix) {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [&prefix](const std::string& entry) {
        return entry.rfind(prefix, 0) == 0;
    }));
}

class TaskOrchestratorTest : public ::testing::Test {
protected:
    TaskOrchestratorTest()
        : db_(dir_.Path() / "state.db")
        , ledger_(db_)
        , issuer_(log_)
        , cloner_(log_)
        , fetcher_(log_, dir_.Path() / "workspaces")
        , provisioner_(issuer_, cloner_, fetcher_, ledger_)
        , collector_(db_, 16)
        , store_(db_) {
        config_.max_concurrent_tasks = 2;
        config_.idle_timeout_s = 30;
        config_.default_deadline_s = 60;
        config_.max_task_duration_s = 120;
        config_.cancel_grace_s = 1;
        config_.retention_s = 3600;
    }

    // Registers the abacus backend running `script` and starts the orchestrator.
    TaskOrchestrator& Start(const std::string& script) {
        return StartWith(std::make_unique<AbacusCliRunner>(ShellBackend(script)));
    }

    TaskOrchestrator& StartWith(std::unique_ptr<agentyard::agent::AgentRunner> runner) {
        registry_.Register(std::move(runner));
        orchestrator_ = std::make_unique<TaskOrchestrator>(
            config_, registry_, provisioner_, ledger_, collector_, store_);
        orchestrator_->Start();
        return *orchestrator_;
    }

    TaskDescriptor Descriptor(const std::string& instructions = "fix the flaky test") const {
        TaskDescriptor descriptor{};
        descriptor.backend = AgentBackend::kAbacus;
        descriptor.repository.url = "https://github.com/acme/app.git";
        descriptor.database_template = "app_template";
        descriptor.instructions = instructions;
        return descriptor;
    }

    TaskSnapshot WaitTerminal(const std::string& task_id) {
        const auto snapshot = orchestrator_->WaitForTerminal(task_id, 30s);
        EXPECT_TRUE(snapshot.has_value());
        EXPECT_TRUE(snapshot && agentyard::core::IsTerminal(snapshot->state))
            << (snapshot ? agentyard::core::ToString(snapshot->state) : "missing");
        return snapshot.value_or(TaskSnapshot{});
    }

    void WaitForState(const std::string& task_id, TaskState state) {
        const auto give_up = std::chrono::steady_clock::now() + 20s;
        while (std::chrono::steady_clock::now() < give_up) {
            const auto snapshot = orchestrator_->GetStatus(task_id);
            if (snapshot && snapshot->state == state) {
                return;
            }
            std::this_thread::sleep_for(10ms);
        }
        FAIL() << task_id << " never reached " << agentyard::core::ToString(state);
    }

    void WaitForOutput(const std::string& task_id, std::uint64_t chunks) {
        const auto give_up = std::chrono::steady_clock::now() + 20s;
        while (collector_.ChunkCount(task_id) < chunks && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(10ms);
        }
        ASSERT_GE(collector_.ChunkCount(task_id), chunks);
    }

    std::vector<TaskState> States(const TaskSnapshot& snapshot) const {
        std::vector<TaskState> states;
        for (const auto& transition : snapshot.history) {
            states.push_back(transition.state);
        }
        return states;
    }

    void ExpectNoLiveResources() {
        EXPECT_EQ(issuer_.live.load(), 0);
        EXPECT_EQ(cloner_.live.load(), 0);
        EXPECT_EQ(fetcher_.live.load(), 0);
        EXPECT_TRUE(ledger_.Entries().empty());
    }

    TempDir dir_;
    Database db_;
    ResourceLedger ledger_;
    CallLog log_;
    FakeIssuer issuer_;
    FakeCloner cloner_;
    FakeFetcher fetcher_;
    SandboxProvisioner provisioner_;
    ResultCollector collector_;
    TaskStore store_;
    RunnerRegistry registry_;
    agentyard::config::OrchestratorConfig config_;
    std::unique_ptr<TaskOrchestrator> orchestrator_;
};

}  // namespace

TEST_F(TaskOrchestratorTest, SuccessfulTaskWalksEveryState) {
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());
    EXPECT_EQ(task_id.rfind("task-", 0), 0u);

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(States(snapshot), (std::vector<TaskState>{
        TaskState::kSubmitted, TaskState::kProvisioning, TaskState::kRunning,
        TaskState::kFinalizing, TaskState::kSucceeded}));
    ASSERT_TRUE(snapshot.outcome.has_value());
    EXPECT_EQ(snapshot.outcome->kind, OutcomeKind::kSuccess);
    EXPECT_EQ(snapshot.outcome->summary, "done");
    EXPECT_GT(snapshot.output_bytes, 0u);
    EXPECT_TRUE(snapshot.warnings.empty());
    EXPECT_TRUE(snapshot.started_at.has_value());
    EXPECT_TRUE(snapshot.finished_at.has_value());
    ExpectNoLiveResources();

    auto reader = orchestrator.StreamOutput(task_id);
    EXPECT_EQ(reader->ReadAll(1s), "working on fix the flaky test\nstep\ndone\n");
    EXPECT_TRUE(collector_.LoadOutcome(task_id).has_value());
}

TEST_F(TaskOrchestratorTest, CancelWhileRunningStopsOutputAndReleasesSandbox) {
    auto& orchestrator = Start(kLooping);
    const auto task_id = orchestrator.Submit(Descriptor());
    WaitForState(task_id, TaskState::kRunning);
    WaitForOutput(task_id, 3);

    const auto ack = orchestrator.Cancel(task_id);
    const auto chunks_at_ack = collector_.ChunkCount(task_id);
    EXPECT_EQ(ack.result, CancelResult::kAccepted);
    EXPECT_EQ(ack.observed_state, TaskState::kRunning);

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kCancelled);
    ASSERT_TRUE(snapshot.outcome.has_value());
    EXPECT_EQ(snapshot.outcome->kind, OutcomeKind::kCancelled);
    EXPECT_EQ(collector_.ChunkCount(task_id), chunks_at_ack);
    EXPECT_TRUE(snapshot.warnings.empty());
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, CloneFailureFailsTaskAndRevokesCredential) {
    cloner_.fail_clone = true;
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kFailed);
    ASSERT_TRUE(snapshot.failing_resource.has_value());
    EXPECT_EQ(*snapshot.failing_resource, ResourceKind::kDatabaseClone);
    EXPECT_NE(snapshot.failure_cause.find("app_template"), std::string::npos);
    EXPECT_FALSE(snapshot.outcome.has_value());
    EXPECT_EQ(States(snapshot), (std::vector<TaskState>{
        TaskState::kSubmitted, TaskState::kProvisioning, TaskState::kFailed}));
    ExpectNoLiveResources();
    EXPECT_EQ(log_.Entries(), (std::vector<std::string>{
        "issue credential " + snapshot.sandbox_id,
        "revoke credential " + snapshot.sandbox_id}));
}

TEST_F(TaskOrchestratorTest, SilentAgentTimesOut) {
    config_.idle_timeout_s = 1;
    auto& orchestrator = Start("echo starting; exec sleep 30");
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kFailed);
    ASSERT_TRUE(snapshot.outcome.has_value());
    EXPECT_EQ(snapshot.outcome->kind, OutcomeKind::kTimedOut);
    EXPECT_EQ(snapshot.outcome->detail, "no output or CPU progress for 1000ms");
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, DeadlineOverrideTimesOutBusyAgent) {
    auto& orchestrator = Start(kLooping);
    auto descriptor = Descriptor();
    descriptor.deadline = 1s;
    const auto task_id = orchestrator.Submit(descriptor);

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kFailed);
    ASSERT_TRUE(snapshot.outcome.has_value());
    EXPECT_EQ(snapshot.outcome->kind, OutcomeKind::kTimedOut);
    EXPECT_EQ(snapshot.outcome->detail, "deadline exceeded");
}

TEST_F(TaskOrchestratorTest, FailingAgentFailsTask) {
    auto& orchestrator = Start("echo 'bad credentials' >&2; exit 4");
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kFailed);
    ASSERT_TRUE(snapshot.outcome.has_value());
    EXPECT_EQ(snapshot.outcome->kind, OutcomeKind::kFailure);
    EXPECT_EQ(snapshot.outcome->exit_code, 4);
    EXPECT_NE(snapshot.outcome->stderr_tail.find("bad credentials"), std::string::npos);
    EXPECT_FALSE(snapshot.failing_resource.has_value());
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, CancelOnTerminalTaskIsIdempotent) {
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());
    WaitTerminal(task_id);
    const auto releases = log_.Entries().size();

    const auto first = orchestrator.Cancel(task_id);
    const auto second = orchestrator.Cancel(task_id);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.result, CancelResult::kAlreadyTerminal);
    EXPECT_EQ(first.observed_state, TaskState::kSucceeded);
    EXPECT_EQ(orchestrator.GetStatus(task_id)->state, TaskState::kSucceeded);
    EXPECT_EQ(log_.Entries().size(), releases);
}

TEST_F(TaskOrchestratorTest, UnknownTaskIsReported) {
    auto& orchestrator = Start(kChatty);
    EXPECT_THROW(orchestrator.Cancel("task-missing"), agentyard::core::TaskNotFoundError);
    EXPECT_THROW(orchestrator.StreamOutput("task-missing"), agentyard::core::TaskNotFoundError);
    EXPECT_FALSE(orchestrator.GetStatus("task-missing").has_value());
}

TEST_F(TaskOrchestratorTest, RejectsMalformedDescriptors) {
    auto& orchestrator = Start(kChatty);
    using agentyard::core::ValidationError;

    auto empty = Descriptor("   ");
    EXPECT_THROW(orchestrator.Submit(empty), ValidationError);

    auto bad_url = Descriptor();
    bad_url.repository.url = "ftp://example.com/repo";
    EXPECT_THROW(orchestrator.Submit(bad_url), ValidationError);

    auto bad_template = Descriptor();
    bad_template.database_template = "app-template; drop";
    EXPECT_THROW(orchestrator.Submit(bad_template), ValidationError);

    auto zero_deadline = Descriptor();
    zero_deadline.deadline = 0s;
    EXPECT_THROW(orchestrator.Submit(zero_deadline), ValidationError);

    auto long_deadline = Descriptor();
    long_deadline.deadline = std::chrono::seconds(config_.max_task_duration_s + 1);
    EXPECT_THROW(orchestrator.Submit(long_deadline), ValidationError);

    auto bad_branch = Descriptor();
    bad_branch.repository.base_branch = "--upload-pack=x";
    EXPECT_THROW(orchestrator.Submit(bad_branch), ValidationError);

    auto unregistered = Descriptor();
    unregistered.backend = AgentBackend::kClaudeCode;
    EXPECT_THROW(orchestrator.Submit(unregistered), ValidationError);

    EXPECT_TRUE(orchestrator.List().empty());
    EXPECT_TRUE(log_.Entries().empty());
}

TEST_F(TaskOrchestratorTest, ConcurrencyLimitBoundsActiveTasks) {
    config_.max_concurrent_tasks = 2;
    auto& orchestrator = Start("echo begin; sleep 0.4; echo end");

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(orchestrator.Submit(Descriptor("task " + std::to_string(i))));
    }

    std::size_t peak = 0;
    bool all_done = false;
    const auto give_up = std::chrono::steady_clock::now() + 30s;
    while (!all_done && std::chrono::steady_clock::now() < give_up) {
        peak = std::max(peak, orchestrator.ActiveCount());
        all_done = true;
        for (const auto& id : ids) {
            all_done = all_done && agentyard::core::IsTerminal(orchestrator.GetStatus(id)->state);
        }
        std::this_thread::sleep_for(5ms);
    }

    EXPECT_TRUE(all_done);
    EXPECT_LE(peak, 2u);
    EXPECT_GE(peak, 1u);
    for (const auto& id : ids) {
        EXPECT_EQ(orchestrator.GetStatus(id)->state, TaskState::kSucceeded);
    }
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, CancelQueuedTaskTouchesNoResources) {
    config_.max_concurrent_tasks = 1;
    auto& orchestrator = Start(kLooping);
    const auto running = orchestrator.Submit(Descriptor());
    WaitForState(running, TaskState::kRunning);
    const auto queued = orchestrator.Submit(Descriptor());

    const auto ack = orchestrator.Cancel(queued);
    EXPECT_EQ(ack.result, CancelResult::kAccepted);
    EXPECT_EQ(ack.observed_state, TaskState::kSubmitted);
    const auto snapshot = orchestrator.GetStatus(queued);
    EXPECT_EQ(snapshot->state, TaskState::kCancelled);
    EXPECT_EQ(States(*snapshot), (std::vector<TaskState>{TaskState::kSubmitted, TaskState::kCancelled}));

    orchestrator.Cancel(running);
    WaitTerminal(running);
    for (const auto& entry : log_.Entries()) {
        EXPECT_EQ(entry.find(snapshot->sandbox_id), std::string::npos) << entry;
    }
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, TeardownFailureIsWarningAndReconcilable) {
    cloner_.fail_destroy = true;
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kSucceeded);
    EXPECT_TRUE(snapshot.HasWarning(WarningKind::kTeardown));
    ASSERT_EQ(snapshot.resources.size(), 1u);
    EXPECT_EQ(snapshot.resources.front().kind, ResourceKind::kDatabaseClone);
    EXPECT_FALSE(snapshot.resources.front().last_error.empty());

    const auto leaked = orchestrator.Audit();
    ASSERT_EQ(leaked.size(), 1u);
    EXPECT_EQ(leaked.front().task_id, task_id);

    const auto stuck = orchestrator.Reconcile();
    EXPECT_EQ(stuck.released, 0u);
    EXPECT_EQ(stuck.still_leaked.size(), 1u);

    cloner_.fail_destroy = false;
    const auto report = orchestrator.Reconcile();
    EXPECT_EQ(report.released, 1u);
    EXPECT_TRUE(report.still_leaked.empty());
    EXPECT_TRUE(orchestrator.Audit().empty());
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, PublishesOnlyWhenRequested) {
    auto& orchestrator = Start(kChatty);
    auto descriptor = Descriptor("rename the config flag\nand update docs");
    descriptor.publish_changes = true;
    const auto published = orchestrator.Submit(descriptor);
    const auto quiet = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(published);
    WaitTerminal(quiet);
    ASSERT_TRUE(snapshot.publish.has_value());
    EXPECT_TRUE(snapshot.publish->pushed);
    EXPECT_EQ(snapshot.publish->message, "agentyard: rename the config flag");

    std::size_t publishes = 0;
    for (const auto& entry : log_.Entries()) {
        publishes += entry.rfind("publish ", 0) == 0 ? 1 : 0;
    }
    EXPECT_EQ(publishes, 1u);
}

TEST_F(TaskOrchestratorTest, PublishFailureKeepsTaskSucceeded) {
    fetcher_.fail_publish = true;
    auto& orchestrator = Start(kChatty);
    auto descriptor = Descriptor();
    descriptor.publish_changes = true;
    const auto task_id = orchestrator.Submit(descriptor);

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kSucceeded);
    EXPECT_TRUE(snapshot.HasWarning(WarningKind::kPublishFailed));
    EXPECT_FALSE(snapshot.publish.has_value());
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, StartRecoversInterruptedTasks) {
    TaskSnapshot stale{};
    stale.id = "task-stale";
    stale.sandbox_id = "sbx-stale";
    stale.state = TaskState::kRunning;
    stale.created_at = agentyard::utils::Now();
    stale.descriptor = Descriptor();
    store_.Save(stale);
    collector_.Open("task-stale");

    auto& orchestrator = Start(kChatty);
    const auto snapshot = orchestrator.GetStatus("task-stale");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->state, TaskState::kFailed);
    EXPECT_TRUE(snapshot->HasWarning(WarningKind::kInterrupted));
    EXPECT_TRUE(collector_.IsFinished("task-stale"));

    const auto cancel = orchestrator.Cancel("task-stale");
    EXPECT_EQ(cancel.result, CancelResult::kAlreadyTerminal);
}

TEST_F(TaskOrchestratorTest, PurgeDropsExpiredTasks) {
    config_.retention_s = 0;
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());
    WaitTerminal(task_id);
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(orchestrator.PurgeExpired(), 1u);
    EXPECT_FALSE(orchestrator.GetStatus(task_id).has_value());
    EXPECT_FALSE(collector_.Exists(task_id));
    EXPECT_THROW(orchestrator.StreamOutput(task_id), agentyard::core::TaskNotFoundError);
}

TEST_F(TaskOrchestratorTest, CancelDuringProvisioningRollsBackAfterInFlightCall) {
    cloner_.clone_delay = 600ms;
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto give_up = std::chrono::steady_clock::now() + 20s;
    while (!cloner_.clone_started && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(cloner_.clone_started);

    const auto ack = orchestrator.Cancel(task_id);
    EXPECT_EQ(ack.result, CancelResult::kAccepted);
    EXPECT_EQ(ack.observed_state, TaskState::kProvisioning);

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kCancelled);
    EXPECT_EQ(States(snapshot), (std::vector<TaskState>{
        TaskState::kSubmitted, TaskState::kProvisioning, TaskState::kCancelled}));
    EXPECT_FALSE(snapshot.outcome.has_value());
    EXPECT_TRUE(snapshot.warnings.empty());
    const auto& sbx = snapshot.sandbox_id;
    EXPECT_EQ(log_.Entries(), (std::vector<std::string>{
        "issue credential " + sbx,
        "clone database " + sbx,
        "destroy database " + sbx,
        "revoke credential " + sbx}));
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, ProvisioningRetryUsesFreshSandbox) {
    config_.provision_attempts = 2;
    fetcher_.failing_checkouts = 1;
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kSucceeded);
    EXPECT_TRUE(snapshot.warnings.empty());
    const auto first = agentyard::sandbox::SandboxIdFor(task_id);
    const auto second = agentyard::sandbox::SandboxIdFor(task_id, 2);
    EXPECT_EQ(snapshot.sandbox_id, second);

    const auto entries = log_.Entries();
    ASSERT_GE(entries.size(), 7u);
    EXPECT_EQ(std::vector<std::string>(entries.begin(), entries.begin() + 7), (std::vector<std::string>{
        "issue credential " + first,
        "clone database " + first,
        "destroy database " + first,
        "revoke credential " + first,
        "issue credential " + second,
        "clone database " + second,
        "checkout repository " + second}));
    ExpectNoLiveResources();
}

TEST_F(TaskOrchestratorTest, RetryIsSkippedWhileRollbackLeftHandlesBehind) {
    config_.provision_attempts = 2;
    fetcher_.fail_checkout = true;
    cloner_.fail_destroy = true;
    auto& orchestrator = Start(kChatty);
    const auto task_id = orchestrator.Submit(Descriptor());

    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kFailed);
    ASSERT_TRUE(snapshot.failing_resource.has_value());
    EXPECT_EQ(*snapshot.failing_resource, ResourceKind::kRepoCheckout);
    EXPECT_TRUE(snapshot.HasWarning(WarningKind::kTeardown));
    EXPECT_EQ(CountPrefix(log_.Entries(), "issue credential "), 1u);

    // Every clone that is still alive is visible to the audit.
    const auto leaked = orchestrator.Audit();
    EXPECT_EQ(static_cast<std::size_t>(cloner_.live.load()), leaked.size());
    ASSERT_EQ(leaked.size(), 1u);
    EXPECT_EQ(leaked.front().kind, ResourceKind::kDatabaseClone);
    ASSERT_EQ(snapshot.resources.size(), 1u);
    EXPECT_EQ(issuer_.live.load(), 0);
}

TEST_F(TaskOrchestratorTest, RunnerIsCancelledBeforeAnyRelease) {
    auto& orchestrator = StartWith(std::make_unique<LoggingRunner>(log_, kLooping));
    const auto task_id = orchestrator.Submit(Descriptor());
    WaitForState(task_id, TaskState::kRunning);
    WaitForOutput(task_id, 2);

    EXPECT_EQ(orchestrator.Cancel(task_id).result, CancelResult::kAccepted);
    const auto snapshot = WaitTerminal(task_id);
    EXPECT_EQ(snapshot.state, TaskState::kCancelled);

    const auto sbx = snapshot.sandbox_id;
    EXPECT_EQ(log_.Entries(), (std::vector<std::string>{
        "issue credential " + sbx,
        "clone database " + sbx,
        "checkout repository " + sbx,
        "cancel agent",
        "release repository " + sbx,
        "destroy database " + sbx,
        "revoke credential " + sbx}));
    ExpectNoLiveResources();
}
