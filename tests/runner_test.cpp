#include <gtest/gtest.h>

#include "agent/abacus_cli_runner.hpp"
#include "agent/claude_code_runner.hpp"
#include "agent/codex_cli_runner.hpp"
#include "agent/runner_registry.hpp"
#include "agent/runner_support.hpp"
#include "test_support.hpp"

using namespace agentyard;
using namespace std::chrono_literals;

namespace {

sandbox::Sandbox MakeSandbox(const std::filesystem::path& workspace) {
    sandbox::Sandbox sandbox{};
    sandbox.id = "sbx-1";
    sandbox.task_id = "task-1";
    sandbox.status = sandbox::SandboxStatus::kReady;
    sandbox.credential = resources::Credential{
        .serial = "0a", .sandbox_id = "sbx-1", .cert_path = "/c/cert.pem", .key_path = "/c/key.pem"};
    sandbox.database = resources::DatabaseClone{.name = "sbx_sbx_1", .template_name = "app", .sandbox_id = "sbx-1"};
    sandbox.checkout = resources::RepoCheckout{.path = workspace.string(), .sandbox_id = "sbx-1"};
    return sandbox;
}

agent::RunOptions FastOptions() {
    agent::RunOptions options{};
    options.idle_timeout = 500ms;
    options.cancel_grace = 200ms;
    return options;
}

}  // namespace

TEST(ClaudeCodeRunner, BuildsPrintModeArguments) {
    config::BackendConfig backend = config::AgentsConfig{}.claude;
    backend.model = "sonnet";
    agent::ClaudeCodeRunner runner(backend);

    EXPECT_EQ(runner.BuildArgs("fix it", ""), (std::vector<std::string>{
        "-p", "fix it",
        "--allowedTools", "Read,Write,Edit,Glob,Grep,Bash",
        "--dangerously-skip-permissions",
        "--output-format", "text",
        "--model", "sonnet"}));
    EXPECT_EQ(runner.BuildArgs("fix it", "opus").back(), "opus");
    EXPECT_EQ(agent::ClaudeCodeRunner::Summarize("working...\n\nDone: tests pass.\n"), "Done: tests pass.");
}

TEST(CodexCliRunner, BuildsExecArgumentsWithPromptLast) {
    agent::CodexCliRunner runner(config::AgentsConfig{}.codex);

    EXPECT_EQ(runner.BuildArgs("add tests", "o3"), (std::vector<std::string>{
        "exec", "--full-auto", "--model", "o3", "add tests"}));
    EXPECT_EQ(agent::CodexCliRunner::Summarize("thinking\ncodex\nfirst\ncodex\nAll done.\n"), "All done.");
    EXPECT_EQ(agent::CodexCliRunner::Summarize("no marker\n\nlast part"), "last part");
}

TEST(AbacusCliRunner, SummaryIsLastLine) {
    agent::AbacusCliRunner runner(config::AgentsConfig{}.abacus);

    EXPECT_EQ(runner.BuildArgs("go", ""), (std::vector<std::string>{"exec", "go"}));
    EXPECT_EQ(agent::AbacusCliRunner::Summarize("a\nb\nresult\n"), "result");
}

TEST(RunnerSupport, RemoteBackendIsWrappedInSsh) {
    config::BackendConfig backend{};
    backend.path = "/usr/local/bin/claude";
    backend.ssh_host = "gpu-box";
    backend.ssh_user = "agent";
    const auto command = agent::MakeCommandLine(backend, {"-p", "it's done"}, MakeSandbox("/w/sbx-1"));

    EXPECT_EQ(command.executable, "ssh");
    EXPECT_TRUE(command.working_dir.empty());
    ASSERT_GE(command.args.size(), 2u);
    EXPECT_EQ(command.args[command.args.size() - 2], "agent@gpu-box");
    const auto& remote = command.args.back();
    EXPECT_EQ(remote.rfind("cd '/w/sbx-1' && env ", 0), 0u);
    EXPECT_NE(remote.find("DATABASE_NAME='sbx_sbx_1'"), std::string::npos);
    EXPECT_NE(remote.find("'/usr/local/bin/claude' '-p' 'it'\\''s done'"), std::string::npos);
}

TEST(RunnerSupport, LocalBackendExposesSandboxEnvironment) {
    config::BackendConfig backend{};
    backend.path = "/bin/true";
    const auto command = agent::MakeCommandLine(backend, {"x"}, MakeSandbox("/w/sbx-1"));

    EXPECT_EQ(command.executable, "/bin/true");
    EXPECT_EQ(command.working_dir, "/w/sbx-1");
    EXPECT_EQ(command.env.at("AGENTYARD_TLS_CERT"), "/c/cert.pem");
    EXPECT_EQ(command.env.at("AGENTYARD_TLS_KEY"), "/c/key.pem");
    EXPECT_EQ(command.env.at("TASK_ID"), "task-1");
}

TEST(RunnerRegistry, FromConfigRegistersAllBackends) {
    const auto registry = agent::RunnerRegistry::FromConfig(config::AgentsConfig{});
    EXPECT_EQ(registry.List().size(), 3u);
    ASSERT_NE(registry.Get(core::AgentBackend::kCodex), nullptr);
    EXPECT_EQ(registry.Get(core::AgentBackend::kCodex)->Backend(), core::AgentBackend::kCodex);
    EXPECT_TRUE(registry.Has(core::AgentBackend::kAbacus));

    agent::RunnerRegistry empty;
    EXPECT_EQ(empty.Get(core::AgentBackend::kClaudeCode), nullptr);
}

TEST(AgentRunner, SuccessfulRunReportsSummaryAndOutput) {
    agentyard::testing::TempDir dir;
    agent::AbacusCliRunner runner(agentyard::testing::ShellBackend(
        "echo \"task $1 in $SANDBOX_ID\"; echo \"db $DATABASE_NAME\"; echo finished"));
    const auto run = runner.Start(MakeSandbox(dir.Path()), "refactor", FastOptions());

    std::vector<std::string> lines;
    std::mutex mutex;
    runner.OnOutput(*run, [&](const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    });
    const auto outcome = runner.AwaitOutcome(*run, std::chrono::steady_clock::now() + 10s);

    EXPECT_EQ(outcome.kind, agent::OutcomeKind::kSuccess);
    EXPECT_EQ(outcome.summary, "finished");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"task refactor in sbx-1\n", "db sbx_sbx_1\n", "finished\n"}));
    EXPECT_GT(run->OutputBytes(), 0u);
}

TEST(AgentRunner, NonZeroExitIsFailure) {
    agentyard::testing::TempDir dir;
    agent::AbacusCliRunner runner(agentyard::testing::ShellBackend("echo 'no api key' >&2; exit 2"));
    const auto run = runner.Start(MakeSandbox(dir.Path()), "x", FastOptions());
    runner.OnOutput(*run, [](const std::string&) {});

    const auto outcome = runner.AwaitOutcome(*run, std::chrono::steady_clock::now() + 10s);
    EXPECT_EQ(outcome.kind, agent::OutcomeKind::kFailure);
    EXPECT_EQ(outcome.detail, "exit code 2");
    EXPECT_EQ(outcome.stderr_tail, "no api key\n");
}

TEST(AgentRunner, SilentRunTimesOutAndIsCancelled) {
    agentyard::testing::TempDir dir;
    agent::AbacusCliRunner runner(agentyard::testing::ShellBackend("exec sleep 30"));
    const auto run = runner.Start(MakeSandbox(dir.Path()), "x", FastOptions());
    runner.OnOutput(*run, [](const std::string&) {});

    const auto outcome = runner.AwaitOutcome(*run, std::chrono::steady_clock::now() + 20s);
    EXPECT_EQ(outcome.kind, agent::OutcomeKind::kTimedOut);
    EXPECT_EQ(outcome.detail, "no output or CPU progress for 500ms");
    EXPECT_TRUE(run->Cancelled());
}

TEST(AgentRunner, CancelEndsRunAsCancelled) {
    agentyard::testing::TempDir dir;
    agent::AbacusCliRunner runner(agentyard::testing::ShellBackend("while true; do echo working; sleep 0.05; done"));
    auto options = FastOptions();
    options.idle_timeout = 30s;
    const auto run = runner.Start(MakeSandbox(dir.Path()), "x", options);
    runner.OnOutput(*run, [](const std::string&) {});

    std::thread canceller([&] {
        std::this_thread::sleep_for(200ms);
        runner.Cancel(*run);
    });
    const auto outcome = runner.AwaitOutcome(*run, std::chrono::steady_clock::now() + 20s);
    canceller.join();

    EXPECT_EQ(outcome.kind, agent::OutcomeKind::kCancelled);
    EXPECT_TRUE(run->Cancelled());
}

TEST(AgentRunner, MissingExecutableFailsToStart) {
    agentyard::testing::TempDir dir;
    config::BackendConfig backend{};
    backend.path = (dir.Path() / "missing-cli").string();
    agent::ClaudeCodeRunner runner(backend);

    EXPECT_THROW(runner.Start(MakeSandbox(dir.Path()), "x", FastOptions()), std::runtime_error);
}
