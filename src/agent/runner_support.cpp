#include "agent/runner_support.hpp"

#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::agent {
namespace {

constexpr std::size_t kStderrTailChars = 2000;

}  // namespace

AgentRun::AgentRun(core::AgentBackend backend, std::unique_ptr<CliProcess> process)
    : backend_(backend)
    , process_(std::move(process))
    , started_at_(utils::Now()) {}

std::unordered_map<std::string, std::string> SandboxEnvironment(const sandbox::Sandbox& sandbox) {
    std::unordered_map<std::string, std::string> env{
        {"SANDBOX_ID", sandbox.id},
        {"TASK_ID", sandbox.task_id}};
    if (sandbox.credential) {
        env["AGENTYARD_TLS_CERT"] = sandbox.credential->cert_path;
        env["AGENTYARD_TLS_KEY"] = sandbox.credential->key_path;
    }
    if (sandbox.database) {
        env["DATABASE_NAME"] = sandbox.database->name;
    }
    if (sandbox.checkout) {
        env["AGENTYARD_WORKSPACE"] = sandbox.checkout->path;
    }
    return env;
}

CommandLine MakeCommandLine(const config::BackendConfig& backend,
                            std::vector<std::string> args,
                            const sandbox::Sandbox& sandbox) {
    CommandLine command{};
    command.working_dir = sandbox.checkout ? sandbox.checkout->path : std::string();
    command.env = SandboxEnvironment(sandbox);
    if (backend.ssh_host.empty()) {
        command.executable = backend.path;
        command.args = std::move(args);
        return command;
    }

    // Remote: the checkout path is expected on the remote host as well.
    std::ostringstream remote;
    if (!command.working_dir.empty()) {
        remote << "cd " << utils::ShellQuote(command.working_dir) << " && ";
    }
    remote << "env";
    for (const auto& [key, value] : command.env) {
        remote << " " << key << "=" << utils::ShellQuote(value);
    }
    remote << " " << utils::ShellQuote(backend.path);
    for (const auto& arg : args) {
        remote << " " << utils::ShellQuote(arg);
    }
    const auto target = backend.ssh_user.empty() ? backend.ssh_host : backend.ssh_user + "@" + backend.ssh_host;
    command.executable = "ssh";
    command.args = {
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "LogLevel=ERROR",
        target,
        remote.str()};
    command.working_dir.clear();
    return command;
}

std::shared_ptr<AgentRun> LaunchRun(core::AgentBackend backend,
                                    CommandLine command,
                                    const RunOptions& options) {
    ProcessLimits limits{};
    limits.idle_timeout = options.idle_timeout;
    limits.cancel_grace = options.cancel_grace;
    auto process = std::make_unique<CliProcess>(std::move(command), limits);
    process->Start();
    utils::LogInfo("agent") << core::ToString(backend) << " started pid=" << process->Pid();
    return std::make_shared<AgentRun>(backend, std::move(process));
}

Outcome CollectOutcome(AgentRun& run,
                       std::chrono::steady_clock::time_point deadline,
                       const std::function<std::string(const std::string&)>& summarize) {
    auto& process = run.Process();
    const auto exit = process.Wait(deadline);

    Outcome outcome{};
    outcome.exit_code = exit.exit_code;
    outcome.signal = exit.signal;
    outcome.stderr_tail = utils::Tail(process.StderrTail(), kStderrTailChars);
    switch (exit.reason) {
        case ProcessExit::Reason::kCancelled:
            outcome.kind = OutcomeKind::kCancelled;
            break;
        case ProcessExit::Reason::kIdleTimeout:
            outcome.kind = OutcomeKind::kTimedOut;
            outcome.detail = "no output or CPU progress for " +
                std::to_string(process.Limits().idle_timeout.count()) + "ms";
            break;
        case ProcessExit::Reason::kDeadline:
            outcome.kind = OutcomeKind::kTimedOut;
            outcome.detail = "deadline exceeded";
            break;
        case ProcessExit::Reason::kExited:
            if (exit.exit_code && *exit.exit_code == 0) {
                outcome.kind = OutcomeKind::kSuccess;
                outcome.summary = summarize(process.StdoutTail());
            } else {
                outcome.kind = OutcomeKind::kFailure;
                std::ostringstream detail;
                if (exit.signal) {
                    detail << "killed by signal " << *exit.signal;
                } else if (exit.exit_code) {
                    detail << "exit code " << *exit.exit_code;
                } else {
                    detail << "exit status unavailable";
                }
                outcome.detail = detail.str();
            }
            break;
    }
    utils::LogInfo("agent") << core::ToString(run.Backend()) << " pid=" << run.Pid()
                            << " outcome=" << ToString(outcome.kind)
                            << (outcome.detail.empty() ? "" : " (" + outcome.detail + ")");
    return outcome;
}

std::string LastParagraph(const std::string& text) {
    const auto trimmed = utils::Trim(text);
    if (trimmed.empty()) {
        return {};
    }
    const auto split = trimmed.rfind("\n\n");
    return split == std::string::npos ? trimmed : utils::Trim(trimmed.substr(split + 2));
}

std::string LastLine(const std::string& text) {
    const auto trimmed = utils::Trim(text);
    const auto split = trimmed.rfind('\n');
    return split == std::string::npos ? trimmed : utils::Trim(trimmed.substr(split + 1));
}

}  // namespace agentyard::agent
