#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

#include "agent/cli_process.hpp"
#include "agent/outcome.hpp"
#include "core/task_types.hpp"
#include "sandbox/sandbox_types.hpp"

namespace agentyard::agent {

struct RunOptions {
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds cancel_grace{std::chrono::seconds(5)};
    // Overrides the backend's configured model when non-empty.
    std::string model;
};

// A single invocation of an agent CLI inside a sandbox.
class AgentRun {
public:
    AgentRun(core::AgentBackend backend, std::unique_ptr<CliProcess> process);

    core::AgentBackend Backend() const { return backend_; }
    int Pid() const { return process_->Pid(); }
    std::chrono::system_clock::time_point StartedAt() const { return started_at_; }
    std::chrono::steady_clock::time_point LastActivity() const { return process_->LastActivity(); }
    std::uint64_t OutputBytes() const { return process_->OutputBytes(); }
    bool Cancelled() const { return process_->Cancelled(); }

    CliProcess& Process() { return *process_; }

private:
    core::AgentBackend backend_;
    std::unique_ptr<CliProcess> process_;
    std::chrono::system_clock::time_point started_at_;
};

// Uniform contract over the agent CLI backends.
class AgentRunner {
public:
    using OutputSink = CliProcess::Sink;

    virtual ~AgentRunner() = default;

    virtual core::AgentBackend Backend() const = 0;

    // Launches the CLI with the checkout as working directory and the
    // sandbox's credential and database exposed through the environment.
    // Throws std::runtime_error when the process cannot be launched.
    virtual std::shared_ptr<AgentRun> Start(const sandbox::Sandbox& sandbox,
                                            const std::string& instructions,
                                            const RunOptions& options) = 0;

    virtual void OnOutput(AgentRun& run, OutputSink sink) = 0;

    // TimedOut always implies the run was cancelled.
    virtual Outcome AwaitOutcome(AgentRun& run, std::chrono::steady_clock::time_point deadline) = 0;

    virtual void Cancel(AgentRun& run) = 0;
};

}  // namespace agentyard::agent
