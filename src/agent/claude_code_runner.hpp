#pragma once

#include "agent/agent_runner.hpp"
#include "config/config_schema.hpp"

namespace agentyard::agent {

class ClaudeCodeRunner : public AgentRunner {
public:
    explicit ClaudeCodeRunner(config::BackendConfig config);

    core::AgentBackend Backend() const override { return core::AgentBackend::kClaudeCode; }

    std::shared_ptr<AgentRun> Start(const sandbox::Sandbox& sandbox,
                                    const std::string& instructions,
                                    const RunOptions& options) override;
    void OnOutput(AgentRun& run, OutputSink sink) override;
    Outcome AwaitOutcome(AgentRun& run, std::chrono::steady_clock::time_point deadline) override;
    void Cancel(AgentRun& run) override;

    std::vector<std::string> BuildArgs(const std::string& instructions, const std::string& model) const;
    static std::string Summarize(const std::string& output);

private:
    config::BackendConfig config_;
};

}  // namespace agentyard::agent
