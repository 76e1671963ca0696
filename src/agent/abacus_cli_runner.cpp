#include "agent/abacus_cli_runner.hpp"

#include "agent/runner_support.hpp"

namespace agentyard::agent {

AbacusCliRunner::AbacusCliRunner(config::BackendConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> AbacusCliRunner::BuildArgs(const std::string& instructions,
                                                    const std::string& model) const {
    std::vector<std::string> args = config_.args;
    const auto& chosen = model.empty() ? config_.model : model;
    if (!chosen.empty() && !config_.model_flag.empty()) {
        args.push_back(config_.model_flag);
        args.push_back(chosen);
    }
    args.push_back(instructions);
    return args;
}

std::string AbacusCliRunner::Summarize(const std::string& output) {
    return LastLine(output);
}

std::shared_ptr<AgentRun> AbacusCliRunner::Start(const sandbox::Sandbox& sandbox,
                                                 const std::string& instructions,
                                                 const RunOptions& options) {
    return LaunchRun(Backend(),
                     MakeCommandLine(config_, BuildArgs(instructions, options.model), sandbox),
                     options);
}

void AbacusCliRunner::OnOutput(AgentRun& run, OutputSink sink) {
    run.Process().SetSink(std::move(sink));
}

Outcome AbacusCliRunner::AwaitOutcome(AgentRun& run, std::chrono::steady_clock::time_point deadline) {
    return CollectOutcome(run, deadline, &AbacusCliRunner::Summarize);
}

void AbacusCliRunner::Cancel(AgentRun& run) {
    run.Process().Terminate();
}

}  // namespace agentyard::agent
