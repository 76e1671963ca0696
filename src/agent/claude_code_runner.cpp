#include "agent/claude_code_runner.hpp"

#include "agent/runner_support.hpp"
#include "utils/common.hpp"

namespace agentyard::agent {

ClaudeCodeRunner::ClaudeCodeRunner(config::BackendConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> ClaudeCodeRunner::BuildArgs(const std::string& instructions,
                                                     const std::string& model) const {
    std::vector<std::string> args{"-p", instructions};
    if (!config_.allowed_tools.empty()) {
        args.push_back("--allowedTools");
        args.push_back(utils::Join(config_.allowed_tools, ","));
    }
    args.push_back("--dangerously-skip-permissions");
    args.push_back("--output-format");
    args.push_back("text");
    args.insert(args.end(), config_.args.begin(), config_.args.end());
    const auto& chosen = model.empty() ? config_.model : model;
    if (!chosen.empty()) {
        args.push_back(config_.model_flag);
        args.push_back(chosen);
    }
    return args;
}

// The final answer is the last paragraph of the text output.
std::string ClaudeCodeRunner::Summarize(const std::string& output) {
    return LastParagraph(output);
}

std::shared_ptr<AgentRun> ClaudeCodeRunner::Start(const sandbox::Sandbox& sandbox,
                                                  const std::string& instructions,
                                                  const RunOptions& options) {
    return LaunchRun(Backend(),
                     MakeCommandLine(config_, BuildArgs(instructions, options.model), sandbox),
                     options);
}

void ClaudeCodeRunner::OnOutput(AgentRun& run, OutputSink sink) {
    run.Process().SetSink(std::move(sink));
}

Outcome ClaudeCodeRunner::AwaitOutcome(AgentRun& run, std::chrono::steady_clock::time_point deadline) {
    return CollectOutcome(run, deadline, &ClaudeCodeRunner::Summarize);
}

void ClaudeCodeRunner::Cancel(AgentRun& run) {
    run.Process().Terminate();
}

}  // namespace agentyard::agent
