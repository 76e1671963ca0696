#include "agent/codex_cli_runner.hpp"

#include <sstream>

#include "agent/runner_support.hpp"
#include "utils/common.hpp"

namespace agentyard::agent {

CodexCliRunner::CodexCliRunner(config::BackendConfig config)
    : config_(std::move(config)) {}

// Configured args default to `exec --full-auto`; the prompt goes last.
std::vector<std::string> CodexCliRunner::BuildArgs(const std::string& instructions,
                                                   const std::string& model) const {
    std::vector<std::string> args = config_.args;
    const auto& chosen = model.empty() ? config_.model : model;
    if (!chosen.empty()) {
        args.push_back(config_.model_flag);
        args.push_back(chosen);
    }
    args.push_back(instructions);
    return args;
}

// codex exec prints a line reading "codex" before each agent message; the
// summary is the text after the last one.
std::string CodexCliRunner::Summarize(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    std::string after_marker;
    bool seen_marker = false;
    while (std::getline(stream, line)) {
        if (utils::Trim(line) == "codex") {
            seen_marker = true;
            after_marker.clear();
            continue;
        }
        if (seen_marker) {
            after_marker += line;
            after_marker.push_back('\n');
        }
    }
    if (seen_marker) {
        const auto summary = utils::Trim(after_marker);
        if (!summary.empty()) {
            return summary;
        }
    }
    return LastParagraph(output);
}

std::shared_ptr<AgentRun> CodexCliRunner::Start(const sandbox::Sandbox& sandbox,
                                                const std::string& instructions,
                                                const RunOptions& options) {
    return LaunchRun(Backend(),
                     MakeCommandLine(config_, BuildArgs(instructions, options.model), sandbox),
                     options);
}

void CodexCliRunner::OnOutput(AgentRun& run, OutputSink sink) {
    run.Process().SetSink(std::move(sink));
}

Outcome CodexCliRunner::AwaitOutcome(AgentRun& run, std::chrono::steady_clock::time_point deadline) {
    return CollectOutcome(run, deadline, &CodexCliRunner::Summarize);
}

void CodexCliRunner::Cancel(AgentRun& run) {
    run.Process().Terminate();
}

}  // namespace agentyard::agent
