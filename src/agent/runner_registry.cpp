#include "agent/runner_registry.hpp"

#include "agent/abacus_cli_runner.hpp"
#include "agent/claude_code_runner.hpp"
#include "agent/codex_cli_runner.hpp"

namespace agentyard::agent {

void RunnerRegistry::Register(std::unique_ptr<AgentRunner> runner) {
    const auto backend = runner->Backend();
    runners_.insert_or_assign(backend, std::move(runner));
}

AgentRunner* RunnerRegistry::Get(core::AgentBackend backend) const {
    auto it = runners_.find(backend);
    if (it == runners_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool RunnerRegistry::Has(core::AgentBackend backend) const {
    return runners_.find(backend) != runners_.end();
}

std::vector<core::AgentBackend> RunnerRegistry::List() const {
    std::vector<core::AgentBackend> backends;
    for (const auto& [backend, runner] : runners_) {
        backends.push_back(backend);
    }
    return backends;
}

RunnerRegistry RunnerRegistry::FromConfig(const config::AgentsConfig& agents) {
    RunnerRegistry registry;
    registry.Register(std::make_unique<ClaudeCodeRunner>(agents.claude));
    registry.Register(std::make_unique<CodexCliRunner>(agents.codex));
    registry.Register(std::make_unique<AbacusCliRunner>(agents.abacus));
    return registry;
}

}  // namespace agentyard::agent
