#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include "agent/agent_runner.hpp"
#include "config/config_schema.hpp"

namespace agentyard::agent {

class RunnerRegistry {
public:
    // Replaces any runner already registered for the same backend.
    void Register(std::unique_ptr<AgentRunner> runner);
    AgentRunner* Get(core::AgentBackend backend) const;
    bool Has(core::AgentBackend backend) const;
    std::vector<core::AgentBackend> List() const;

    // Claude Code, Codex CLI and Abacus CLI from the agents section.
    static RunnerRegistry FromConfig(const config::AgentsConfig& agents);

private:
    std::unordered_map<core::AgentBackend, std::unique_ptr<AgentRunner>> runners_;
};

}  // namespace agentyard::agent
