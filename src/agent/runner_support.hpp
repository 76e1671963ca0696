#pragma once

#include <string>
#include <vector>

#include "agent/agent_runner.hpp"
#include "config/config_schema.hpp"

namespace agentyard::agent {

// Variables that point the agent at its sandbox: SANDBOX_ID, TASK_ID,
// AGENTYARD_TLS_CERT / AGENTYARD_TLS_KEY, DATABASE_NAME, AGENTYARD_WORKSPACE.
std::unordered_map<std::string, std::string> SandboxEnvironment(const sandbox::Sandbox& sandbox);

// Builds the command line for `path args...` in the sandbox checkout, wrapped
// in ssh when the backend has an ssh host configured.
CommandLine MakeCommandLine(const config::BackendConfig& backend,
                            std::vector<std::string> args,
                            const sandbox::Sandbox& sandbox);

// Launches `command` and wraps it in an AgentRun.
std::shared_ptr<AgentRun> LaunchRun(core::AgentBackend backend,
                                    CommandLine command,
                                    const RunOptions& options);

// Waits for the process and classifies its exit; `summary` is only used for
// a successful exit.
Outcome CollectOutcome(AgentRun& run,
                       std::chrono::steady_clock::time_point deadline,
                       const std::function<std::string(const std::string&)>& summarize);

std::string LastParagraph(const std::string& text);
std::string LastLine(const std::string& text);

}  // namespace agentyard::agent
