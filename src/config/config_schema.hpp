#pragma once

#include <string>
#include <vector>

namespace agentyard::config {

struct LoggingConfig {
    std::string level = "info";
};

struct OrchestratorConfig {
    std::string state_dir = "~/.agentyard";
    int max_concurrent_tasks = 5;
    int idle_timeout_s = 300;
    int default_deadline_s = 900;
    int max_task_duration_s = 3600;
    int cancel_grace_s = 5;
    int retention_s = 24 * 60 * 60;
    int provision_attempts = 1;
    int output_window_chunks = 256;
    bool publish_changes = false;
};

struct BackendConfig {
    std::string path;
    std::vector<std::string> args;
    std::string model;
    std::string model_flag = "--model";
    std::vector<std::string> allowed_tools;
    std::string ssh_host;
    std::string ssh_user;
};

struct AgentsConfig {
    BackendConfig claude{
        "~/.local/bin/claude", {}, "", "--model",
        {"Read", "Write", "Edit", "Glob", "Grep", "Bash"}, "", ""};
    BackendConfig codex{"~/.local/bin/codex", {"exec", "--full-auto"}, "", "--model", {}, "", ""};
    BackendConfig abacus{"~/.local/bin/abacus", {"exec"}, "", "--model", {}, "", ""};
};

struct CredentialsConfig {
    std::string dir = "~/.agentyard/credentials";
    int ttl_s = 3600;
};

struct DatabaseConfig {
    std::string container = "kanban-postgres";
    std::string user = "postgres";
    std::string clone_prefix = "sbx_";
    int command_timeout_s = 300;
};

struct RepositoryConfig {
    std::string workspaces_dir = "~/.agentyard/workspaces";
    std::string branch_prefix = "agent/";
    std::string author_name = "agentyard";
    std::string author_email = "agentyard@localhost";
    std::string github_token;
    std::string github_api_base = "https://api.github.com";
    int command_timeout_s = 300;
};

struct Config {
    LoggingConfig logging;
    OrchestratorConfig orchestrator;
    AgentsConfig agents;
    CredentialsConfig credentials;
    DatabaseConfig database;
    RepositoryConfig repository;
};

}  // namespace agentyard::config
