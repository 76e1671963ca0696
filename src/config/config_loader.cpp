#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace agentyard::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyBackendConfig(BackendConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ApplyString(target.path, source, "path");
    ApplyStringList(target.args, source, "args");
    ApplyString(target.model, source, "model");
    ApplyString(target.model_flag, source, "modelFlag");
    ApplyStringList(target.allowed_tools, source, "allowedTools");
    ApplyString(target.ssh_host, source, "sshHost");
    ApplyString(target.ssh_user, source, "sshUser");
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }

    if (data.contains("orchestrator") && data["orchestrator"].is_object()) {
        const auto& orchestrator = data["orchestrator"];
        ApplyString(config.orchestrator.state_dir, orchestrator, "stateDir");
        ApplyInt(config.orchestrator.max_concurrent_tasks, orchestrator, "maxConcurrentTasks");
        ApplyInt(config.orchestrator.idle_timeout_s, orchestrator, "idleTimeoutS");
        ApplyInt(config.orchestrator.default_deadline_s, orchestrator, "defaultDeadlineS");
        ApplyInt(config.orchestrator.max_task_duration_s, orchestrator, "maxTaskDurationS");
        ApplyInt(config.orchestrator.cancel_grace_s, orchestrator, "cancelGraceS");
        ApplyInt(config.orchestrator.retention_s, orchestrator, "retentionS");
        ApplyInt(config.orchestrator.provision_attempts, orchestrator, "provisionAttempts");
        ApplyInt(config.orchestrator.output_window_chunks, orchestrator, "outputWindowChunks");
        ApplyBool(config.orchestrator.publish_changes, orchestrator, "publishChanges");
    }

    if (data.contains("agents") && data["agents"].is_object()) {
        const auto& agents = data["agents"];
        if (agents.contains("claude")) {
            ApplyBackendConfig(config.agents.claude, agents["claude"]);
        }
        if (agents.contains("codex")) {
            ApplyBackendConfig(config.agents.codex, agents["codex"]);
        }
        if (agents.contains("abacus")) {
            ApplyBackendConfig(config.agents.abacus, agents["abacus"]);
        }
    }

    if (data.contains("credentials") && data["credentials"].is_object()) {
        const auto& credentials = data["credentials"];
        ApplyString(config.credentials.dir, credentials, "dir");
        ApplyInt(config.credentials.ttl_s, credentials, "ttlS");
    }

    if (data.contains("database") && data["database"].is_object()) {
        const auto& database = data["database"];
        ApplyString(config.database.container, database, "container");
        ApplyString(config.database.user, database, "user");
        ApplyString(config.database.clone_prefix, database, "clonePrefix");
        ApplyInt(config.database.command_timeout_s, database, "commandTimeoutS");
    }

    if (data.contains("repository") && data["repository"].is_object()) {
        const auto& repository = data["repository"];
        ApplyString(config.repository.workspaces_dir, repository, "workspacesDir");
        ApplyString(config.repository.branch_prefix, repository, "branchPrefix");
        ApplyString(config.repository.author_name, repository, "authorName");
        ApplyString(config.repository.author_email, repository, "authorEmail");
        ApplyString(config.repository.github_token, repository, "githubToken");
        ApplyString(config.repository.github_api_base, repository, "githubApiBase");
        ApplyInt(config.repository.command_timeout_s, repository, "commandTimeoutS");
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void OverrideInt(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideString(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvironment(Config& config) {
    OverrideString(config.logging.level, "AGENTYARD_LOGGING__LEVEL", "AGENTYARD_LOG_LEVEL");

    OverrideString(config.orchestrator.state_dir,
                   "AGENTYARD_ORCHESTRATOR__STATE_DIR", "AGENTYARD_STATE_DIR");
    OverrideInt(config.orchestrator.max_concurrent_tasks,
                "AGENTYARD_ORCHESTRATOR__MAX_CONCURRENT_TASKS", "AGENTYARD_MAX_AGENT_WORKERS");
    OverrideInt(config.orchestrator.idle_timeout_s,
                "AGENTYARD_ORCHESTRATOR__IDLE_TIMEOUT_S", "AGENTYARD_IDLE_TIMEOUT_S");
    OverrideInt(config.orchestrator.default_deadline_s,
                "AGENTYARD_ORCHESTRATOR__DEFAULT_DEADLINE_S", "AGENTYARD_DEFAULT_DEADLINE_S");
    OverrideInt(config.orchestrator.max_task_duration_s,
                "AGENTYARD_ORCHESTRATOR__MAX_TASK_DURATION_S", "AGENTYARD_MAX_TASK_DURATION_S");
    OverrideInt(config.orchestrator.provision_attempts,
                "AGENTYARD_ORCHESTRATOR__PROVISION_ATTEMPTS", "AGENTYARD_PROVISION_ATTEMPTS");
    const auto publish = GetEnvFallback(
        "AGENTYARD_ORCHESTRATOR__PUBLISH_CHANGES",
        "AGENTYARD_PUBLISH_CHANGES");
    if (!publish.empty()) {
        config.orchestrator.publish_changes = ParseBool(publish);
    }

    OverrideString(config.agents.claude.path, "AGENTYARD_AGENTS__CLAUDE__PATH", "AGENTYARD_CLAUDE_PATH");
    OverrideString(config.agents.codex.path, "AGENTYARD_AGENTS__CODEX__PATH", "AGENTYARD_CODEX_PATH");
    OverrideString(config.agents.abacus.path, "AGENTYARD_AGENTS__ABACUS__PATH", "AGENTYARD_ABACUS_PATH");
    const auto ssh_host = GetEnvFallback("AGENTYARD_AGENTS__SSH_HOST", "AGENTYARD_SSH_HOST");
    if (!ssh_host.empty()) {
        config.agents.claude.ssh_host = ssh_host;
        config.agents.codex.ssh_host = ssh_host;
        config.agents.abacus.ssh_host = ssh_host;
    }
    const auto ssh_user = GetEnvFallback("AGENTYARD_AGENTS__SSH_USER", "AGENTYARD_SSH_USER");
    if (!ssh_user.empty()) {
        config.agents.claude.ssh_user = ssh_user;
        config.agents.codex.ssh_user = ssh_user;
        config.agents.abacus.ssh_user = ssh_user;
    }

    OverrideString(config.credentials.dir, "AGENTYARD_CREDENTIALS__DIR", "AGENTYARD_CREDENTIALS_DIR");
    OverrideInt(config.credentials.ttl_s, "AGENTYARD_CREDENTIALS__TTL_S", "AGENTYARD_CREDENTIAL_TTL_S");
    OverrideString(config.database.container,
                   "AGENTYARD_DATABASE__CONTAINER", "AGENTYARD_POSTGRES_CONTAINER");
    OverrideString(config.repository.workspaces_dir,
                   "AGENTYARD_REPOSITORY__WORKSPACES_DIR", "AGENTYARD_WORKSPACES_DIR");
    OverrideString(config.repository.github_token, "AGENTYARD_REPOSITORY__GITHUB_TOKEN", "GITHUB_TOKEN");
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".agentyard" / "config.json";
}

std::string ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config") << "ignoring " << config_path.string()
                                     << ": " << ex.what();
        }
    }

    ApplyEnvironment(config);

    config.orchestrator.state_dir = ExpandHome(config.orchestrator.state_dir);
    config.credentials.dir = ExpandHome(config.credentials.dir);
    config.repository.workspaces_dir = ExpandHome(config.repository.workspaces_dir);
    for (auto* backend : {&config.agents.claude, &config.agents.codex, &config.agents.abacus}) {
        if (backend->ssh_host.empty()) {
            backend->path = ExpandHome(backend->path);
        }
    }
    return config;
}

}  // namespace agentyard::config
