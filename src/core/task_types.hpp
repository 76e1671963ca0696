#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace agentyard::core {

enum class AgentBackend {
    kClaudeCode,
    kCodex,
    kAbacus
};

enum class TaskState {
    kSubmitted,
    kProvisioning,
    kRunning,
    kFinalizing,
    kSucceeded,
    kFailed,
    kCancelled
};

enum class ResourceKind {
    kCredential,
    kDatabaseClone,
    kRepoCheckout
};

enum class WarningKind {
    kTeardown,
    kPublishFailed,
    kInterrupted
};

struct TaskWarning {
    WarningKind kind = WarningKind::kTeardown;
    std::optional<ResourceKind> resource;
    std::string message;
};

struct RepositoryRef {
    std::string url;
    std::string base_branch = "main";
};

struct TaskDescriptor {
    AgentBackend backend = AgentBackend::kClaudeCode;
    RepositoryRef repository;
    std::string database_template;
    std::string instructions;
    std::optional<std::chrono::seconds> deadline;
    std::optional<bool> publish_changes;
    std::string model;
};

const char* ToString(AgentBackend backend);
const char* ToString(TaskState state);
const char* ToString(ResourceKind kind);
const char* ToString(WarningKind kind);

std::optional<AgentBackend> ParseBackend(const std::string& value);
std::optional<TaskState> ParseTaskState(const std::string& value);
std::optional<ResourceKind> ParseResourceKind(const std::string& value);
std::optional<WarningKind> ParseWarningKind(const std::string& value);

inline bool IsTerminal(TaskState state) {
    return state == TaskState::kSucceeded ||
           state == TaskState::kFailed ||
           state == TaskState::kCancelled;
}

// Provisioning or Running: the states bounded by the concurrency limit.
inline bool IsActive(TaskState state) {
    return state == TaskState::kProvisioning || state == TaskState::kRunning;
}

}  // namespace agentyard::core
