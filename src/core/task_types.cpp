#include "core/task_types.hpp"

namespace agentyard::core {

const char* ToString(AgentBackend backend) {
    switch (backend) {
        case AgentBackend::kClaudeCode: return "claude";
        case AgentBackend::kCodex: return "codex";
        case AgentBackend::kAbacus: return "abacus";
    }
    return "unknown";
}

const char* ToString(TaskState state) {
    switch (state) {
        case TaskState::kSubmitted: return "Submitted";
        case TaskState::kProvisioning: return "Provisioning";
        case TaskState::kRunning: return "Running";
        case TaskState::kFinalizing: return "Finalizing";
        case TaskState::kSucceeded: return "Succeeded";
        case TaskState::kFailed: return "Failed";
        case TaskState::kCancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* ToString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::kCredential: return "Credential";
        case ResourceKind::kDatabaseClone: return "DatabaseClone";
        case ResourceKind::kRepoCheckout: return "RepoCheckout";
    }
    return "Unknown";
}

const char* ToString(WarningKind kind) {
    switch (kind) {
        case WarningKind::kTeardown: return "TeardownWarning";
        case WarningKind::kPublishFailed: return "PublishFailed";
        case WarningKind::kInterrupted: return "Interrupted";
    }
    return "Unknown";
}

std::optional<AgentBackend> ParseBackend(const std::string& value) {
    if (value == "claude" || value == "claude-code") {
        return AgentBackend::kClaudeCode;
    }
    if (value == "codex") {
        return AgentBackend::kCodex;
    }
    if (value == "abacus") {
        return AgentBackend::kAbacus;
    }
    return std::nullopt;
}

std::optional<TaskState> ParseTaskState(const std::string& value) {
    for (const auto state : {TaskState::kSubmitted, TaskState::kProvisioning, TaskState::kRunning,
                             TaskState::kFinalizing, TaskState::kSucceeded, TaskState::kFailed,
                             TaskState::kCancelled}) {
        if (value == ToString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<ResourceKind> ParseResourceKind(const std::string& value) {
    for (const auto kind : {ResourceKind::kCredential, ResourceKind::kDatabaseClone,
                            ResourceKind::kRepoCheckout}) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<WarningKind> ParseWarningKind(const std::string& value) {
    for (const auto kind : {WarningKind::kTeardown, WarningKind::kPublishFailed,
                            WarningKind::kInterrupted}) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace agentyard::core
