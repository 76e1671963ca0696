#pragma once

#include <optional>
#include <string>

#include "resources/resource_handles.hpp"

namespace agentyard::sandbox {

enum class SandboxStatus {
    kUnprovisioned,
    kPartiallyProvisioned,
    kReady,
    kTornDown
};

inline const char* ToString(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::kUnprovisioned: return "unprovisioned";
        case SandboxStatus::kPartiallyProvisioned: return "partially-provisioned";
        case SandboxStatus::kReady: return "ready";
        case SandboxStatus::kTornDown: return "torn-down";
    }
    return "unknown";
}

// Isolated environment for one task. The three handles are all present once
// status is kReady; none of them survives a rollback or a teardown unless the
// release failed and a warning was recorded.
struct Sandbox {
    std::string id;
    std::string task_id;
    SandboxStatus status = SandboxStatus::kUnprovisioned;
    std::optional<resources::Credential> credential;
    std::optional<resources::DatabaseClone> database;
    std::optional<resources::RepoCheckout> checkout;

    bool HasLiveHandles() const {
        return credential.has_value() || database.has_value() || checkout.has_value();
    }
};

// "task-0123456789ab" -> "sbx-0123456789ab" for the first provisioning
// attempt, "sbx-0123456789ab-2" for the second one.
inline std::string SandboxIdFor(const std::string& task_id, int attempt = 1) {
    const auto dash = task_id.find('-');
    auto id = "sbx-" + (dash == std::string::npos ? task_id : task_id.substr(dash + 1));
    if (attempt > 1) {
        id += "-" + std::to_string(attempt);
    }
    return id;
}

}  // namespace agentyard::sandbox
