#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "agent/outcome.hpp"
#include "core/task_types.hpp"
#include "nlohmann/json.hpp"
#include "resources/resource_handles.hpp"

namespace agentyard::orchestrator {

struct StateTransition {
    core::TaskState state = core::TaskState::kSubmitted;
    std::chrono::system_clock::time_point at{};
};

struct ResourceSummary {
    core::ResourceKind kind = core::ResourceKind::kCredential;
    std::string id;
    std::string last_error;
};

// Point-in-time copy of a task record, as returned by GetStatus and persisted
// by the TaskStore.
struct TaskSnapshot {
    std::string id;
    core::TaskDescriptor descriptor;
    core::TaskState state = core::TaskState::kSubmitted;
    std::vector<StateTransition> history;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::string sandbox_id;
    // Live handles according to the resource ledger.
    std::vector<ResourceSummary> resources;
    std::vector<core::TaskWarning> warnings;
    std::optional<core::ResourceKind> failing_resource;
    std::string failure_cause;
    std::optional<agent::Outcome> outcome;
    std::optional<resources::PublishResult> publish;
    std::uint64_t output_bytes = 0;

    bool HasWarning(core::WarningKind kind) const;
};

enum class CancelResult {
    kAccepted,
    kAlreadyFinalizing,
    kAlreadyTerminal
};

const char* ToString(CancelResult result);

struct CancelAck {
    CancelResult result = CancelResult::kAccepted;
    // State the task was in when the request arrived.
    core::TaskState observed_state = core::TaskState::kSubmitted;

    bool operator==(const CancelAck& other) const {
        return result == other.result && observed_state == other.observed_state;
    }
};

void to_json(nlohmann::json& json, const TaskSnapshot& snapshot);
void from_json(const nlohmann::json& json, TaskSnapshot& snapshot);

nlohmann::json DescriptorToJson(const core::TaskDescriptor& descriptor);
core::TaskDescriptor DescriptorFromJson(const nlohmann::json& json);

}  // namespace agentyard::orchestrator
