#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace agentyard::agent {

enum class OutcomeKind {
    kSuccess,
    kFailure,
    kTimedOut,
    kCancelled
};

const char* ToString(OutcomeKind kind);
std::optional<OutcomeKind> ParseOutcomeKind(const std::string& value);

struct Outcome {
    OutcomeKind kind = OutcomeKind::kFailure;
    std::string summary;
    std::optional<int> exit_code;
    std::optional<int> signal;
    std::string stderr_tail;
    // Which limit fired for kTimedOut; launch errors for kFailure.
    std::string detail;
};

void to_json(nlohmann::json& json, const Outcome& outcome);
void from_json(const nlohmann::json& json, Outcome& outcome);

}  // namespace agentyard::agent
