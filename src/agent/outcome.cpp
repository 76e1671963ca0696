#include "agent/outcome.hpp"

namespace agentyard::agent {

const char* ToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::kSuccess: return "Success";
        case OutcomeKind::kFailure: return "Failure";
        case OutcomeKind::kTimedOut: return "TimedOut";
        case OutcomeKind::kCancelled: return "Cancelled";
    }
    return "Unknown";
}

std::optional<OutcomeKind> ParseOutcomeKind(const std::string& value) {
    for (const auto kind : {OutcomeKind::kSuccess, OutcomeKind::kFailure,
                            OutcomeKind::kTimedOut, OutcomeKind::kCancelled}) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& json, const Outcome& outcome) {
    json = {
        {"kind", ToString(outcome.kind)},
        {"summary", outcome.summary},
        {"stderr_tail", outcome.stderr_tail},
        {"detail", outcome.detail}
    };
    json["exit_code"] = outcome.exit_code ? nlohmann::json(*outcome.exit_code) : nlohmann::json();
    json["signal"] = outcome.signal ? nlohmann::json(*outcome.signal) : nlohmann::json();
}

void from_json(const nlohmann::json& json, Outcome& outcome) {
    outcome.kind = ParseOutcomeKind(json.value("kind", "")).value_or(OutcomeKind::kFailure);
    outcome.summary = json.value("summary", "");
    outcome.stderr_tail = json.value("stderr_tail", "");
    outcome.detail = json.value("detail", "");
    if (json.contains("exit_code") && json["exit_code"].is_number_integer()) {
        outcome.exit_code = json["exit_code"].get<int>();
    }
    if (json.contains("signal") && json["signal"].is_number_integer()) {
        outcome.signal = json["signal"].get<int>();
    }
}

}  // namespace agentyard::agent
