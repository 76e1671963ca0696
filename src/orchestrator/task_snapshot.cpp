#include "orchestrator/task_snapshot.hpp"

#include "utils/common.hpp"

namespace agentyard::orchestrator {
namespace {

nlohmann::json OptionalTime(const std::optional<std::chrono::system_clock::time_point>& value) {
    return value ? nlohmann::json(utils::ToMillis(*value)) : nlohmann::json();
}

std::optional<std::chrono::system_clock::time_point> ReadOptionalTime(const nlohmann::json& json,
                                                                      const char* key) {
    if (json.contains(key) && json[key].is_number_integer()) {
        return utils::FromMillis(json[key].get<long long>());
    }
    return std::nullopt;
}

nlohmann::json WarningToJson(const core::TaskWarning& warning) {
    nlohmann::json json{
        {"kind", core::ToString(warning.kind)},
        {"message", warning.message}};
    json["resource"] = warning.resource ? nlohmann::json(core::ToString(*warning.resource)) : nlohmann::json();
    return json;
}

core::TaskWarning WarningFromJson(const nlohmann::json& json) {
    core::TaskWarning warning{};
    warning.kind = core::ParseWarningKind(json.value("kind", "")).value_or(core::WarningKind::kTeardown);
    warning.message = json.value("message", "");
    if (json.contains("resource") && json["resource"].is_string()) {
        warning.resource = core::ParseResourceKind(json["resource"].get<std::string>());
    }
    return warning;
}

}  // namespace

bool TaskSnapshot::HasWarning(core::WarningKind kind) const {
    for (const auto& warning : warnings) {
        if (warning.kind == kind) {
            return true;
        }
    }
    return false;
}

const char* ToString(CancelResult result) {
    switch (result) {
        case CancelResult::kAccepted: return "accepted";
        case CancelResult::kAlreadyFinalizing: return "already-finalizing";
        case CancelResult::kAlreadyTerminal: return "already-terminal";
    }
    return "unknown";
}

nlohmann::json DescriptorToJson(const core::TaskDescriptor& descriptor) {
    nlohmann::json json{
        {"backend", core::ToString(descriptor.backend)},
        {"repository_url", descriptor.repository.url},
        {"base_branch", descriptor.repository.base_branch},
        {"database_template", descriptor.database_template},
        {"instructions", descriptor.instructions},
        {"model", descriptor.model}};
    json["deadline_s"] = descriptor.deadline ? nlohmann::json(descriptor.deadline->count()) : nlohmann::json();
    json["publish_changes"] = descriptor.publish_changes
        ? nlohmann::json(*descriptor.publish_changes)
        : nlohmann::json();
    return json;
}

core::TaskDescriptor DescriptorFromJson(const nlohmann::json& json) {
    core::TaskDescriptor descriptor{};
    descriptor.backend = core::ParseBackend(json.value("backend", "")).value_or(core::AgentBackend::kClaudeCode);
    descriptor.repository.url = json.value("repository_url", "");
    descriptor.repository.base_branch = json.value("base_branch", "main");
    descriptor.database_template = json.value("database_template", "");
    descriptor.instructions = json.value("instructions", "");
    descriptor.model = json.value("model", "");
    if (json.contains("deadline_s") && json["deadline_s"].is_number_integer()) {
        descriptor.deadline = std::chrono::seconds(json["deadline_s"].get<long long>());
    }
    if (json.contains("publish_changes") && json["publish_changes"].is_boolean()) {
        descriptor.publish_changes = json["publish_changes"].get<bool>();
    }
    return descriptor;
}

void to_json(nlohmann::json& json, const TaskSnapshot& snapshot) {
    json = nlohmann::json::object();
    json["id"] = snapshot.id;
    json["descriptor"] = DescriptorToJson(snapshot.descriptor);
    json["state"] = core::ToString(snapshot.state);
    json["history"] = nlohmann::json::array();
    for (const auto& transition : snapshot.history) {
        json["history"].push_back({
            {"state", core::ToString(transition.state)},
            {"at_ms", utils::ToMillis(transition.at)},
            {"at", utils::ToIso(transition.at)}});
    }
    json["created_at_ms"] = utils::ToMillis(snapshot.created_at);
    json["started_at_ms"] = OptionalTime(snapshot.started_at);
    json["finished_at_ms"] = OptionalTime(snapshot.finished_at);
    json["sandbox_id"] = snapshot.sandbox_id;
    json["resources"] = nlohmann::json::array();
    for (const auto& resource : snapshot.resources) {
        json["resources"].push_back({
            {"kind", core::ToString(resource.kind)},
            {"id", resource.id},
            {"last_error", resource.last_error}});
    }
    json["warnings"] = nlohmann::json::array();
    for (const auto& warning : snapshot.warnings) {
        json["warnings"].push_back(WarningToJson(warning));
    }
    json["failing_resource"] = snapshot.failing_resource
        ? nlohmann::json(core::ToString(*snapshot.failing_resource))
        : nlohmann::json();
    json["failure_cause"] = snapshot.failure_cause;
    json["outcome"] = snapshot.outcome ? nlohmann::json(*snapshot.outcome) : nlohmann::json();
    if (snapshot.publish) {
        json["publish"] = {
            {"pushed", snapshot.publish->pushed},
            {"commit", snapshot.publish->commit},
            {"pull_request_url", snapshot.publish->pull_request_url},
            {"message", snapshot.publish->message}};
    } else {
        json["publish"] = nullptr;
    }
    json["output_bytes"] = snapshot.output_bytes;
}

void from_json(const nlohmann::json& json, TaskSnapshot& snapshot) {
    snapshot.id = json.value("id", "");
    if (json.contains("descriptor") && json["descriptor"].is_object()) {
        snapshot.descriptor = DescriptorFromJson(json["descriptor"]);
    }
    snapshot.state = core::ParseTaskState(json.value("state", "")).value_or(core::TaskState::kFailed);
    snapshot.history.clear();
    if (json.contains("history") && json["history"].is_array()) {
        for (const auto& entry : json["history"]) {
            const auto state = core::ParseTaskState(entry.value("state", ""));
            if (state) {
                snapshot.history.push_back(StateTransition{
                    .state = *state,
                    .at = utils::FromMillis(entry.value("at_ms", 0LL))});
            }
        }
    }
    snapshot.created_at = utils::FromMillis(json.value("created_at_ms", 0LL));
    snapshot.started_at = ReadOptionalTime(json, "started_at_ms");
    snapshot.finished_at = ReadOptionalTime(json, "finished_at_ms");
    snapshot.sandbox_id = json.value("sandbox_id", "");
    snapshot.resources.clear();
    if (json.contains("resources") && json["resources"].is_array()) {
        for (const auto& entry : json["resources"]) {
            const auto kind = core::ParseResourceKind(entry.value("kind", ""));
            if (kind) {
                snapshot.resources.push_back(ResourceSummary{
                    .kind = *kind,
                    .id = entry.value("id", ""),
                    .last_error = entry.value("last_error", "")});
            }
        }
    }
    snapshot.warnings.clear();
    if (json.contains("warnings") && json["warnings"].is_array()) {
        for (const auto& entry : json["warnings"]) {
            snapshot.warnings.push_back(WarningFromJson(entry));
        }
    }
    snapshot.failing_resource.reset();
    if (json.contains("failing_resource") && json["failing_resource"].is_string()) {
        snapshot.failing_resource = core::ParseResourceKind(json["failing_resource"].get<std::string>());
    }
    snapshot.failure_cause = json.value("failure_cause", "");
    snapshot.outcome.reset();
    if (json.contains("outcome") && json["outcome"].is_object()) {
        snapshot.outcome = json["outcome"].get<agent::Outcome>();
    }
    snapshot.publish.reset();
    if (json.contains("publish") && json["publish"].is_object()) {
        const auto& publish = json["publish"];
        snapshot.publish = resources::PublishResult{
            .pushed = publish.value("pushed", false),
            .commit = publish.value("commit", ""),
            .pull_request_url = publish.value("pull_request_url", ""),
            .message = publish.value("message", "")};
    }
    snapshot.output_bytes = json.value("output_bytes", std::uint64_t{0});
}

}  // namespace agentyard::orchestrator
