#include "resources/resource_handles.hpp"

#include "utils/common.hpp"

namespace agentyard::resources {

void to_json(nlohmann::json& json, const Credential& credential) {
    json = {
        {"serial", credential.serial},
        {"sandbox_id", credential.sandbox_id},
        {"common_name", credential.common_name},
        {"cert_path", credential.cert_path},
        {"key_path", credential.key_path},
        {"expires_at_ms", utils::ToMillis(credential.expires_at)}
    };
}

void from_json(const nlohmann::json& json, Credential& credential) {
    credential.serial = json.value("serial", "");
    credential.sandbox_id = json.value("sandbox_id", "");
    credential.common_name = json.value("common_name", "");
    credential.cert_path = json.value("cert_path", "");
    credential.key_path = json.value("key_path", "");
    credential.expires_at = utils::FromMillis(json.value("expires_at_ms", 0LL));
}

void to_json(nlohmann::json& json, const DatabaseClone& clone) {
    json = {
        {"name", clone.name},
        {"template_name", clone.template_name},
        {"sandbox_id", clone.sandbox_id}
    };
}

void from_json(const nlohmann::json& json, DatabaseClone& clone) {
    clone.name = json.value("name", "");
    clone.template_name = json.value("template_name", "");
    clone.sandbox_id = json.value("sandbox_id", "");
}

void to_json(nlohmann::json& json, const RepoCheckout& checkout) {
    json = {
        {"path", checkout.path},
        {"repository_url", checkout.repository_url},
        {"base_branch", checkout.base_branch},
        {"work_branch", checkout.work_branch},
        {"sandbox_id", checkout.sandbox_id}
    };
}

void from_json(const nlohmann::json& json, RepoCheckout& checkout) {
    checkout.path = json.value("path", "");
    checkout.repository_url = json.value("repository_url", "");
    checkout.base_branch = json.value("base_branch", "");
    checkout.work_branch = json.value("work_branch", "");
    checkout.sandbox_id = json.value("sandbox_id", "");
}

}  // namespace agentyard::resources
