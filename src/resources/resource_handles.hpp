#pragma once

#include <chrono>
#include <string>

#include "nlohmann/json.hpp"

namespace agentyard::resources {

struct Credential {
    std::string serial;
    std::string sandbox_id;
    std::string common_name;
    std::string cert_path;
    std::string key_path;
    std::chrono::system_clock::time_point expires_at{};
};

struct DatabaseClone {
    std::string name;
    std::string template_name;
    std::string sandbox_id;
};

struct RepoCheckout {
    std::string path;
    std::string repository_url;
    std::string base_branch;
    std::string work_branch;
    std::string sandbox_id;
};

struct PublishResult {
    bool pushed = false;
    std::string commit;
    std::string pull_request_url;
    std::string message;
};

void to_json(nlohmann::json& json, const Credential& credential);
void from_json(const nlohmann::json& json, Credential& credential);
void to_json(nlohmann::json& json, const DatabaseClone& clone);
void from_json(const nlohmann::json& json, DatabaseClone& clone);
void to_json(nlohmann::json& json, const RepoCheckout& checkout);
void from_json(const nlohmann::json& json, RepoCheckout& checkout);

}  // namespace agentyard::resources
