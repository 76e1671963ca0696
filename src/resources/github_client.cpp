#include "resources/github_client.hpp"

#include <memory>
#include <regex>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace agentyard::resources {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl& parsed) {
    const auto scheme_host_port = std::string(parsed.https ? "https://" : "http://") +
        parsed.host + ":" + std::to_string(parsed.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(30);
    client->set_read_timeout(30);
    return client;
}

}  // namespace

std::optional<GitHubRepo> ParseGitHubRepo(const std::string& url) {
    static const std::regex kPattern(
        R"(^(?:https?://(?:[^@/]+@)?github\.com/|git@github\.com:|ssh://git@github\.com/)([^/]+)/([^/]+?)(?:\.git)?/?$)");
    std::smatch match;
    if (!std::regex_match(url, match, kPattern)) {
        return std::nullopt;
    }
    return GitHubRepo{.owner = match[1].str(), .name = match[2].str()};
}

GitHubClient::GitHubClient(std::string token, std::string api_base)
    : token_(std::move(token))
    , api_base_(std::move(api_base)) {}

PullRequestResult GitHubClient::CreatePullRequest(const GitHubRepo& repo,
                                                  const std::string& head,
                                                  const std::string& base,
                                                  const std::string& title,
                                                  const std::string& body) const {
    PullRequestResult result{};
    if (token_.empty()) {
        result.error = "no GitHub token configured";
        return result;
    }

    ParsedUrl parsed{};
    try {
        parsed = ParseUrl(api_base_);
    } catch (const std::exception& ex) {
        result.error = "invalid GitHub API base " + api_base_ + ": " + ex.what();
        return result;
    }
    auto client = MakeClient(parsed);
    const auto endpoint = parsed.base_path + "/repos/" + repo.owner + "/" + repo.name + "/pulls";
    httplib::Headers headers{
        {"Accept", "application/vnd.github+json"},
        {"X-GitHub-Api-Version", "2022-11-28"},
        {"Authorization", "token " + token_}};

    const httplib::Params query{
        {"state", "open"},
        {"head", repo.owner + ":" + head},
        {"base", base}};
    auto existing = client->Get(endpoint, query, headers);
    if (existing && existing->status == 200) {
        const auto list = nlohmann::json::parse(existing->body, nullptr, false);
        if (list.is_array() && !list.empty() && list[0].is_object()) {
            result.ok = true;
            result.url = list[0].value("html_url", "");
            utils::LogInfo("github") << "reusing open pull request " << result.url;
            return result;
        }
    }

    const nlohmann::json payload{
        {"title", title},
        {"head", head},
        {"base", base},
        {"body", body}};
    utils::LogInfo("github") << "POST " << parsed.host << endpoint << " head=" << head << " base=" << base;
    auto response = client->Post(endpoint, headers, payload.dump(), "application/json");
    if (!response) {
        result.error = "request failed (httplib error=" + httplib::to_string(response.error()) + ")";
        return result;
    }
    if (response->status != 201) {
        result.error = "HTTP " + std::to_string(response->status) + ": " + response->body.substr(0, 500);
        return result;
    }
    const auto created = nlohmann::json::parse(response->body, nullptr, false);
    result.ok = true;
    if (created.is_object()) {
        result.url = created.value("html_url", "");
    }
    return result;
}

}  // namespace agentyard::resources
