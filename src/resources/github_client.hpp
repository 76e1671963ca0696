#pragma once

#include <optional>
#include <string>

namespace agentyard::resources {

struct GitHubRepo {
    std::string owner;
    std::string name;
};

struct PullRequestResult {
    bool ok = false;
    std::string url;
    std::string error;
};

// Extracts owner/name from https://github.com/o/r(.git), git@github.com:o/r.git
// or ssh://git@github.com/o/r.git. Non-GitHub URLs yield nullopt.
std::optional<GitHubRepo> ParseGitHubRepo(const std::string& url);

class GitHubClient {
public:
    GitHubClient(std::string token, std::string api_base = "https://api.github.com");

    bool HasToken() const { return !token_.empty(); }

    // Reuses an open pull request for the same head/base pair when one exists.
    PullRequestResult CreatePullRequest(const GitHubRepo& repo,
                                        const std::string& head,
                                        const std::string& base,
                                        const std::string& title,
                                        const std::string& body) const;

private:
    std::string token_;
    std::string api_base_;
};

}  // namespace agentyard::resources
