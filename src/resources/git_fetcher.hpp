#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "exec/command_runner.hpp"
#include "resources/github_client.hpp"
#include "resources/repository_fetcher.hpp"

namespace agentyard::resources {

struct GitFetcherOptions {
    std::filesystem::path workspaces_dir;
    std::string branch_prefix = "agent/";
    std::string author_name = "agentyard";
    std::string author_email = "agentyard@localhost";
    std::chrono::seconds command_timeout{300};
};

// Clones into <workspaces_dir>/<sandbox id> and works on a dedicated branch
// named <branch_prefix><sandbox id>.
class GitRepositoryFetcher : public RepositoryFetcher {
public:
    GitRepositoryFetcher(GitFetcherOptions options,
                         GitHubClient github,
                         exec::CommandExecutor executor = exec::DefaultExecutor());

    RepoCheckout Checkout(const core::RepositoryRef& repository, const std::string& sandbox_id) override;
    void Release(const RepoCheckout& checkout) override;
    PublishResult PublishChanges(const RepoCheckout& checkout, const std::string& title) override;

private:
    exec::ExecResult Git(const std::vector<std::string>& args, const std::string& working_dir) const;
    std::string GitOrThrow(const std::vector<std::string>& args,
                           const std::string& working_dir,
                           const std::string& what) const;

    GitFetcherOptions options_;
    GitHubClient github_;
    exec::CommandExecutor executor_;
};

}  // namespace agentyard::resources
