#include "resources/git_fetcher.hpp"

#include <regex>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::resources {
namespace {

[[noreturn]] void Fail(const std::string& message) {
    throw core::ResourceError(core::ResourceKind::kRepoCheckout, message);
}

}  // namespace

GitRepositoryFetcher::GitRepositoryFetcher(GitFetcherOptions options,
                                           GitHubClient github,
                                           exec::CommandExecutor executor)
    : options_(std::move(options))
    , github_(std::move(github))
    , executor_(std::move(executor)) {}

RepoCheckout GitRepositoryFetcher::Checkout(const core::RepositoryRef& repository, const std::string& sandbox_id) {
    static const std::regex kSafeName("^[A-Za-z0-9_.-]+$");
    if (!std::regex_match(sandbox_id, kSafeName)) {
        Fail("invalid sandbox id: " + sandbox_id);
    }
    if (repository.url.empty() || repository.url.front() == '-') {
        Fail("invalid repository url: " + repository.url);
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.workspaces_dir, ec);
    if (ec) {
        Fail("cannot create " + options_.workspaces_dir.string() + ": " + ec.message());
    }
    const auto path = options_.workspaces_dir / sandbox_id;
    if (std::filesystem::exists(path)) {
        utils::LogWarn("repo") << "removing stale workspace " << path.string();
        std::filesystem::remove_all(path, ec);
        if (ec) {
            Fail("cannot remove stale workspace " + path.string() + ": " + ec.message());
        }
    }

    const auto base = repository.base_branch.empty() ? std::string("main") : repository.base_branch;
    auto cloned = Git({"clone", "--branch", base, "--", repository.url, path.string()},
                      options_.workspaces_dir.string());
    if (!cloned.Ok()) {
        std::filesystem::remove_all(path, ec);
        Fail("clone " + repository.url + "@" + base + " failed: " + exec::DescribeFailure(cloned));
    }

    const auto work_branch = options_.branch_prefix + sandbox_id;
    auto branched = Git({"checkout", "-b", work_branch}, path.string());
    if (!branched.Ok()) {
        std::filesystem::remove_all(path, ec);
        Fail("creating branch " + work_branch + " failed: " + exec::DescribeFailure(branched));
    }

    utils::LogInfo("repo") << "checked out " << repository.url << "@" << base
                           << " into " << path.string() << " on " << work_branch;
    return RepoCheckout{
        .path = path.string(),
        .repository_url = repository.url,
        .base_branch = base,
        .work_branch = work_branch,
        .sandbox_id = sandbox_id};
}

void GitRepositoryFetcher::Release(const RepoCheckout& checkout) {
    const std::filesystem::path path(checkout.path);
    const auto root = (options_.workspaces_dir / "x").parent_path();
    if (path.empty() || path.lexically_normal().parent_path() != root) {
        Fail("refusing to remove " + checkout.path + " outside " + options_.workspaces_dir.string());
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        Fail("cannot remove " + checkout.path + ": " + ec.message());
    }
    utils::LogInfo("repo") << "released " << checkout.path;
}

PublishResult GitRepositoryFetcher::PublishChanges(const RepoCheckout& checkout, const std::string& title) {
    PublishResult result{};
    GitOrThrow({"add", "-A"}, checkout.path, "staging changes");
    const auto status = GitOrThrow({"status", "--porcelain"}, checkout.path, "reading status");
    if (utils::Trim(status).empty()) {
        result.message = "no changes to publish";
        return result;
    }

    GitOrThrow({"-c", "user.name=" + options_.author_name,
                "-c", "user.email=" + options_.author_email,
                "commit", "-m", title},
               checkout.path, "committing");
    result.commit = utils::Trim(GitOrThrow({"rev-parse", "HEAD"}, checkout.path, "reading HEAD"));
    GitOrThrow({"push", "-u", "origin", checkout.work_branch}, checkout.path, "pushing " + checkout.work_branch);
    result.pushed = true;
    result.message = "pushed " + checkout.work_branch;

    const auto repo = ParseGitHubRepo(checkout.repository_url);
    if (!repo || !github_.HasToken()) {
        return result;
    }
    const auto pr = github_.CreatePullRequest(*repo, checkout.work_branch, checkout.base_branch, title,
                                              "Automated changes from sandbox " + checkout.sandbox_id);
    if (!pr.ok) {
        Fail("pushed " + checkout.work_branch + " but pull request failed: " + pr.error);
    }
    result.pull_request_url = pr.url;
    utils::LogInfo("repo") << "pull request " << pr.url;
    return result;
}

exec::ExecResult GitRepositoryFetcher::Git(const std::vector<std::string>& args,
                                           const std::string& working_dir) const {
    exec::CommandSpec spec{};
    spec.argv.push_back("git");
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.working_dir = working_dir;
    spec.timeout = options_.command_timeout;
    spec.env["GIT_TERMINAL_PROMPT"] = "0";
    return executor_(spec);
}

std::string GitRepositoryFetcher::GitOrThrow(const std::vector<std::string>& args,
                                             const std::string& working_dir,
                                             const std::string& what) const {
    const auto result = Git(args, working_dir);
    if (!result.Ok()) {
        Fail(what + " failed: " + exec::DescribeFailure(result));
    }
    return result.output;
}

}  // namespace agentyard::resources
