#pragma once

#include <string>

#include "core/task_types.hpp"
#include "resources/resource_handles.hpp"

namespace agentyard::resources {

// Checks out a repository on behalf of a sandbox. Failures are reported as
// core::ResourceError with kind kRepoCheckout.
class RepositoryFetcher {
public:
    virtual ~RepositoryFetcher() = default;

    virtual RepoCheckout Checkout(const core::RepositoryRef& repository, const std::string& sandbox_id) = 0;
    virtual void Release(const RepoCheckout& checkout) = 0;
    virtual PublishResult PublishChanges(const RepoCheckout& checkout, const std::string& title) = 0;
};

}  // namespace agentyard::resources
