#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/task_types.hpp"
#include "resources/credential_issuer.hpp"
#include "resources/repository_fetcher.hpp"
#include "resources/snapshot_cloner.hpp"
#include "sandbox/resource_ledger.hpp"
#include "sandbox/sandbox_types.hpp"

namespace agentyard::sandbox {

struct ProvisionRequest {
    std::string task_id;
    // Each attempt provisions under its own sandbox id.
    int attempt = 1;
    core::RepositoryRef repository;
    std::string database_template;
    // Upper bound for the credential lifetime.
    std::chrono::seconds max_task_duration{3600};
};

struct ProvisionError {
    core::ResourceKind failing_resource = core::ResourceKind::kCredential;
    std::string cause;
    // Set when should_stop interrupted provisioning rather than a leaf failure.
    bool stopped = false;
    std::vector<core::TaskWarning> rollback_failures;
};

struct ProvisionResult {
    std::optional<Sandbox> sandbox;
    std::optional<ProvisionError> error;

    bool Ok() const { return sandbox.has_value(); }
};

struct ReleaseRecord {
    core::ResourceKind kind = core::ResourceKind::kCredential;
    bool confirmed = false;
    std::string error;
    // Set when the release succeeded but its ledger entry could not be removed.
    std::string ledger_error;
};

struct TeardownReport {
    std::vector<ReleaseRecord> releases;

    bool Clean() const;
    std::vector<core::TaskWarning> Warnings() const;
};

// Acquires credential, database clone and repository checkout as a unit.
// Acquisition runs in that order and rollback/teardown in the reverse one.
class SandboxProvisioner {
public:
    using StopPredicate = std::function<bool()>;

    SandboxProvisioner(resources::CredentialIssuer& issuer,
                       resources::SnapshotCloner& cloner,
                       resources::RepositoryFetcher& fetcher,
                       ResourceLedger& ledger);

    // should_stop is consulted before each acquisition. An in-flight leaf
    // call is never interrupted.
    ProvisionResult Provision(const ProvisionRequest& request, const StopPredicate& should_stop = {});

    // Best-effort, never throws for leaf failures. Releases that fail stay in
    // the ledger for `agentyard reconcile`.
    TeardownReport Teardown(Sandbox& sandbox);

    // Retries the release of a leaked ledger entry. Returns the error text, empty on success.
    std::string ReleaseEntry(const LedgerEntry& entry);

    resources::RepositoryFetcher& Fetcher() { return fetcher_; }

private:
    ReleaseRecord Release(Sandbox& sandbox, core::ResourceKind kind);
    std::vector<core::TaskWarning> Rollback(Sandbox& sandbox);

    resources::CredentialIssuer& issuer_;
    resources::SnapshotCloner& cloner_;
    resources::RepositoryFetcher& fetcher_;
    ResourceLedger& ledger_;
};

}  // namespace agentyard::sandbox
