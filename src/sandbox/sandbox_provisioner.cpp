#include "sandbox/sandbox_provisioner.hpp"

#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace agentyard::sandbox {
namespace {

constexpr core::ResourceKind kAcquireOrder[] = {
    core::ResourceKind::kCredential,
    core::ResourceKind::kDatabaseClone,
    core::ResourceKind::kRepoCheckout};

constexpr core::ResourceKind kReleaseOrder[] = {
    core::ResourceKind::kRepoCheckout,
    core::ResourceKind::kDatabaseClone,
    core::ResourceKind::kCredential};

bool Holds(const Sandbox& sandbox, core::ResourceKind kind) {
    switch (kind) {
        case core::ResourceKind::kCredential: return sandbox.credential.has_value();
        case core::ResourceKind::kDatabaseClone: return sandbox.database.has_value();
        case core::ResourceKind::kRepoCheckout: return sandbox.checkout.has_value();
    }
    return false;
}

}  // namespace

bool TeardownReport::Clean() const {
    for (const auto& release : releases) {
        if (!release.confirmed) {
            return false;
        }
    }
    return true;
}

std::vector<core::TaskWarning> TeardownReport::Warnings() const {
    std::vector<core::TaskWarning> warnings;
    for (const auto& release : releases) {
        if (!release.confirmed) {
            warnings.push_back(core::TaskWarning{
                .kind = core::WarningKind::kTeardown,
                .resource = release.kind,
                .message = release.error});
        }
    }
    return warnings;
}

SandboxProvisioner::SandboxProvisioner(resources::CredentialIssuer& issuer,
                                       resources::SnapshotCloner& cloner,
                                       resources::RepositoryFetcher& fetcher,
                                       ResourceLedger& ledger)
    : issuer_(issuer)
    , cloner_(cloner)
    , fetcher_(fetcher)
    , ledger_(ledger) {}

ProvisionResult SandboxProvisioner::Provision(const ProvisionRequest& request, const StopPredicate& should_stop) {
    Sandbox sandbox{};
    sandbox.id = SandboxIdFor(request.task_id, request.attempt);
    sandbox.task_id = request.task_id;

    for (const auto kind : kAcquireOrder) {
        if (should_stop && should_stop()) {
            utils::LogInfo("sandbox") << sandbox.id << " provisioning stopped before "
                                      << core::ToString(kind);
            ProvisionError error{};
            error.failing_resource = kind;
            error.cause = "provisioning stopped";
            error.stopped = true;
            error.rollback_failures = Rollback(sandbox);
            return ProvisionResult{.error = std::move(error)};
        }

        try {
            switch (kind) {
                case core::ResourceKind::kCredential:
                    sandbox.credential = issuer_.Issue(sandbox.id, request.max_task_duration);
                    ledger_.Record(request.task_id, sandbox.id, kind, *sandbox.credential);
                    break;
                case core::ResourceKind::kDatabaseClone:
                    sandbox.database = cloner_.Clone(request.database_template, sandbox.id);
                    ledger_.Record(request.task_id, sandbox.id, kind, *sandbox.database);
                    break;
                case core::ResourceKind::kRepoCheckout:
                    sandbox.checkout = fetcher_.Checkout(request.repository, sandbox.id);
                    ledger_.Record(request.task_id, sandbox.id, kind, *sandbox.checkout);
                    break;
            }
            sandbox.status = SandboxStatus::kPartiallyProvisioned;
        } catch (const std::exception& ex) {
            utils::LogWarn("sandbox") << sandbox.id << " acquiring " << core::ToString(kind)
                                      << " failed: " << ex.what();
            ProvisionError error{};
            error.failing_resource = kind;
            const auto* resource_error = dynamic_cast<const core::ResourceError*>(&ex);
            error.cause = resource_error ? resource_error->Cause() : std::string(ex.what());
            error.rollback_failures = Rollback(sandbox);
            return ProvisionResult{.error = std::move(error)};
        }
    }

    sandbox.status = SandboxStatus::kReady;
    utils::LogInfo("sandbox") << sandbox.id << " ready";
    return ProvisionResult{.sandbox = std::move(sandbox)};
}

TeardownReport SandboxProvisioner::Teardown(Sandbox& sandbox) {
    TeardownReport report{};
    for (const auto kind : kReleaseOrder) {
        if (Holds(sandbox, kind)) {
            report.releases.push_back(Release(sandbox, kind));
        }
    }
    sandbox.status = SandboxStatus::kTornDown;
    if (report.Clean()) {
        utils::LogInfo("sandbox") << sandbox.id << " torn down";
    } else {
        utils::LogWarn("sandbox") << sandbox.id << " torn down with "
                                  << report.Warnings().size() << " warning(s)";
    }
    return report;
}

std::string SandboxProvisioner::ReleaseEntry(const LedgerEntry& entry) {
    Sandbox sandbox{};
    sandbox.id = entry.sandbox_id;
    sandbox.task_id = entry.task_id;
    try {
        switch (entry.kind) {
            case core::ResourceKind::kCredential:
                sandbox.credential = entry.handle.get<resources::Credential>();
                break;
            case core::ResourceKind::kDatabaseClone:
                sandbox.database = entry.handle.get<resources::DatabaseClone>();
                break;
            case core::ResourceKind::kRepoCheckout:
                sandbox.checkout = entry.handle.get<resources::RepoCheckout>();
                break;
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::string("unreadable ledger handle: ") + ex.what();
    }
    const auto record = Release(sandbox, entry.kind);
    return record.confirmed ? std::string() : record.error;
}

ReleaseRecord SandboxProvisioner::Release(Sandbox& sandbox, core::ResourceKind kind) {
    ReleaseRecord record{};
    record.kind = kind;
    try {
        switch (kind) {
            case core::ResourceKind::kCredential:
                issuer_.Revoke(*sandbox.credential);
                sandbox.credential.reset();
                break;
            case core::ResourceKind::kDatabaseClone:
                cloner_.Destroy(*sandbox.database);
                sandbox.database.reset();
                break;
            case core::ResourceKind::kRepoCheckout:
                fetcher_.Release(*sandbox.checkout);
                sandbox.checkout.reset();
                break;
        }
    } catch (const std::exception& ex) {
        record.error = ex.what();
        utils::LogWarn("sandbox") << sandbox.id << " releasing " << core::ToString(kind)
                                  << " failed: " << record.error;
        try {
            ledger_.MarkFailed(sandbox.id, kind, record.error);
        } catch (const store::StoreError& store_error) {
            utils::LogError("sandbox") << "ledger update failed: " << store_error.what();
        }
        return record;
    }

    // The resource is gone; a stale ledger row only makes reconcile repeat
    // an idempotent release.
    record.confirmed = true;
    try {
        ledger_.Remove(sandbox.id, kind);
    } catch (const store::StoreError& ex) {
        record.ledger_error = ex.what();
        utils::LogError("sandbox") << sandbox.id << " released " << core::ToString(kind)
                                   << " but the ledger kept it: " << record.ledger_error;
    }
    return record;
}

std::vector<core::TaskWarning> SandboxProvisioner::Rollback(Sandbox& sandbox) {
    std::vector<core::TaskWarning> failures;
    for (const auto kind : kReleaseOrder) {
        if (!Holds(sandbox, kind)) {
            continue;
        }
        const auto record = Release(sandbox, kind);
        if (!record.confirmed) {
            failures.push_back(core::TaskWarning{
                .kind = core::WarningKind::kTeardown,
                .resource = kind,
                .message = "rollback: " + record.error});
        }
    }
    sandbox.status = sandbox.HasLiveHandles()
        ? SandboxStatus::kPartiallyProvisioned
        : SandboxStatus::kUnprovisioned;
    return failures;
}

}  // namespace agentyard::sandbox
