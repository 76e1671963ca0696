#include "sandbox/sandbox_provisioner.hpp"

#include <gtest/gtest.h>

#include "test_support.hpp"

using agentyard::core::ResourceKind;
using agentyard::core::WarningKind;
using agentyard::sandbox::ProvisionRequest;
using agentyard::sandbox::ResourceLedger;
using agentyard::sandbox::SandboxProvisioner;
using agentyard::sandbox::SandboxStatus;
using agentyard::store::Database;
using namespace agentyard::testing;

namespace {

class SandboxProvisionerTest : public ::testing::Test {
protected:
    SandboxProvisionerTest()
        : db_(dir_.Path() / "state.db")
        , ledger_(db_)
        , issuer_(log_)
        , cloner_(log_)
        , fetcher_(log_, dir_.Path() / "workspaces")
        , provisioner_(issuer_, cloner_, fetcher_, ledger_) {}

    ProvisionRequest Request() const {
        return ProvisionRequest{
            .task_id = "task-abc",
            .repository = {.url = "https://github.com/acme/app.git", .base_branch = "main"},
            .database_template = "app_template",
            .max_task_duration = std::chrono::seconds(600)};
    }

    TempDir dir_;
    Database db_;
    ResourceLedger ledger_;
    CallLog log_;
    FakeIssuer issuer_;
    FakeCloner cloner_;
    FakeFetcher fetcher_;
    SandboxProvisioner provisioner_;
};

}  // namespace

TEST_F(SandboxProvisionerTest, ProvisionAcquiresInOrderAndTeardownReverses) {
    auto result = provisioner_.Provision(Request());
    ASSERT_TRUE(result.Ok());
    auto& sandbox = *result.sandbox;
    EXPECT_EQ(sandbox.id, "sbx-abc");
    EXPECT_EQ(sandbox.status, SandboxStatus::kReady);
    EXPECT_TRUE(sandbox.credential && sandbox.database && sandbox.checkout);
    EXPECT_EQ(ledger_.EntriesFor("sbx-abc").size(), 3u);

    const auto report = provisioner_.Teardown(sandbox);
    EXPECT_TRUE(report.Clean());
    EXPECT_EQ(sandbox.status, SandboxStatus::kTornDown);
    EXPECT_FALSE(sandbox.HasLiveHandles());
    EXPECT_TRUE(ledger_.Entries().empty());

    EXPECT_EQ(log_.Entries(), (std::vector<std::string>{
        "issue credential sbx-abc",
        "clone database sbx-abc",
        "checkout repository sbx-abc",
        "release repository sbx-abc",
        "destroy database sbx-abc",
        "revoke credential sbx-abc"}));
}

TEST_F(SandboxProvisionerTest, CloneFailureRevokesIssuedCredential) {
    cloner_.fail_clone = true;

    const auto result = provisioner_.Provision(Request());
    ASSERT_FALSE(result.Ok());
    const auto& error = *result.error;
    EXPECT_EQ(error.failing_resource, ResourceKind::kDatabaseClone);
    EXPECT_NE(error.cause.find("app_template"), std::string::npos);
    EXPECT_FALSE(error.stopped);
    EXPECT_TRUE(error.rollback_failures.empty());

    EXPECT_EQ(issuer_.live.load(), 0);
    EXPECT_EQ(fetcher_.live.load(), 0);
    EXPECT_TRUE(ledger_.Entries().empty());
    EXPECT_EQ(log_.Entries(), (std::vector<std::string>{
        "issue credential sbx-abc",
        "revoke credential sbx-abc"}));
}

TEST_F(SandboxProvisionerTest, CheckoutFailureRollsBackInReverseOrder) {
    fetcher_.fail_checkout = true;

    const auto result = provisioner_.Provision(Request());
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.error->failing_resource, ResourceKind::kRepoCheckout);
    EXPECT_EQ(log_.Entries(), (std::vector<std::string>{
        "issue credential sbx-abc",
        "clone database sbx-abc",
        "destroy database sbx-abc",
        "revoke credential sbx-abc"}));
}

TEST_F(SandboxProvisionerTest, FailedRollbackIsReportedAndLeftInLedger) {
    fetcher_.fail_checkout = true;
    cloner_.fail_destroy = true;

    const auto result = provisioner_.Provision(Request());
    ASSERT_FALSE(result.Ok());
    ASSERT_EQ(result.error->rollback_failures.size(), 1u);
    const auto& warning = result.error->rollback_failures.front();
    EXPECT_EQ(warning.kind, WarningKind::kTeardown);
    EXPECT_EQ(warning.resource, ResourceKind::kDatabaseClone);
    EXPECT_EQ(warning.message.rfind("rollback: ", 0), 0u);

    // The credential is still revoked after the clone fails to drop.
    EXPECT_EQ(issuer_.live.load(), 0);
    const auto entries = ledger_.Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.front().kind, ResourceKind::kDatabaseClone);
    EXPECT_FALSE(entries.front().last_error.empty());
}

TEST_F(SandboxProvisionerTest, StopPredicateInterruptsProvisioning) {
    int checks = 0;
    const auto result = provisioner_.Provision(Request(), [&checks] { return ++checks > 1; });

    ASSERT_FALSE(result.Ok());
    EXPECT_TRUE(result.error->stopped);
    EXPECT_EQ(result.error->failing_resource, ResourceKind::kDatabaseClone);
    EXPECT_EQ(issuer_.live.load(), 0);
    EXPECT_EQ(cloner_.live.load(), 0);
    EXPECT_TRUE(ledger_.Entries().empty());
}

TEST_F(SandboxProvisionerTest, TeardownFailureBecomesWarning) {
    auto result = provisioner_.Provision(Request());
    ASSERT_TRUE(result.Ok());
    fetcher_.fail_release = true;

    const auto report = provisioner_.Teardown(*result.sandbox);
    EXPECT_FALSE(report.Clean());
    const auto warnings = report.Warnings();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings.front().resource, ResourceKind::kRepoCheckout);
    EXPECT_EQ(cloner_.live.load(), 0);
    EXPECT_EQ(issuer_.live.load(), 0);

    const auto entries = ledger_.EntriesFor("sbx-abc");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.front().last_error, "RepoCheckout: directory busy");
}

TEST_F(SandboxProvisionerTest, ReleaseEntryRetriesLeakedHandle) {
    auto result = provisioner_.Provision(Request());
    ASSERT_TRUE(result.Ok());
    cloner_.fail_destroy = true;
    provisioner_.Teardown(*result.sandbox);
    ASSERT_EQ(ledger_.Entries().size(), 1u);

    cloner_.fail_destroy = false;
    EXPECT_EQ(provisioner_.ReleaseEntry(ledger_.Entries().front()), "");
    EXPECT_TRUE(ledger_.Entries().empty());
    EXPECT_EQ(cloner_.live.load(), 0);
}

TEST_F(SandboxProvisionerTest, LedgerFailureDoesNotUnconfirmRelease) {
    auto result = provisioner_.Provision(Request());
    ASSERT_TRUE(result.Ok());
    {
        auto lock = db_.Lock();
        db_.Exec("DROP TABLE resource_ledger;");
    }

    const auto report = provisioner_.Teardown(*result.sandbox);
    EXPECT_TRUE(report.Clean());
    EXPECT_TRUE(report.Warnings().empty());
    ASSERT_EQ(report.releases.size(), 3u);
    for (const auto& release : report.releases) {
        EXPECT_TRUE(release.confirmed);
        EXPECT_TRUE(release.error.empty());
        EXPECT_FALSE(release.ledger_error.empty());
    }
    EXPECT_FALSE(result.sandbox->HasLiveHandles());
    EXPECT_EQ(issuer_.live.load(), 0);
    EXPECT_EQ(cloner_.live.load(), 0);
    EXPECT_EQ(fetcher_.live.load(), 0);
}

TEST_F(SandboxProvisionerTest, LaterAttemptUsesItsOwnSandboxId) {
    auto request = Request();
    request.attempt = 2;
    auto result = provisioner_.Provision(request);
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.sandbox->id, "sbx-abc-2");
    EXPECT_EQ(ledger_.EntriesFor("sbx-abc-2").size(), 3u);
    EXPECT_EQ(ledger_.EntriesForTask("task-abc").size(), 3u);
    EXPECT_TRUE(provisioner_.Teardown(*result.sandbox).Clean());
}
