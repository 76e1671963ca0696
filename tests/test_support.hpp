#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config/config_schema.hpp"
#include "core/errors.hpp"
#include "resources/credential_issuer.hpp"
#include "resources/repository_fetcher.hpp"
#include "resources/snapshot_cloner.hpp"
#include "utils/common.hpp"

namespace agentyard::testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("agentyard-test-" + utils::GenerateId(10));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Records every call in `log` as "<verb> <kind> <sandbox>" so that tests can
// check acquisition and release order across the three fakes.
class CallLog {
public:
    void Add(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<std::string> Entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

class FakeIssuer : public resources::CredentialIssuer {
public:
    explicit FakeIssuer(CallLog& log)
        : log_(log) {}

    resources::Credential Issue(const std::string& sandbox_id, std::chrono::seconds max_ttl) override {
        if (fail_issue) {
            throw core::ResourceError(core::ResourceKind::kCredential, "ca unavailable");
        }
        log_.Add("issue credential " + sandbox_id);
        ++live;
        return resources::Credential{
            .serial = "serial-" + sandbox_id,
            .sandbox_id = sandbox_id,
            .common_name = sandbox_id,
            .cert_path = "/tmp/" + sandbox_id + "/cert.pem",
            .key_path = "/tmp/" + sandbox_id + "/key.pem",
            .expires_at = utils::Now() + max_ttl};
    }

    void Revoke(const resources::Credential& credential) override {
        if (fail_revoke) {
            throw core::ResourceError(core::ResourceKind::kCredential, "revocation list locked");
        }
        log_.Add("revoke credential " + credential.sandbox_id);
        --live;
    }

    std::atomic<bool> fail_issue{false};
    std::atomic<bool> fail_revoke{false};
    std::atomic<int> live{0};

private:
    CallLog& log_;
};

class FakeCloner : public resources::SnapshotCloner {
public:
    explicit FakeCloner(CallLog& log)
        : log_(log) {}

    resources::DatabaseClone Clone(const std::string& template_name, const std::string& sandbox_id) override {
        clone_started = true;
        if (clone_delay.count() > 0) {
            std::this_thread::sleep_for(clone_delay);
        }
        if (fail_clone) {
            throw core::ResourceError(core::ResourceKind::kDatabaseClone,
                                      "template \"" + template_name + "\" does not exist");
        }
        log_.Add("clone database " + sandbox_id);
        ++live;
        return resources::DatabaseClone{
            .name = "sbx_" + sandbox_id,
            .template_name = template_name,
            .sandbox_id = sandbox_id};
    }

    void Destroy(const resources::DatabaseClone& clone) override {
        if (fail_destroy) {
            throw core::ResourceError(core::ResourceKind::kDatabaseClone, "database is being accessed");
        }
        log_.Add("destroy database " + clone.sandbox_id);
        --live;
    }

    std::atomic<bool> fail_clone{false};
    std::atomic<bool> fail_destroy{false};
    std::chrono::milliseconds clone_delay{0};
    std::atomic<bool> clone_started{false};
    std::atomic<int> live{0};

private:
    CallLog& log_;
};

// Checkouts are real empty directories so that agent processes can use them
// as their working directory.
class FakeFetcher : public resources::RepositoryFetcher {
public:
    FakeFetcher(CallLog& log, std::filesystem::path root)
        : log_(log)
        , root_(std::move(root)) {}

    resources::RepoCheckout Checkout(const core::RepositoryRef& repository, const std::string& sandbox_id) override {
        if (fail_checkout || failing_checkouts.fetch_sub(1) > 0) {
            throw core::ResourceError(core::ResourceKind::kRepoCheckout, "remote rejected clone");
        }
        const auto path = root_ / sandbox_id;
        std::filesystem::create_directories(path);
        log_.Add("checkout repository " + sandbox_id);
        ++live;
        return resources::RepoCheckout{
            .path = path.string(),
            .repository_url = repository.url,
            .base_branch = repository.base_branch,
            .work_branch = "agent/" + sandbox_id,
            .sandbox_id = sandbox_id};
    }

    void Release(const resources::RepoCheckout& checkout) override {
        if (fail_release) {
            throw core::ResourceError(core::ResourceKind::kRepoCheckout, "directory busy");
        }
        std::filesystem::remove_all(checkout.path);
        log_.Add("release repository " + checkout.sandbox_id);
        --live;
    }

    resources::PublishResult PublishChanges(const resources::RepoCheckout& checkout, const std::string& title) override {
        log_.Add("publish " + checkout.sandbox_id);
        if (fail_publish) {
            throw core::ResourceError(core::ResourceKind::kRepoCheckout, "push rejected");
        }
        return resources::PublishResult{.pushed = true, .commit = "abc123", .message = title};
    }

    std::atomic<bool> fail_checkout{false};
    // Number of upcoming checkouts that fail before they start succeeding.
    std::atomic<int> failing_checkouts{0};
    std::atomic<bool> fail_release{false};
    std::atomic<bool> fail_publish{false};
    std::atomic<int> live{0};

private:
    CallLog& log_;
    std::filesystem::path root_;
};

// Backend configuration that runs `script` through /bin/sh. The task
// instructions arrive as $1.
inline config::BackendConfig ShellBackend(const std::string& script) {
    config::BackendConfig backend{};
    backend.path = "/bin/sh";
    backend.args = {"-c", script, "agent"};
    backend.model_flag.clear();
    return backend;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::trunc);
    output << content;
}

}  // namespace agentyard::testing
