#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "core/task_types.hpp"
#include "nlohmann/json.hpp"
#include "store/database.hpp"

namespace agentyard::sandbox {

struct LedgerEntry {
    long long id = 0;
    std::string task_id;
    std::string sandbox_id;
    core::ResourceKind kind = core::ResourceKind::kCredential;
    nlohmann::json handle;
    std::chrono::system_clock::time_point acquired_at{};
    std::string last_error;
};

// Durable record of every live resource handle, keyed by (sandbox, kind).
// An entry exists from the moment an acquisition returns until its release
// is confirmed. Recording a second handle under a key that is still present
// throws store::StoreError instead of replacing the first one.
class ResourceLedger {
public:
    explicit ResourceLedger(store::Database& db);

    void Record(const std::string& task_id,
                const std::string& sandbox_id,
                core::ResourceKind kind,
                const nlohmann::json& handle);
    void Remove(const std::string& sandbox_id, core::ResourceKind kind);
    void MarkFailed(const std::string& sandbox_id, core::ResourceKind kind, const std::string& error);

    std::vector<LedgerEntry> Entries() const;
    std::vector<LedgerEntry> EntriesFor(const std::string& sandbox_id) const;
    std::vector<LedgerEntry> EntriesForTask(const std::string& task_id) const;

    // Entries whose owning task is no longer live are leaks.
    std::vector<LedgerEntry> Audit(const std::function<bool(const std::string& task_id)>& is_task_live) const;

private:
    std::vector<LedgerEntry> Query(const std::string& sql, const std::string& param) const;

    store::Database& db_;
};

}  // namespace agentyard::sandbox
