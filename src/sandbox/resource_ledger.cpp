#include "sandbox/resource_ledger.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::sandbox {

ResourceLedger::ResourceLedger(store::Database& db)
    : db_(db) {
    auto lock = db_.Lock();
    db_.Exec("CREATE TABLE IF NOT EXISTS resource_ledger ("
             "id INTEGER PRIMARY KEY AUTOINCREMENT,"
             "task_id TEXT NOT NULL,"
             "sandbox_id TEXT NOT NULL,"
             "kind TEXT NOT NULL,"
             "handle TEXT NOT NULL,"
             "acquired_at_ms INTEGER NOT NULL,"
             "last_error TEXT,"
             "UNIQUE(sandbox_id, kind)"
             ");");
    db_.Exec("CREATE INDEX IF NOT EXISTS idx_ledger_task ON resource_ledger(task_id);");
}

void ResourceLedger::Record(const std::string& task_id,
                            const std::string& sandbox_id,
                            core::ResourceKind kind,
                            const nlohmann::json& handle) {
    auto lock = db_.Lock();
    store::Statement stmt(db_,
        "INSERT INTO resource_ledger(task_id, sandbox_id, kind, handle, acquired_at_ms, last_error) "
        "VALUES(?, ?, ?, ?, ?, NULL);");
    stmt.Bind(1, task_id)
        .Bind(2, sandbox_id)
        .Bind(3, std::string(core::ToString(kind)))
        .Bind(4, handle.dump())
        .Bind(5, utils::ToMillis(utils::Now()));
    stmt.Step();
    utils::LogDebug("ledger") << "record " << core::ToString(kind) << " sandbox=" << sandbox_id;
}

void ResourceLedger::Remove(const std::string& sandbox_id, core::ResourceKind kind) {
    auto lock = db_.Lock();
    store::Statement stmt(db_, "DELETE FROM resource_ledger WHERE sandbox_id = ? AND kind = ?;");
    stmt.Bind(1, sandbox_id).Bind(2, std::string(core::ToString(kind)));
    stmt.Step();
    utils::LogDebug("ledger") << "remove " << core::ToString(kind) << " sandbox=" << sandbox_id;
}

void ResourceLedger::MarkFailed(const std::string& sandbox_id, core::ResourceKind kind, const std::string& error) {
    auto lock = db_.Lock();
    store::Statement stmt(db_, "UPDATE resource_ledger SET last_error = ? WHERE sandbox_id = ? AND kind = ?;");
    stmt.Bind(1, error).Bind(2, sandbox_id).Bind(3, std::string(core::ToString(kind)));
    stmt.Step();
}

std::vector<LedgerEntry> ResourceLedger::Entries() const {
    return Query("SELECT id, task_id, sandbox_id, kind, handle, acquired_at_ms, last_error "
                 "FROM resource_ledger ORDER BY id ASC;", {});
}

std::vector<LedgerEntry> ResourceLedger::EntriesFor(const std::string& sandbox_id) const {
    return Query("SELECT id, task_id, sandbox_id, kind, handle, acquired_at_ms, last_error "
                 "FROM resource_ledger WHERE sandbox_id = ? ORDER BY id ASC;", sandbox_id);
}

std::vector<LedgerEntry> ResourceLedger::EntriesForTask(const std::string& task_id) const {
    return Query("SELECT id, task_id, sandbox_id, kind, handle, acquired_at_ms, last_error "
                 "FROM resource_ledger WHERE task_id = ? ORDER BY id ASC;", task_id);
}

std::vector<LedgerEntry> ResourceLedger::Audit(
    const std::function<bool(const std::string& task_id)>& is_task_live) const {
    std::vector<LedgerEntry> leaks;
    for (auto& entry : Entries()) {
        if (!is_task_live(entry.task_id)) {
            leaks.push_back(std::move(entry));
        }
    }
    if (!leaks.empty()) {
        utils::LogWarn("ledger") << leaks.size() << " leaked handle(s)";
    }
    return leaks;
}

std::vector<LedgerEntry> ResourceLedger::Query(const std::string& sql, const std::string& param) const {
    std::vector<LedgerEntry> entries;
    auto lock = db_.Lock();
    store::Statement stmt(db_, sql);
    if (!param.empty()) {
        stmt.Bind(1, param);
    }
    while (stmt.Step()) {
        LedgerEntry entry{};
        entry.id = stmt.ColumnInt64(0);
        entry.task_id = stmt.ColumnText(1);
        entry.sandbox_id = stmt.ColumnText(2);
        const auto kind = core::ParseResourceKind(stmt.ColumnText(3));
        if (!kind) {
            utils::LogWarn("ledger") << "skipping entry " << entry.id << " with unknown kind";
            continue;
        }
        entry.kind = *kind;
        entry.handle = nlohmann::json::parse(stmt.ColumnText(4), nullptr, false);
        entry.acquired_at = utils::FromMillis(stmt.ColumnInt64(5));
        entry.last_error = stmt.ColumnText(6);
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace agentyard::sandbox
