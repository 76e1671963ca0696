#include "orchestrator/task_store.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::orchestrator {
namespace {

std::optional<TaskSnapshot> ParseSnapshot(const std::string& task_id, const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (!json.is_object()) {
        utils::LogWarn("store") << "unreadable snapshot for " << task_id;
        return std::nullopt;
    }
    try {
        return json.get<TaskSnapshot>();
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("store") << "unreadable snapshot for " << task_id << ": " << ex.what();
        return std::nullopt;
    }
}

}  // namespace

TaskStore::TaskStore(store::Database& db)
    : db_(db) {
    auto lock = db_.Lock();
    db_.Exec("CREATE TABLE IF NOT EXISTS tasks ("
             "task_id TEXT PRIMARY KEY,"
             "state TEXT NOT NULL,"
             "snapshot TEXT NOT NULL,"
             "created_at_ms INTEGER,"
             "finished_at_ms INTEGER,"
             "updated_at_ms INTEGER"
             ");");
    db_.Exec("CREATE INDEX IF NOT EXISTS idx_tasks_state ON tasks(state);");
}

void TaskStore::Save(const TaskSnapshot& snapshot) {
    const nlohmann::json json = snapshot;
    auto lock = db_.Lock();
    store::Statement stmt(db_,
        "INSERT INTO tasks(task_id, state, snapshot, created_at_ms, finished_at_ms, updated_at_ms) "
        "VALUES(?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(task_id) DO UPDATE SET state=excluded.state, snapshot=excluded.snapshot, "
        "finished_at_ms=excluded.finished_at_ms, updated_at_ms=excluded.updated_at_ms;");
    stmt.Bind(1, snapshot.id)
        .Bind(2, std::string(core::ToString(snapshot.state)))
        .Bind(3, json.dump())
        .Bind(4, utils::ToMillis(snapshot.created_at));
    if (snapshot.finished_at) {
        stmt.Bind(5, utils::ToMillis(*snapshot.finished_at));
    } else {
        stmt.BindNull(5);
    }
    stmt.Bind(6, utils::ToMillis(utils::Now()));
    stmt.Step();
}

std::optional<TaskSnapshot> TaskStore::Load(const std::string& task_id) const {
    std::string text;
    {
        auto lock = db_.Lock();
        store::Statement stmt(db_, "SELECT snapshot FROM tasks WHERE task_id = ?;");
        stmt.Bind(1, task_id);
        if (!stmt.Step()) {
            return std::nullopt;
        }
        text = stmt.ColumnText(0);
    }
    return ParseSnapshot(task_id, text);
}

std::vector<TaskSnapshot> TaskStore::LoadAll() const {
    std::vector<std::pair<std::string, std::string>> rows;
    {
        auto lock = db_.Lock();
        store::Statement stmt(db_, "SELECT task_id, snapshot FROM tasks ORDER BY created_at_ms ASC;");
        while (stmt.Step()) {
            rows.emplace_back(stmt.ColumnText(0), stmt.ColumnText(1));
        }
    }
    std::vector<TaskSnapshot> snapshots;
    for (const auto& [task_id, text] : rows) {
        auto snapshot = ParseSnapshot(task_id, text);
        if (snapshot) {
            snapshots.push_back(std::move(*snapshot));
        }
    }
    return snapshots;
}

bool TaskStore::Delete(const std::string& task_id) {
    auto lock = db_.Lock();
    store::Statement stmt(db_, "DELETE FROM tasks WHERE task_id = ?;");
    stmt.Bind(1, task_id);
    stmt.Step();
    return sqlite3_changes(db_.Handle()) > 0;
}

std::vector<TaskSnapshot> TaskStore::RecoverInterrupted(const std::unordered_set<std::string>& owned) {
    std::vector<TaskSnapshot> recovered;
    for (auto& snapshot : LoadAll()) {
        if (core::IsTerminal(snapshot.state) || owned.count(snapshot.id) > 0) {
            continue;
        }
        const auto previous = snapshot.state;
        const auto now = utils::Now();
        snapshot.state = core::TaskState::kFailed;
        snapshot.history.push_back(StateTransition{.state = core::TaskState::kFailed, .at = now});
        snapshot.finished_at = now;
        snapshot.warnings.push_back(core::TaskWarning{
            .kind = core::WarningKind::kInterrupted,
            .resource = std::nullopt,
            .message = std::string("process stopped while task was ") + core::ToString(previous)});
        Save(snapshot);
        utils::LogWarn("store") << snapshot.id << " interrupted in " << core::ToString(previous)
                                << ", marked Failed";
        recovered.push_back(std::move(snapshot));
    }
    return recovered;
}

std::vector<std::string> TaskStore::ListFinishedBefore(std::chrono::system_clock::time_point cutoff) const {
    std::vector<std::string> ids;
    auto lock = db_.Lock();
    store::Statement stmt(db_,
        "SELECT task_id FROM tasks WHERE finished_at_ms IS NOT NULL AND finished_at_ms < ? "
        "ORDER BY finished_at_ms ASC;");
    stmt.Bind(1, utils::ToMillis(cutoff));
    while (stmt.Step()) {
        ids.push_back(stmt.ColumnText(0));
    }
    return ids;
}

}  // namespace agentyard::orchestrator
