#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "orchestrator/task_snapshot.hpp"
#include "store/database.hpp"

namespace agentyard::orchestrator {

// Durable copy of every task snapshot, rewritten on each state transition.
class TaskStore {
public:
    explicit TaskStore(store::Database& db);

    void Save(const TaskSnapshot& snapshot);
    std::optional<TaskSnapshot> Load(const std::string& task_id) const;
    std::vector<TaskSnapshot> LoadAll() const;
    bool Delete(const std::string& task_id);

    // Marks tasks left in a non-terminal state by a previous process as Failed
    // with an Interrupted warning, and returns them. Ids in `owned` belong to
    // the running process and are left alone.
    std::vector<TaskSnapshot> RecoverInterrupted(const std::unordered_set<std::string>& owned = {});

    // Terminal tasks that finished before `cutoff`.
    std::vector<std::string> ListFinishedBefore(std::chrono::system_clock::time_point cutoff) const;

private:
    store::Database& db_;
};

}  // namespace agentyard::orchestrator
