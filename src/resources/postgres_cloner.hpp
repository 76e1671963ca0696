#pragma once

#include <chrono>
#include <string>

#include "exec/command_runner.hpp"
#include "resources/snapshot_cloner.hpp"

namespace agentyard::resources {

struct PostgresClonerOptions {
    std::string container = "kanban-postgres";
    std::string user = "postgres";
    std::string clone_prefix = "sbx_";
    std::chrono::seconds command_timeout{300};
};

// Clones template databases with CREATE DATABASE ... TEMPLATE inside a
// dockerised Postgres server, one psql invocation per statement.
class PostgresSnapshotCloner : public SnapshotCloner {
public:
    explicit PostgresSnapshotCloner(PostgresClonerOptions options,
                                    exec::CommandExecutor executor = exec::DefaultExecutor());

    DatabaseClone Clone(const std::string& template_name, const std::string& sandbox_id) override;
    void Destroy(const DatabaseClone& clone) override;

    // "sbx-1a2b" -> "sbx_sbx_1a2b" for the default prefix.
    std::string CloneName(const std::string& sandbox_id) const;

    static bool IsValidIdentifier(const std::string& name);

private:
    exec::ExecResult Psql(const std::string& sql) const;
    void TerminateConnections(const std::string& database) const;

    PostgresClonerOptions options_;
    exec::CommandExecutor executor_;
};

}  // namespace agentyard::resources
