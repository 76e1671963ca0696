#include "resources/postgres_cloner.hpp"

#include <cctype>
#include <regex>

#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace agentyard::resources {
namespace {

// Postgres truncates identifiers beyond this length.
constexpr std::size_t kMaxIdentifierLength = 63;

}  // namespace

PostgresSnapshotCloner::PostgresSnapshotCloner(PostgresClonerOptions options, exec::CommandExecutor executor)
    : options_(std::move(options))
    , executor_(std::move(executor)) {}

bool PostgresSnapshotCloner::IsValidIdentifier(const std::string& name) {
    static const std::regex kIdentifier("^[A-Za-z_][A-Za-z0-9_]*$");
    return !name.empty() && name.size() <= kMaxIdentifierLength && std::regex_match(name, kIdentifier);
}

std::string PostgresSnapshotCloner::CloneName(const std::string& sandbox_id) const {
    std::string name = options_.clone_prefix;
    for (const char c : sandbox_id) {
        const auto uc = static_cast<unsigned char>(c);
        name.push_back(std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '_');
    }
    return name;
}

DatabaseClone PostgresSnapshotCloner::Clone(const std::string& template_name, const std::string& sandbox_id) {
    if (!IsValidIdentifier(template_name)) {
        throw core::ResourceError(core::ResourceKind::kDatabaseClone,
                                  "invalid template name: " + template_name);
    }
    const auto name = CloneName(sandbox_id);
    if (!IsValidIdentifier(name)) {
        throw core::ResourceError(core::ResourceKind::kDatabaseClone, "invalid clone name: " + name);
    }

    // CREATE DATABASE ... TEMPLATE fails while anyone is connected to the template.
    TerminateConnections(template_name);
    const auto result = Psql("CREATE DATABASE \"" + name + "\" TEMPLATE \"" + template_name + "\"");
    if (!result.Ok()) {
        throw core::ResourceError(core::ResourceKind::kDatabaseClone,
                                  "create " + name + " from " + template_name + " failed: " +
                                  exec::DescribeFailure(result));
    }

    utils::LogInfo("database") << "cloned " << template_name << " -> " << name;
    return DatabaseClone{
        .name = name,
        .template_name = template_name,
        .sandbox_id = sandbox_id};
}

void PostgresSnapshotCloner::Destroy(const DatabaseClone& clone) {
    if (!IsValidIdentifier(clone.name)) {
        throw core::ResourceError(core::ResourceKind::kDatabaseClone, "invalid clone name: " + clone.name);
    }
    TerminateConnections(clone.name);
    const auto result = Psql("DROP DATABASE IF EXISTS \"" + clone.name + "\"");
    if (!result.Ok()) {
        throw core::ResourceError(core::ResourceKind::kDatabaseClone,
                                  "drop " + clone.name + " failed: " + exec::DescribeFailure(result));
    }
    utils::LogInfo("database") << "dropped " << clone.name;
}

exec::ExecResult PostgresSnapshotCloner::Psql(const std::string& sql) const {
    exec::CommandSpec spec{};
    spec.argv = {
        "docker", "exec", options_.container,
        "psql", "-U", options_.user, "-d", "postgres",
        "-v", "ON_ERROR_STOP=1", "-c", sql};
    spec.timeout = options_.command_timeout;
    return executor_(spec);
}

void PostgresSnapshotCloner::TerminateConnections(const std::string& database) const {
    const auto result = Psql(
        "SELECT pg_terminate_backend(pid) FROM pg_stat_activity "
        "WHERE datname = '" + database + "' AND pid <> pg_backend_pid()");
    if (!result.Ok()) {
        utils::LogWarn("database") << "terminating connections to " << database
                                   << " failed: " << exec::DescribeFailure(result);
    }
}

}  // namespace agentyard::resources
