#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agent/runner_registry.hpp"
#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "orchestrator/task_orchestrator.hpp"
#include "orchestrator/task_store.hpp"
#include "resources/git_fetcher.hpp"
#include "resources/github_client.hpp"
#include "resources/local_ca_issuer.hpp"
#include "resources/postgres_cloner.hpp"
#include "results/result_collector.hpp"
#include "sandbox/resource_ledger.hpp"
#include "sandbox/sandbox_provisioner.hpp"
#include "store/database.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  agentyard run --backend claude|codex|abacus --repo URL --template DB\n"
        << "                [--branch BRANCH] [--deadline SECONDS] [--model MODEL] [--publish]\n"
        << "                \"instructions\"\n"
        << "  agentyard status [TASK_ID]\n"
        << "  agentyard logs TASK_ID\n"
        << "  agentyard audit\n"
        << "  agentyard reconcile\n"
        << "  agentyard purge\n"
        << "Options: --config PATH (default ~/.agentyard/config.json)" << std::endl;
}

// Everything one orchestrator instance owns, wired from the loaded config.
struct Runtime {
    explicit Runtime(const agentyard::config::Config& config)
        : db(std::filesystem::path(config.orchestrator.state_dir) / "agentyard.db")
        , issuer(config.credentials.dir, std::chrono::seconds(config.credentials.ttl_s))
        , cloner(agentyard::resources::PostgresClonerOptions{
              .container = config.database.container,
              .user = config.database.user,
              .clone_prefix = config.database.clone_prefix,
              .command_timeout = std::chrono::seconds(config.database.command_timeout_s)})
        , fetcher(
              agentyard::resources::GitFetcherOptions{
                  .workspaces_dir = config.repository.workspaces_dir,
                  .branch_prefix = config.repository.branch_prefix,
                  .author_name = config.repository.author_name,
                  .author_email = config.repository.author_email,
                  .command_timeout = std::chrono::seconds(config.repository.command_timeout_s)},
              agentyard::resources::GitHubClient(config.repository.github_token,
                                                 config.repository.github_api_base))
        , ledger(db)
        , provisioner(issuer, cloner, fetcher, ledger)
        , registry(agentyard::agent::RunnerRegistry::FromConfig(config.agents))
        , collector(db, static_cast<std::size_t>(std::max(1, config.orchestrator.output_window_chunks)))
        , store(db)
        , orchestrator(config.orchestrator, registry, provisioner, ledger, collector, store) {}

    agentyard::store::Database db;
    agentyard::resources::LocalCaCredentialIssuer issuer;
    agentyard::resources::PostgresSnapshotCloner cloner;
    agentyard::resources::GitRepositoryFetcher fetcher;
    agentyard::sandbox::ResourceLedger ledger;
    agentyard::sandbox::SandboxProvisioner provisioner;
    agentyard::agent::RunnerRegistry registry;
    agentyard::results::ResultCollector collector;
    agentyard::orchestrator::TaskStore store;
    agentyard::orchestrator::TaskOrchestrator orchestrator;
};

struct RunArgs {
    agentyard::core::TaskDescriptor descriptor;
    bool ok = false;
};

RunArgs ParseRunArgs(const std::vector<std::string>& args) {
    RunArgs parsed{};
    auto& descriptor = parsed.descriptor;
    bool have_backend = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool has_value = i + 1 < args.size();
        if (arg == "--backend" && has_value) {
            const auto backend = agentyard::core::ParseBackend(args[++i]);
            if (!backend) {
                std::cout << "Unknown backend: " << args[i] << std::endl;
                return parsed;
            }
            descriptor.backend = *backend;
            have_backend = true;
        } else if (arg == "--repo" && has_value) {
            descriptor.repository.url = args[++i];
        } else if (arg == "--branch" && has_value) {
            descriptor.repository.base_branch = args[++i];
        } else if (arg == "--template" && has_value) {
            descriptor.database_template = args[++i];
        } else if (arg == "--deadline" && has_value) {
            try {
                descriptor.deadline = std::chrono::seconds(std::stoll(args[++i]));
            } catch (const std::exception&) {
                std::cout << "Invalid deadline: " << args[i] << std::endl;
                return parsed;
            }
        } else if (arg == "--model" && has_value) {
            descriptor.model = args[++i];
        } else if (arg == "--publish") {
            descriptor.publish_changes = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cout << "Unknown option: " << arg << std::endl;
            return parsed;
        } else {
            descriptor.instructions = arg;
        }
    }
    if (!have_backend) {
        std::cout << "--backend is required" << std::endl;
        return parsed;
    }
    parsed.ok = true;
    return parsed;
}

void PrintChunks(agentyard::results::OutputReader& reader, std::chrono::milliseconds timeout) {
    using Status = agentyard::results::OutputReader::Status;
    while (true) {
        auto read = reader.Next(timeout);
        if (read.status != Status::kChunk) {
            return;
        }
        std::cout << read.chunk.data << std::flush;
    }
}

int RunTask(Runtime& runtime, const std::vector<std::string>& args) {
    const auto parsed = ParseRunArgs(args);
    if (!parsed.ok) {
        PrintUsage();
        return 1;
    }

    std::string task_id;
    try {
        task_id = runtime.orchestrator.Submit(parsed.descriptor);
    } catch (const agentyard::core::ValidationError& ex) {
        std::cout << "Rejected: " << ex.what() << std::endl;
        return 1;
    }
    std::cout << "submitted " << task_id << std::endl;

    InstallSignalHandlers();
    runtime.orchestrator.Start();
    auto reader = runtime.orchestrator.StreamOutput(task_id);

    bool cancel_sent = false;
    while (true) {
        if (g_signal != 0 && !cancel_sent) {
            cancel_sent = true;
            const auto ack = runtime.orchestrator.Cancel(task_id);
            std::cout << "cancel " << agentyard::orchestrator::ToString(ack.result)
                      << " (" << agentyard::core::ToString(ack.observed_state) << ")" << std::endl;
        }
        PrintChunks(*reader, std::chrono::milliseconds(200));
        const auto snapshot = runtime.orchestrator.WaitForTerminal(task_id, std::chrono::milliseconds(50));
        if (snapshot && agentyard::core::IsTerminal(snapshot->state)) {
            break;
        }
    }
    PrintChunks(*reader, std::chrono::milliseconds(0));
    runtime.orchestrator.Stop();

    const auto snapshot = runtime.orchestrator.GetStatus(task_id);
    if (!snapshot) {
        return 1;
    }
    nlohmann::json json = *snapshot;
    std::cout << json.dump(2) << std::endl;
    return snapshot->state == agentyard::core::TaskState::kSucceeded ? 0 : 1;
}

int ShowStatus(Runtime& runtime, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const auto snapshot = runtime.orchestrator.GetStatus(args[0]);
        if (!snapshot) {
            std::cout << "task not found: " << args[0] << std::endl;
            return 1;
        }
        nlohmann::json json = *snapshot;
        std::cout << json.dump(2) << std::endl;
        return 0;
    }
    for (const auto& snapshot : runtime.orchestrator.List()) {
        std::cout << snapshot.id << "  " << agentyard::core::ToString(snapshot.state)
                  << "  " << agentyard::core::ToString(snapshot.descriptor.backend)
                  << "  " << snapshot.descriptor.repository.url
                  << (snapshot.warnings.empty() ? "" : "  (warnings)") << std::endl;
    }
    return 0;
}

int ShowLogs(Runtime& runtime, const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    try {
        auto reader = runtime.orchestrator.StreamOutput(args[0]);
        PrintChunks(*reader, std::chrono::milliseconds(0));
    } catch (const agentyard::core::TaskNotFoundError& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

void PrintEntry(const agentyard::sandbox::LedgerEntry& entry) {
    std::cout << entry.task_id << "  " << entry.sandbox_id << "  "
              << agentyard::core::ToString(entry.kind) << "  " << entry.handle.dump();
    if (!entry.last_error.empty()) {
        std::cout << "  last error: " << entry.last_error;
    }
    std::cout << std::endl;
}

int Audit(Runtime& runtime) {
    const auto leaked = runtime.orchestrator.Audit();
    if (leaked.empty()) {
        std::cout << "no leaked resources" << std::endl;
        return 0;
    }
    for (const auto& entry : leaked) {
        PrintEntry(entry);
    }
    return 1;
}

int Reconcile(Runtime& runtime) {
    const auto report = runtime.orchestrator.Reconcile();
    std::cout << "released " << report.released << " resource(s)" << std::endl;
    for (const auto& entry : report.still_leaked) {
        PrintEntry(entry);
    }
    return report.still_leaked.empty() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::optional<std::filesystem::path> config_path;
    for (auto it = args.begin(); it != args.end();) {
        if (*it == "--config" && it + 1 != args.end()) {
            config_path = *(it + 1);
            it = args.erase(it, it + 2);
        } else {
            ++it;
        }
    }

    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    const auto command = args.front();
    args.erase(args.begin());

    const auto config = config_path ? agentyard::config::LoadConfig(*config_path)
                                    : agentyard::config::LoadConfig();
    agentyard::utils::Logger::Configure(agentyard::utils::LogConfig{
        .min_level = agentyard::utils::ParseLogLevel(config.logging.level)});

    try {
        Runtime runtime(config);
        if (command == "run") {
            return RunTask(runtime, args);
        }
        if (command == "status") {
            return ShowStatus(runtime, args);
        }
        if (command == "logs") {
            return ShowLogs(runtime, args);
        }
        if (command == "audit") {
            return Audit(runtime);
        }
        if (command == "reconcile") {
            return Reconcile(runtime);
        }
        if (command == "purge") {
            std::cout << "purged " << runtime.orchestrator.PurgeExpired() << " task(s)" << std::endl;
            return 0;
        }
    } catch (const agentyard::store::StoreError& ex) {
        std::cerr << "[agentyard] state store error: " << ex.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 1;
}
