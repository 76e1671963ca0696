#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentyard::exec {

struct CommandSpec {
    std::vector<std::string> argv;
    std::string working_dir;
    std::chrono::seconds timeout{60};
    std::unordered_map<std::string, std::string> env;
};

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;

    bool Ok() const { return exit_code == 0 && !timed_out; }
};

// Runs a short-lived helper command (docker exec, git, psql) to completion.
// Agent CLI processes do not go through here; see agent/cli_process.hpp.
class CommandRunner {
public:
    static ExecResult Run(const CommandSpec& spec);
};

// Seam used by the leaf services so tests can script command results.
using CommandExecutor = std::function<ExecResult(const CommandSpec&)>;

inline CommandExecutor DefaultExecutor() {
    return [](const CommandSpec& spec) { return CommandRunner::Run(spec); };
}

// "exit=N" plus the stderr tail, for error messages.
std::string DescribeFailure(const ExecResult& result);

}  // namespace agentyard::exec
