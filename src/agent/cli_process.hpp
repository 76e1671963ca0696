#pragma once

#include <atomic>
#include <boost/process.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agentyard::agent {

struct CommandLine {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
    std::unordered_map<std::string, std::string> env;
};

struct ProcessLimits {
    // No stdout/stderr bytes and no CPU progress for this long ends the run.
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
    // SIGTERM to SIGKILL escalation delay.
    std::chrono::milliseconds cancel_grace{std::chrono::seconds(5)};
};

struct ProcessExit {
    enum class Reason {
        kExited,
        kIdleTimeout,
        kDeadline,
        kCancelled
    };

    Reason reason = Reason::kExited;
    std::optional<int> exit_code;
    std::optional<int> signal;
};

// One agent CLI child process running in its own process group. stdout is
// delivered to a sink in chunks ending at a newline or at 4 KiB, whichever
// comes first; stderr is kept as a bounded tail. Every byte read on either
// pipe counts as activity for the idle timeout.
class CliProcess {
public:
    using Sink = std::function<void(const std::string&)>;

    CliProcess(CommandLine command, ProcessLimits limits);
    ~CliProcess();

    CliProcess(const CliProcess&) = delete;
    CliProcess& operator=(const CliProcess&) = delete;

    // Throws std::runtime_error when the executable cannot be launched.
    void Start();

    // stdout is not read until a sink is attached.
    void SetSink(Sink sink);

    // Blocks until the process has exited and both pipes are drained. Idle
    // and deadline expiry terminate the process group.
    ProcessExit Wait(std::chrono::steady_clock::time_point deadline);

    // SIGTERM to the process group; SIGKILL follows after the grace period
    // while Wait is running. No chunk reaches the sink once this returns.
    void Terminate();

    int Pid() const { return pid_; }
    bool Cancelled() const;
    std::uint64_t OutputBytes() const { return output_bytes_.load(); }
    std::chrono::steady_clock::time_point LastActivity() const;
    std::string StdoutTail() const;
    std::string StderrTail() const;
    const CommandLine& Command() const { return command_; }
    const ProcessLimits& Limits() const { return limits_; }

private:
    void ReadStdout();
    void ReadStderr();
    // Caller holds mutex_ and has checked that a sink is attached.
    void EmitLocked(const std::string& chunk);
    void TerminateLocked(ProcessExit::Reason reason);
    void KillGroup(int sig) const;
    long long CpuTicks() const;
    void JoinReaders();

    CommandLine command_;
    ProcessLimits limits_;
    boost::process::ipstream out_;
    boost::process::ipstream err_;
    int pid_ = -1;
    std::atomic<bool> reaped_{false};

    mutable std::mutex mutex_;
    std::condition_variable sink_cv_;
    Sink sink_;
    bool pipes_closing_ = false;
    bool cancelled_ = false;
    bool killed_ = false;
    std::optional<ProcessExit::Reason> stop_reason_;
    std::chrono::steady_clock::time_point term_sent_at_{};
    std::chrono::steady_clock::time_point last_activity_{};
    long long last_cpu_ticks_ = -1;
    std::string stdout_tail_;
    std::string stderr_tail_;
    std::atomic<std::uint64_t> output_bytes_{0};

    std::thread stdout_thread_;
    std::thread stderr_thread_;
};

}  // namespace agentyard::agent
