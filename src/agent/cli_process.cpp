#include "agent/cli_process.hpp"

#include <boost/process/extend.hpp>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::agent {
namespace bp = boost::process;

namespace {

constexpr std::size_t kTailLimit = 64 * 1024;
constexpr std::size_t kReadBufferBytes = 4096;
// A line longer than this is delivered in pieces.
constexpr std::size_t kMaxChunkBytes = 4096;
constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Puts the child in a new process group so that signals reach its children too.
struct NewProcessGroup : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
    }
};

void AppendTail(std::string& tail, const std::string& text) {
    tail += text;
    if (tail.size() > kTailLimit) {
        tail.erase(0, tail.size() - kTailLimit);
    }
}

std::string ResolveExecutable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return executable;
    }
    const auto resolved = bp::search_path(executable);
    if (resolved.empty()) {
        throw std::runtime_error("command not found: " + executable);
    }
    return resolved.string();
}

}  // namespace

CliProcess::CliProcess(CommandLine command, ProcessLimits limits)
    : command_(std::move(command))
    , limits_(limits) {}

CliProcess::~CliProcess() {
    if (pid_ > 0 && !reaped_.load()) {
        KillGroup(SIGKILL);
        int status = 0;
        ::waitpid(pid_, &status, 0);
        reaped_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pipes_closing_ = true;
    }
    sink_cv_.notify_all();
    JoinReaders();
}

void CliProcess::Start() {
    const auto exe = ResolveExecutable(command_.executable);

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : command_.env) {
        env[key] = value;
    }
    const auto exe_dir = std::filesystem::path(exe).parent_path().string();
    if (!exe_dir.empty()) {
        const auto path = env.count("PATH") ? env["PATH"].to_string() : std::string();
        env["PATH"] = path.empty() ? exe_dir : exe_dir + ":" + path;
    }
    const auto working_dir = command_.working_dir.empty()
        ? std::filesystem::current_path().string()
        : command_.working_dir;

    try {
        bp::child child_process(
            bp::exe = exe,
            bp::args = command_.args,
            env,
            bp::start_dir = working_dir,
            bp::std_in < bp::null,
            bp::std_out > out_,
            bp::std_err > err_,
            NewProcessGroup{});
        pid_ = child_process.id();
        // Reaped with waitpid in Wait().
        child_process.detach();
    } catch (const bp::process_error& ex) {
        throw std::runtime_error("failed to launch " + exe + ": " + ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = std::chrono::steady_clock::now();
    }
    utils::LogDebug("process") << "started pid=" << pid_ << " " << exe;
    stdout_thread_ = std::thread([this] { ReadStdout(); });
    stderr_thread_ = std::thread([this] { ReadStderr(); });
}

void CliProcess::SetSink(Sink sink) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }
    sink_cv_.notify_all();
}

ProcessExit CliProcess::Wait(std::chrono::steady_clock::time_point deadline) {
    ProcessExit result{};
    if (pid_ <= 0) {
        throw std::logic_error("process not started");
    }

    int status = 0;
    bool have_status = false;
    while (!reaped_.load()) {
        const auto waited = ::waitpid(pid_, &status, WNOHANG);
        if (waited == pid_) {
            have_status = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            utils::LogWarn("process") << "waitpid failed for pid=" << pid_ << " errno=" << errno;
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_) {
                if (now >= deadline) {
                    TerminateLocked(ProcessExit::Reason::kDeadline);
                } else {
                    const auto ticks = CpuTicks();
                    if (ticks >= 0 && ticks != last_cpu_ticks_) {
                        last_cpu_ticks_ = ticks;
                        last_activity_ = now;
                    }
                    if (now - last_activity_ >= limits_.idle_timeout) {
                        TerminateLocked(ProcessExit::Reason::kIdleTimeout);
                    }
                }
            } else if (!killed_ && now - term_sent_at_ >= limits_.cancel_grace) {
                utils::LogWarn("process") << "pid=" << pid_ << " ignored SIGTERM, sending SIGKILL";
                KillGroup(SIGKILL);
                killed_ = true;
            }
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    reaped_ = true;
    // Leftover members of the group would keep the pipes open.
    KillGroup(SIGKILL);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pipes_closing_ = true;
    }
    sink_cv_.notify_all();
    JoinReaders();

    if (have_status) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    result.reason = stop_reason_.value_or(ProcessExit::Reason::kExited);
    return result;
}

void CliProcess::Terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    TerminateLocked(ProcessExit::Reason::kCancelled);
}

bool CliProcess::Cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::chrono::steady_clock::time_point CliProcess::LastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

std::string CliProcess::StdoutTail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stdout_tail_;
}

std::string CliProcess::StderrTail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stderr_tail_;
}

void CliProcess::ReadStdout() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        sink_cv_.wait(lock, [this] { return sink_ || cancelled_ || pipes_closing_; });
    }
    const int fd = out_.pipe().native_source();
    char buffer[kReadBufferBytes];
    std::string pending;
    for (;;) {
        const auto count = ::read(fd, buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = std::chrono::steady_clock::now();
        if (cancelled_ || !sink_) {
            pending.clear();
            continue;
        }
        pending.append(buffer, static_cast<std::size_t>(count));
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            EmitLocked(pending.substr(0, newline + 1));
            pending.erase(0, newline + 1);
        }
        if (pending.size() >= kMaxChunkBytes) {
            EmitLocked(pending);
            pending.clear();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending.empty() && !cancelled_ && sink_) {
        EmitLocked(pending);
    }
}

void CliProcess::ReadStderr() {
    const int fd = err_.pipe().native_source();
    char buffer[kReadBufferBytes];
    for (;;) {
        const auto count = ::read(fd, buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = std::chrono::steady_clock::now();
        AppendTail(stderr_tail_, std::string(buffer, static_cast<std::size_t>(count)));
    }
}

void CliProcess::EmitLocked(const std::string& chunk) {
    AppendTail(stdout_tail_, chunk);
    output_bytes_ += chunk.size();
    sink_(chunk);
}

void CliProcess::TerminateLocked(ProcessExit::Reason reason) {
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    stop_reason_ = reason;
    term_sent_at_ = std::chrono::steady_clock::now();
    sink_cv_.notify_all();
    if (pid_ > 0 && !reaped_.load()) {
        utils::LogInfo("process") << "terminating pid=" << pid_ << " reason="
                                  << (reason == ProcessExit::Reason::kCancelled ? "cancel"
                                      : reason == ProcessExit::Reason::kDeadline ? "deadline"
                                      : "idle");
        KillGroup(SIGTERM);
    }
}

void CliProcess::KillGroup(int sig) const {
    if (pid_ <= 0) {
        return;
    }
    if (::kill(-pid_, sig) != 0 && errno == ESRCH && !reaped_.load()) {
        // The child may not have called setpgid yet.
        ::kill(pid_, sig);
    }
}

long long CliProcess::CpuTicks() const {
    std::ifstream input("/proc/" + std::to_string(pid_) + "/stat");
    if (!input.is_open()) {
        return -1;
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    const auto close = content.rfind(')');
    if (close == std::string::npos) {
        return -1;
    }
    std::istringstream fields(content.substr(close + 1));
    std::string field;
    long long utime = 0;
    long long stime = 0;
    // Fields after the command name start at 3 (state); utime is 14, stime 15.
    for (int index = 3; fields >> field; ++index) {
        if (index == 14) {
            utime = std::atoll(field.c_str());
        } else if (index == 15) {
            stime = std::atoll(field.c_str());
            return utime + stime;
        }
    }
    return -1;
}

void CliProcess::JoinReaders() {
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

}  // namespace agentyard::agent
