#include "exec/command_runner.hpp"

#include <boost/process.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::exec {
namespace bp = boost::process;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

ExecResult CommandRunner::Run(const CommandSpec& spec) {
    ExecResult result{};
    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) + "_" + utils::GenerateId(6);
    const auto stdout_path = std::filesystem::temp_directory_path() / ("agentyard_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("agentyard_stderr_" + stamp + ".log");

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }

    auto exe = spec.argv.front();
    if (exe.find('/') == std::string::npos) {
        const auto resolved = bp::search_path(exe);
        if (resolved.empty()) {
            result.exit_code = 127;
            result.error = "command not found: " + exe;
            return result;
        }
        exe = resolved.string();
    }
    const std::vector<std::string> args(spec.argv.begin() + 1, spec.argv.end());
    const auto working_dir = spec.working_dir.empty()
        ? std::filesystem::current_path().string()
        : spec.working_dir;

    utils::LogDebug("exec") << "run " << utils::Join(spec.argv, " ");

    try {
        bp::child child_process(
            bp::exe = exe,
            bp::args = args,
            env,
            bp::start_dir = working_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
        bool finished = false;
        int status = 0;
        const pid_t pid = child_process.id();
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            const auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < grace_deadline) {
                const auto waited = ::waitpid(pid, &status, WNOHANG);
                if (waited == pid) {
                    finished = true;
                    break;
                }
                if (waited < 0) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadFile(stdout_path);
    result.error += ReadFile(stderr_path);

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

std::string DescribeFailure(const ExecResult& result) {
    std::ostringstream oss;
    if (result.timed_out) {
        oss << "timed out";
    } else {
        oss << "exit=" << result.exit_code;
    }
    const auto error = utils::Trim(utils::Tail(result.error, 500));
    if (!error.empty()) {
        oss << ": " << error;
    }
    return oss.str();
}

}  // namespace agentyard::exec
