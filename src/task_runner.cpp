// ============================================================================
// task_runner.cpp — implementation for task_runner.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file task_runner.cpp
 */

#include "sideload/task_runner.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>        // errno after fork/exec/waitpid
#include <cstring>       // strerror
#include <sstream>       // whitespace tokenizing of shell commands
#include <thread>        // sleep_for in the monitor loop

#include <fcntl.h>       // O_CLOEXEC
#include <signal.h>      // kill, SIGTERM, SIGKILL
#include <sys/types.h>
#include <sys/wait.h>    // waitpid, WIFEXITED...
#include <unistd.h>      // fork, execvpe, pipe2, chdir, setpgid

extern char** environ;

namespace fs = std::filesystem;
namespace sideload {

// ---------------------------------------------------------------------------
// Monitor constants.
// - POLL_MS:    waitpid() cadence; bounds how late a timeout is noticed.
// - EXEC_FAIL:  exit status used by the child when chdir/exec fails.
// ---------------------------------------------------------------------------
static constexpr int POLL_MS   = 20;
static constexpr int EXEC_FAIL = 127;


// -------- helpers --------

static std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string tok;
    while (in >> tok) out.push_back(tok);
    return out;
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) {
        if (!out.empty()) out.push_back(' ');
        out += s;
    }
    return out;
}

/*
 * merged_environment()
 * --------------------
 * Copy `environ`, replacing any variable named in `overrides`, then append
 * the overrides that were not already present. Order of the ambient
 * variables is preserved.
 */
static std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    std::map<std::string, bool> used;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        auto key = kv.substr(0, eq);
        if (auto it = overrides.find(key); it != overrides.end()) {
            out.push_back(key + "=" + it->second);
            used[key] = true;
        } else {
            out.push_back(std::move(kv));
        }
    }
    for (const auto& [k, v] : overrides)
        if (!used.count(k)) out.push_back(k + "=" + v);
    return out;
}

static void signal_group(pid_t pgid, int sig) {
    if (kill(-pgid, sig) != 0 && errno != ESRCH)
        spdlog::debug("kill(-{}, {}) failed: {}", pgid, sig, std::strerror(errno));
}

static TaskOutcome spawn_failed(std::string msg) {
    TaskOutcome o;
    o.kind = TaskOutcomeKind::SpawnFailed;
    o.exit_code = -1;
    o.message = std::move(msg);
    return o;
}


// -------- public API --------

const char* to_string(TaskOutcomeKind k) {
    switch (k) {
        case TaskOutcomeKind::Success:        return "success";
        case TaskOutcomeKind::FailedExitCode: return "failed_exit_code";
        case TaskOutcomeKind::Killed:         return "killed";
        case TaskOutcomeKind::TimedOut:       return "timed_out";
        case TaskOutcomeKind::SpawnFailed:    return "spawn_failed";
    }
    return "unknown";
}

std::vector<std::string> resolve_command(const BuildTask& task) {
    switch (task.kind) {
        case TaskKind::Script:
            if (task.script.empty()) return {};
            return {"npm", "run", task.script};
        case TaskKind::Shell: {
            auto parts = split_ws(task.command);
            if (parts.empty()) return {};
            parts.insert(parts.end(), task.args.begin(), task.args.end());
            return {"/bin/sh", "-c", join(parts)};
        }
        case TaskKind::Process:
            break;
    }
    if (task.command.empty()) return {};
    std::vector<std::string> argv{task.command};
    argv.insert(argv.end(), task.args.begin(), task.args.end());
    return argv;
}

fs::path resolve_working_dir(const BuildTask& task, const fs::path& root) {
    if (task.cwd.empty()) return root;
    fs::path cwd(task.cwd);
    return cwd.is_absolute() ? cwd : root / cwd;
}

/*
 * run_process()
 * -------------
 * Phases:
 *   1) build argv/envp copies (the child must not allocate after fork),
 *   2) fork; child: own process group, chdir, execvpe; report errno on failure,
 *   3) parent: read the exec-status pipe (EOF means exec succeeded),
 *   4) poll waitpid() against the deadline; escalate TERM → KILL on the group,
 *   5) translate the wait status.
 *
 * Policy:
 * - A stop the monitor initiated is TimedOut even if the child then exits 0.
 * - After a timeout the whole group gets a final SIGKILL so grandchildren
 *   that outlived their parent do not linger.
 */
TaskOutcome run_process(const ProcessSpec& spec,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds kill_grace) {
    if (spec.argv.empty()) return spawn_failed("nothing to run");

    // Step 1
    std::vector<std::string> argv_s = spec.argv;
    std::vector<char*> argv;
    for (auto& s : argv_s) argv.push_back(s.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_s = merged_environment(spec.env);
    std::vector<char*> envp;
    for (auto& s : env_s) envp.push_back(s.data());
    envp.push_back(nullptr);

    const std::string cwd = spec.cwd.string();

    int errpipe[2];
    if (pipe2(errpipe, O_CLOEXEC) != 0)
        return spawn_failed(std::string("pipe2: ") + std::strerror(errno));

    // Step 2
    const pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        close(errpipe[0]);
        close(errpipe[1]);
        return spawn_failed(std::string("fork: ") + std::strerror(e));
    }
    if (pid == 0) {
        close(errpipe[0]);
        setpgid(0, 0);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int e = errno;
            ssize_t w = write(errpipe[1], &e, sizeof(e));
            (void)w;
            _exit(EXEC_FAIL);
        }
        execvpe(argv[0], argv.data(), envp.data());
        int e = errno;
        ssize_t w = write(errpipe[1], &e, sizeof(e));
        (void)w;
        _exit(EXEC_FAIL);
    }

    // Both sides set the group so kill(-pid) is valid no matter who runs first.
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        spdlog::debug("setpgid({}) failed: {}", pid, std::strerror(errno));

    // Step 3
    close(errpipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(errpipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(errpipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int st = 0;
        while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        return spawn_failed("cannot start '" + spec.argv.front() + "' in '" + cwd + "': " +
                            std::strerror(child_errno));
    }

    // Step 4
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    clock::time_point kill_at{};
    bool timed_out = false;
    bool killed = false;
    int status = 0;

    for (;;) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            signal_group(pid, SIGKILL);
            return spawn_failed(std::string("waitpid: ") + std::strerror(e));
        }

        const auto now = clock::now();
        if (!timed_out && now >= deadline) {
            timed_out = true;
            kill_at = now + kill_grace;
            spdlog::warn("task pid {} exceeded {} ms, sending SIGTERM", pid, timeout.count());
            signal_group(pid, SIGTERM);
        } else if (timed_out && !killed && now >= kill_at) {
            killed = true;
            spdlog::warn("task pid {} still alive after {} ms grace, sending SIGKILL",
                         pid, kill_grace.count());
            signal_group(pid, SIGKILL);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_MS));
    }

    // Step 5
    TaskOutcome o;
    if (timed_out) {
        signal_group(pid, SIGKILL);
        o.kind = TaskOutcomeKind::TimedOut;
        o.exit_code = -1;
        o.message = "timed out after " + std::to_string(timeout.count()) + " ms";
        return o;
    }
    if (WIFEXITED(status)) {
        o.exit_code = WEXITSTATUS(status);
        if (o.exit_code == 0) {
            o.kind = TaskOutcomeKind::Success;
        } else {
            o.kind = TaskOutcomeKind::FailedExitCode;
            o.message = "exited with code " + std::to_string(o.exit_code);
        }
        return o;
    }
    o.kind = TaskOutcomeKind::Killed;
    o.exit_code = WIFSIGNALED(status) ? WTERMSIG(status) : -1;
    o.message = "terminated by signal " + std::to_string(o.exit_code);
    return o;
}

TaskOutcome BuildTaskRunner::execute(const BuildTask& task,
                                     const fs::path& root,
                                     std::chrono::milliseconds timeout) {
    ProcessSpec spec;
    spec.argv = resolve_command(task);
    if (spec.argv.empty()) return spawn_failed("task '" + task.label + "' has no command");
    spec.cwd = resolve_working_dir(task, root);
    spec.env = task.env;

    spdlog::info("running task '{}': {} (cwd {})", task.label, join(spec.argv), spec.cwd.string());
    auto outcome = run_process(spec, timeout, kill_grace_);
    spdlog::info("task '{}' finished: {}{}{}", task.label, to_string(outcome.kind),
                 outcome.message.empty() ? "" : ", ", outcome.message);
    return outcome;
}

} // namespace sideload
