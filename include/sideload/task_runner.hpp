#pragma once
/**
 * @page sl-task-runner Sideload Build Task Runner
 * @file task_runner.hpp
 * @brief Run an externally defined build command under a hard timeout.
 *
 * @details
 * PURPOSE
 * -------
 * Builds are whatever the project's task file says they are: a native
 * binary, a shell line, or a package script. The runner turns a BuildTask
 * into an argv, starts it in its own process group with the caller's
 * terminal attached, and guarantees that it is gone when the budget runs out.
 *
 * WHAT THIS DOES
 * --------------
 * - resolve_command():
 *     * Process → command + args, exec'd directly (PATH lookup).
 *     * Shell   → command split on whitespace + args, run via `/bin/sh -c`.
 *     * Script  → `npm run <script>`.
 * - resolve_working_dir(): task cwd (absolute, or joined to the root), else root.
 * - run_process():
 *     * environment = ambient environment with overrides layered on top,
 *     * stdin/stdout/stderr inherited,
 *     * on timeout: SIGTERM to the whole group, SIGKILL `kill_grace` later,
 *     * exec failures are detected through a close-on-exec pipe and reported
 *       as SpawnFailed rather than a mysterious exit 127.
 *
 * OUTCOMES
 * --------
 *   Success         exit status 0
 *   FailedExitCode  non-zero exit status (exit_code holds it)
 *   Killed          terminated by a signal we did not send
 *   TimedOut        the monitor stopped it (whatever the final status was)
 *   SpawnFailed     fork/exec/chdir failed, or nothing to run
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Linux/POSIX only (fork, execvpe, process groups).
 * - The monitor polls waitpid() every 20 ms; no SIGCHLD handler is installed.
 */

#include "sideload/project.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sideload {

enum class TaskOutcomeKind { Success, FailedExitCode, Killed, TimedOut, SpawnFailed };

struct TaskOutcome {
    TaskOutcomeKind kind = TaskOutcomeKind::Success;
    int exit_code = 0;       /**< Exit status, or signal number for Killed. */
    std::string message;

    bool ok() const { return kind == TaskOutcomeKind::Success; }
};

const char* to_string(TaskOutcomeKind k);

struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path cwd;                    /**< Empty: inherit. */
    std::map<std::string, std::string> env;       /**< Overrides over the ambient environment. */
};

/// argv for a task; empty when the task names nothing to run.
std::vector<std::string> resolve_command(const BuildTask& task);

std::filesystem::path resolve_working_dir(const BuildTask& task, const std::filesystem::path& root);

/// Run one process to completion or timeout. Never throws.
TaskOutcome run_process(const ProcessSpec& spec,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds kill_grace);

/**
 * @class TaskExecutor
 * @brief Seam for the orchestrator's build stage.
 */
class TaskExecutor {
public:
    virtual ~TaskExecutor() = default;
    virtual TaskOutcome execute(const BuildTask& task,
                                const std::filesystem::path& root,
                                std::chrono::milliseconds timeout) = 0;
};

class BuildTaskRunner : public TaskExecutor {
public:
    explicit BuildTaskRunner(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(5000))
        : kill_grace_(kill_grace) {}

    TaskOutcome execute(const BuildTask& task,
                        const std::filesystem::path& root,
                        std::chrono::milliseconds timeout) override;

private:
    std::chrono::milliseconds kill_grace_;
};

} // namespace sideload
