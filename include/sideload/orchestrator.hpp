#pragma once
/**
 * @page sl-orchestrator Sideload Deployment Orchestrator
 * @file orchestrator.hpp
 * @brief The build → rekey → deploy/sign → relocate state machine.
 *
 * @details
 * PURPOSE
 * -------
 * One call to Orchestrator::run() takes a bound Project and AuthorizedDevice
 * from "device on some screen" to "signed package at the configured output".
 * Each stage either succeeds, absorbs a soft warning, or stops the run with
 * a fatal StageResult the CLI can explain.
 *
 * STAGES
 * ------
 *   HomeNavigation  POST /keypress/home; warnings only; settle after success
 *   BuildDecision   skip / reuse existing / run a task (5 min budget)
 *   ConfigResolve   staging path → declared output → conventional → root
 *   Validate        manifest, source/, source/main.brs (all reported at once)
 *   PackageCheck    reference package must exist
 *   OutputPrep      create the output's parent directory
 *   Rekey           unless skipped; settle after success
 *   Deploy          package-only, or full deploy raced against a timer with
 *                   heartbeats; on timeout ask for the package-only fallback
 *   Relocate        copy to the output if produced elsewhere
 *   Finalize        report path and size; best-effort home navigation
 *
 * TIMEOUT RACE
 * ------------
 * The full deploy runs on a worker thread. The calling thread waits on a
 * condition variable until the worker finishes, the next heartbeat is due,
 * or the deadline passes. When the deadline wins, the timeout is a
 * Recoverable result and the fallback question is asked while the transfer
 * keeps going. Afterwards the transfer is cancelled through
 * DeployBackend::cancel() and joined, so two transfers never talk to the
 * device at once. A transfer that completed in the meantime wins: its
 * package is used and the fallback is not run.
 *
 * EXAMPLE
 * -------
 * @code
 *   sideload::Orchestrator orch(http, backend, catalog, config, runner, decisions);
 *   auto report = orch.run(project, device, opts);
 *   return report.exit_code();
 * @endcode
 */

#include "sideload/collaborators.hpp"
#include "sideload/decisions.hpp"
#include "sideload/deploy_backend.hpp"
#include "sideload/device.hpp"
#include "sideload/project.hpp"
#include "sideload/stage_result.hpp"
#include "sideload/task_runner.hpp"
#include "http_io.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sideload {

struct RunOptions {
    bool skip_build = false;
    bool use_existing_build = false;
    bool skip_rekey = false;
    bool package_only = false;
    std::string build_task;     /**< Pre-selected task label; empty = ask. */
};

/// Every delay and budget of a run; tests shrink these.
struct Timings {
    std::chrono::milliseconds home_timeout{5000};
    std::chrono::milliseconds home_settle{2000};
    std::chrono::milliseconds build_settle{2000};
    std::chrono::milliseconds rekey_settle{5000};
    std::chrono::milliseconds build_timeout{300000};
    std::chrono::milliseconds deploy_timeout{300000};
    std::chrono::milliseconds deploy_timeout_skipped_build{180000};
    std::chrono::milliseconds heartbeat{10000};
};

struct RunReport {
    bool ok = false;
    Stage failed_stage = Stage::Finalize;
    StageResult failure;
    std::string artifact;
    std::uintmax_t artifact_size = 0;
    std::vector<std::string> warnings;
    std::vector<StageResult> recovered;   /**< Recoverable results the run routed around. */
    bool fallback_used = false;

    int exit_code() const { return ok ? 0 : exit_code_for(failure.kind); }
};

/// Build directory holds a manifest.
bool build_exists(const std::filesystem::path& dir);

/// Every missing required item of a build directory; empty when valid.
std::vector<std::string> validate_build_directory(const std::filesystem::path& dir);

/**
 * @brief Move a produced artifact to the configured output.
 *
 * No-op when both name the same file. Otherwise copy (overwrite) and, when
 * the source lives in another directory, remove it.
 */
bool relocate_artifact(const std::filesystem::path& produced,
                       const std::filesystem::path& output,
                       std::string& err);

class Orchestrator {
public:
    Orchestrator(HttpTransport& http,
                 DeployBackend& backend,
                 TaskCatalog& catalog,
                 BuildConfigReader& config,
                 TaskExecutor& tasks,
                 DecisionProvider& decisions,
                 Timings timings = {});

    RunReport run(const Project& project, const AuthorizedDevice& device, const RunOptions& options);

    /// POST /keypress/home. True on 200/202; anything else appends a warning.
    bool navigate_home(const Device& device, std::vector<std::string>& warnings);

private:
    StageResult build_stage(const std::filesystem::path& root, const RunOptions& options);
    StageResult deploy_stage(const AuthorizedDevice& device, const DeployRequest& req,
                             bool package_only, BackendResult& produced, RunReport& report);
    StageResult deploy_with_deadline(const AuthorizedDevice& device, const DeployRequest& req,
                                     BackendResult& produced, RunReport& report);
    void settle(std::chrono::milliseconds d, const char* what);

    HttpTransport& http_;
    DeployBackend& backend_;
    TaskCatalog& catalog_;
    BuildConfigReader& config_;
    TaskExecutor& tasks_;
    DecisionProvider& decisions_;
    Timings timings_;
};

} // namespace sideload
