// ============================================================================
// orchestrator.cpp — implementation for orchestrator.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file orchestrator.cpp
 */

#include "sideload/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>   // deploy race: worker → waiter signal
#include <iterator>
#include <mutex>
#include <system_error>         // non-throwing filesystem calls
#include <thread>               // worker thread, sleep_for for settles

namespace fs = std::filesystem;
namespace sideload {

using std::chrono::milliseconds;
using steady = std::chrono::steady_clock;

// -------- helpers --------

static long long seconds_of(milliseconds d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

static std::string join_labels(const std::vector<BuildTask>& tasks) {
    std::string out;
    for (const auto& t : tasks) {
        if (!out.empty()) out += ", ";
        out += "'" + t.label + "'";
    }
    return out.empty() ? std::string("(none)") : out;
}

static const BuildTask* find_task(const std::vector<BuildTask>& tasks, const std::string& label) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const BuildTask& t) { return t.label == label; });
    return it == tasks.end() ? nullptr : &*it;
}

static ErrorKind kind_or(ErrorKind k, ErrorKind fallback) {
    return k == ErrorKind::None ? fallback : k;
}


// -------- free functions --------

bool build_exists(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir, ec) && fs::exists(dir / "manifest", ec);
}

// ---- validate_build_directory() — collect every missing item
// POLICY: the entry point is only checked when source/ exists, so one root cause is one line.
std::vector<std::string> validate_build_directory(const fs::path& dir) {
    std::vector<std::string> problems;
    std::error_code ec;

    if (!fs::is_regular_file(dir / "manifest", ec))
        problems.push_back("missing manifest");

    if (!fs::is_directory(dir / "source", ec)) {
        problems.push_back("missing source directory");
    } else if (!fs::is_regular_file(dir / "source" / "main.brs", ec)) {
        problems.push_back("missing source/main.brs");
    }
    return problems;
}

bool relocate_artifact(const fs::path& produced, const fs::path& output, std::string& err) {
    std::error_code ec;
    if (!fs::exists(produced, ec)) {
        err = "artifact_missing: " + produced.string();
        return false;
    }

    const fs::path from = fs::absolute(produced, ec).lexically_normal();
    const fs::path to   = fs::absolute(output, ec).lexically_normal();
    if (from == to) return true;
    if (fs::exists(to, ec) && fs::equivalent(from, to, ec)) return true;

    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        err = "copy_failed: " + ec.message();
        return false;
    }
    if (from.parent_path() != to.parent_path()) {
        fs::remove(from, ec);
        if (ec) spdlog::warn("could not remove staged artifact {}: {}", from.string(), ec.message());
    }
    return true;
}


// -------- Orchestrator --------

Orchestrator::Orchestrator(HttpTransport& http,
                           DeployBackend& backend,
                           TaskCatalog& catalog,
                           BuildConfigReader& config,
                           TaskExecutor& tasks,
                           DecisionProvider& decisions,
                           Timings timings)
    : http_(http),
      backend_(backend),
      catalog_(catalog),
      config_(config),
      tasks_(tasks),
      decisions_(decisions),
      timings_(timings) {}

void Orchestrator::settle(milliseconds d, const char* what) {
    if (d.count() <= 0) return;
    spdlog::debug("waiting {} ms after {}", d.count(), what);
    std::this_thread::sleep_for(d);
}

bool Orchestrator::navigate_home(const Device& device, std::vector<std::string>& warnings) {
    HttpRequest req;
    req.method = "POST";
    req.host = device.address;
    req.port = CONTROL_PORT;
    req.target = "/keypress/home";
    req.timeout = timings_.home_timeout;

    auto res = http_.send(req);
    std::string w;
    if (!res.ok) {
        w = "home navigation failed: " + res.error;
    } else if (res.status == 200 || res.status == 202) {
        spdlog::info("device {} returned to home screen", device.address);
        return true;
    } else if (res.status == 403) {
        w = "home navigation refused (HTTP 403): external control is restricted on the device; "
            "set 'Control by mobile apps' to permissive";
    } else {
        w = "home navigation returned HTTP " + std::to_string(res.status);
    }
    spdlog::warn("{}", w);
    warnings.push_back(std::move(w));
    return false;
}

/*
 * build_stage()
 * -------------
 * Order of precedence:
 *   1) --use-existing-build: require a manifest in the build dir, run nothing.
 *   2) no tasks defined:     nothing to choose from, continue.
 *   3) --build-task LABEL:   must exist among all tasks.
 *   4) otherwise the DecisionProvider picks.
 */
StageResult Orchestrator::build_stage(const fs::path& root, const RunOptions& options) {
    const fs::path dir = config_.resolve_build_directory(root);
    const bool exists = build_exists(dir);

    if (options.use_existing_build) {
        if (!exists)
            return StageResult::fatal(ErrorKind::ArtifactMissing,
                                      "no existing build in " + dir.string(),
                                      {"build the project first, or drop --use-existing-build"});
        spdlog::info("using existing build in {}", dir.string());
        return StageResult::success();
    }

    const auto tasks = catalog_.list_tasks(root);
    if (tasks.empty()) {
        spdlog::info("no tasks defined for {}, continuing with {}", root.string(), dir.string());
        return StageResult::success();
    }

    std::vector<BuildTask> build_tasks;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(build_tasks), is_build_like);

    const BuildTask* chosen = nullptr;
    if (!options.build_task.empty()) {
        chosen = find_task(tasks, options.build_task);
        if (!chosen)
            return StageResult::fatal(ErrorKind::ValidationFailed,
                                      "build task not found: '" + options.build_task + "'",
                                      {"available tasks: " + join_labels(tasks)});
    } else {
        auto choice = decisions_.choose_build(build_tasks, tasks, exists);
        switch (choice.kind) {
            case BuildChoiceKind::Skip:
                spdlog::info("build skipped");
                return StageResult::success();
            case BuildChoiceKind::UseExisting:
                if (!exists)
                    return StageResult::fatal(ErrorKind::ArtifactMissing,
                                              "no existing build in " + dir.string());
                spdlog::info("using existing build in {}", dir.string());
                return StageResult::success();
            case BuildChoiceKind::RunTask:
                chosen = find_task(tasks, choice.label);
                if (!chosen)
                    return StageResult::fatal(ErrorKind::ValidationFailed,
                                              "build task not found: '" + choice.label + "'",
                                              {"available tasks: " + join_labels(tasks)});
                break;
        }
    }

    auto outcome = tasks_.execute(*chosen, root, timings_.build_timeout);
    if (!outcome.ok()) {
        std::vector<std::string> hints;
        if (outcome.kind == TaskOutcomeKind::TimedOut) {
            hints.push_back("the build did not finish within " +
                            std::to_string(seconds_of(timings_.build_timeout)) + " s");
            hints.push_back("run it manually, then retry with --skip-build");
        } else {
            hints.push_back("run task '" + chosen->label + "' manually to see its output");
        }
        return StageResult::fatal(ErrorKind::TaskExecutionFailed,
                                  "build task '" + chosen->label + "' " + to_string(outcome.kind) +
                                      (outcome.message.empty() ? "" : ": " + outcome.message),
                                  std::move(hints));
    }

    settle(timings_.build_settle, "build");
    return StageResult::success();
}

/*
 * deploy_with_deadline()
 * ----------------------
 * Worker: backend_.deploy_and_sign(), publishes its result under the mutex.
 * Waiter: sleeps until min(deadline, next heartbeat); each heartbeat that
 *         fires before the deadline logs the elapsed time. The loop exits the
 *         moment the worker signals, which also ends the heartbeat.
 *
 * On timeout the fallback question is asked first, then the worker is
 * cancelled and joined, and only then does package-only start. A worker
 * that succeeded before the join supplies the package instead.
 */
StageResult Orchestrator::deploy_with_deadline(const AuthorizedDevice& device,
                                               const DeployRequest& req,
                                               BackendResult& produced,
                                               RunReport& report) {
    std::mutex m;
    std::condition_variable cv;
    bool finished = false;
    BackendResult worker_result;

    std::thread worker([&] {
        auto r = backend_.deploy_and_sign(device, req);
        {
            std::lock_guard<std::mutex> lk(m);
            worker_result = std::move(r);
            finished = true;
        }
        cv.notify_all();
    });

    const auto start = steady::now();
    const auto deadline = start + req.timeout;
    const auto beat = std::max(timings_.heartbeat, milliseconds(1));
    bool timed_out = false;
    {
        std::unique_lock<std::mutex> lk(m);
        auto next_beat = start + beat;
        while (!finished) {
            if (steady::now() >= deadline) {
                timed_out = true;
                break;
            }
            cv.wait_until(lk, std::min(deadline, next_beat), [&] { return finished; });
            if (finished) break;
            const auto now = steady::now();
            if (now >= next_beat && now < deadline) {
                spdlog::info("still deploying ({}s elapsed)",
                             std::chrono::duration_cast<std::chrono::seconds>(now - start).count());
                next_beat += beat;
            }
        }
    }

    if (!timed_out) {
        worker.join();
        if (!worker_result.ok)
            return StageResult::fatal(kind_or(worker_result.kind, ErrorKind::DeployFailed),
                                      "deploy failed: " + worker_result.message,
                                      {"check that sign_key matches the reference package"});
        produced = std::move(worker_result);
        return StageResult::success();
    }

    const auto budget_s = seconds_of(req.timeout);
    auto timeout = StageResult::recoverable(
        ErrorKind::TransferTimedOut,
        "deployment did not complete within " + std::to_string(budget_s) + " s",
        {"retry with --package-only once the channel is installed"});
    spdlog::warn("{}", timeout.message);

    bool accept = false;
    {
        // cancel and join on every way out of this block, a throwing provider included
        struct StopWorker {
            DeployBackend& backend;
            std::thread& worker;
            ~StopWorker() {
                backend.cancel();
                worker.join();
            }
        } stop{backend_, worker};

        accept = decisions_.confirm_package_fallback(
            timeout.message + "; create the package from the channel already installed on the device?");
    }

    // joined: worker_result is final
    if (worker_result.ok) {
        spdlog::info("transfer finished after the deadline, keeping its package");
        produced = std::move(worker_result);
        return StageResult::success();
    }

    if (!accept) {
        timeout.outcome = StageOutcome::Fatal;
        timeout.message += " and the package-only fallback was declined";
        return timeout;
    }

    report.recovered.push_back(timeout);
    report.fallback_used = true;
    spdlog::info("falling back to package-only");
    produced = backend_.create_package(device, req);
    if (!produced.ok)
        return StageResult::fatal(kind_or(produced.kind, ErrorKind::DeployFailed),
                                  "package-only fallback failed: " + produced.message);
    return StageResult::success();
}

StageResult Orchestrator::deploy_stage(const AuthorizedDevice& device, const DeployRequest& req,
                                       bool package_only, BackendResult& produced, RunReport& report) {
    if (!package_only) return deploy_with_deadline(device, req, produced, report);

    spdlog::info("creating package from the installed channel");
    produced = backend_.create_package(device, req);
    if (!produced.ok)
        return StageResult::fatal(kind_or(produced.kind, ErrorKind::DeployFailed),
                                  "package creation failed: " + produced.message,
                                  {"make sure the channel is installed on the device"});
    return StageResult::success();
}

/*
 * run()
 * -----
 * Straight-line walk through the stages. Each fatal result returns at once
 * with the stage recorded; nothing after it runs (no final home navigation
 * either, the device state is whatever the failure left).
 */
RunReport Orchestrator::run(const Project& project, const AuthorizedDevice& device,
                            const RunOptions& options) {
    RunReport report;
    auto fail = [&](Stage stage, StageResult r) {
        report.ok = false;
        report.failed_stage = stage;
        report.failure = std::move(r);
        spdlog::error("{} failed ({}): {}", to_string(stage), to_string(report.failure.kind),
                      report.failure.message);
        return report;
    };

    spdlog::info("deploying '{}' to {}", project.name, describe(device.device));
    const fs::path root(project.root_dir);
    const fs::path output(project.output);
    std::error_code ec;

    // HomeNavigation
    if (navigate_home(device.device, report.warnings)) settle(timings_.home_settle, "home navigation");

    // BuildDecision
    if (options.skip_build) {
        spdlog::info("build skipped (--skip-build)");
    } else if (auto r = build_stage(root, options); !r.ok()) {
        return fail(Stage::BuildDecision, std::move(r));
    }

    // ConfigResolve
    const fs::path build_dir = config_.resolve_build_directory(root);
    spdlog::info("build directory: {}", build_dir.string());

    // Validate
    if (auto problems = validate_build_directory(build_dir); !problems.empty())
        return fail(Stage::Validate,
                    StageResult::fatal(ErrorKind::ValidationFailed,
                                       "build directory " + build_dir.string() + " is incomplete",
                                       std::move(problems)));

    // PackageCheck
    if (!fs::exists(project.sign_package, ec))
        return fail(Stage::PackageCheck,
                    StageResult::fatal(ErrorKind::ValidationFailed,
                                       "reference package not found: " + project.sign_package,
                                       {"update it with `sideload edit " + project.name +
                                        " --sign-package <path>`"}));

    // OutputPrep
    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), ec);
        if (ec)
            return fail(Stage::OutputPrep,
                        StageResult::fatal(ErrorKind::IoFailed,
                                           "cannot create " + output.parent_path().string() + ": " +
                                               ec.message()));
    }

    // Rekey
    if (options.skip_rekey) {
        spdlog::info("rekey skipped (--skip-rekey)");
    } else {
        spdlog::info("rekeying device with {}", project.sign_package);
        auto b = backend_.rekey(device, project.sign_key, project.sign_package);
        if (!b.ok)
            return fail(Stage::Rekey,
                        StageResult::fatal(kind_or(b.kind, ErrorKind::DeployFailed),
                                           "rekey failed: " + b.message,
                                           {"check that sign_key belongs to the reference package",
                                            "check the developer password"}));
        settle(timings_.rekey_settle, "rekey");
    }

    // Deploy
    DeployRequest req;
    req.build_dir = build_dir.string();
    req.out_name = output.stem().string();
    if (req.out_name.empty()) req.out_name = project.name;
    req.sign_key = project.sign_key;
    req.timeout = options.skip_build ? timings_.deploy_timeout_skipped_build : timings_.deploy_timeout;

    BackendResult produced;
    if (auto r = deploy_stage(device, req, options.package_only, produced, report); !r.ok())
        return fail(Stage::Deploy, std::move(r));

    // Relocate
    if (std::string err; !relocate_artifact(produced.artifact, output, err)) {
        const bool missing = err.rfind("artifact_missing", 0) == 0;
        return fail(Stage::Relocate,
                    StageResult::fatal(missing ? ErrorKind::ArtifactMissing : ErrorKind::IoFailed, err));
    }

    // Finalize
    report.ok = true;
    report.artifact = output.string();
    report.artifact_size = fs::file_size(output, ec);
    if (ec) report.artifact_size = 0;
    spdlog::info("package ready: {} ({} KB)", report.artifact, report.artifact_size / 1024);

    navigate_home(device.device, report.warnings);
    return report;
}

} // namespace sideload
