#include <doctest/doctest.h>
#include "sideload/orchestrator.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

using namespace sideload;
using namespace sideload::testing;
using std::chrono::milliseconds;

namespace {

// Everything a run needs, rooted in one temp directory:
//   <tmp>/app           project root
//   <tmp>/app/dist      valid build directory
//   <tmp>/keys/ref.pkg  reference package
//   <tmp>/out/demo.pkg  configured output
//   <tmp>/staging       where the fake backend writes packages
struct Rig {
    TempDir tmp;
    FakeTransport http;
    FakeBackend backend{tmp.path / "staging"};
    FakeCatalog catalog;
    FakeBuildConfig config;
    FakeExecutor executor;
    Project project;
    AuthorizedDevice device;
    Timings timings;

    Rig() {
        write_text(tmp.path / "app" / "dist" / "manifest", "title=Demo\n");
        write_text(tmp.path / "app" / "dist" / "source" / "main.brs", "sub main()\nend sub\n");
        write_text(tmp.path / "keys" / "ref.pkg", "REFPKG");
        config.dir = tmp.path / "app" / "dist";

        project.name = "Demo";
        project.root_dir = (tmp.path / "app").string();
        project.sign_key = "abc";
        project.sign_package = (tmp.path / "keys" / "ref.pkg").string();
        project.output = (tmp.path / "out" / "demo.pkg").string();

        device.device = Device{"192.168.1.40", "Den", "Roku Ultra", "S1", {}, {}};
        device.password = "devpass";

        timings.home_settle = milliseconds(0);
        timings.build_settle = milliseconds(0);
        timings.rekey_settle = milliseconds(0);
        timings.deploy_timeout = milliseconds(150);
        timings.deploy_timeout_skipped_build = milliseconds(100);
        timings.heartbeat = milliseconds(20);
    }

    RunReport run(DecisionProvider& decisions, const RunOptions& opts) {
        Orchestrator orch(http, backend, catalog, config, executor, decisions, timings);
        return orch.run(project, device, opts);
    }
};

BuildTask task(const std::string& label, const std::string& group = {}) {
    BuildTask t;
    t.label = label;
    t.command = "make";
    t.group = group;
    return t;
}

} // namespace

TEST_CASE("validate reports every missing item at once") {
    TempDir tmp;
    auto problems = validate_build_directory(tmp.path);
    REQUIRE(problems.size() == 2);
    CHECK(problems[0] == "missing manifest");
    CHECK(problems[1] == "missing source directory");

    std::filesystem::create_directories(tmp.path / "source");
    problems = validate_build_directory(tmp.path);
    REQUIRE(problems.size() == 2);
    CHECK(problems[1] == "missing source/main.brs");

    write_text(tmp.path / "manifest", "x");
    write_text(tmp.path / "source" / "main.brs", "x");
    CHECK(validate_build_directory(tmp.path).empty());
    CHECK(build_exists(tmp.path));
}

TEST_CASE("relocate is a no-op when the artifact already sits at the output") {
    TempDir tmp;
    auto p = tmp.path / "out" / "demo.pkg";
    write_text(p, "PKG");
    auto before = std::filesystem::last_write_time(p);

    std::string err;
    CHECK(relocate_artifact(p, tmp.path / "out" / "." / "demo.pkg", err));
    CHECK(std::filesystem::exists(p));
    CHECK(std::filesystem::last_write_time(p) == before);
    CHECK(read_text(p) == "PKG");
}

TEST_CASE("relocate copies across directories and removes the original") {
    TempDir tmp;
    auto from = tmp.path / "staging" / "demo.pkg";
    auto to = tmp.path / "out" / "final.pkg";
    write_text(from, "PKG");
    std::filesystem::create_directories(to.parent_path());

    std::string err;
    CHECK(relocate_artifact(from, to, err));
    CHECK(read_text(to) == "PKG");
    CHECK_FALSE(std::filesystem::exists(from));

    CHECK_FALSE(relocate_artifact(tmp.path / "nope.pkg", to, err));
    CHECK(err.rfind("artifact_missing", 0) == 0);
}

TEST_CASE("package-only run with skipped build and rekey lands the artifact at the output") {
    Rig rig;
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.skip_build = true;
    opts.skip_rekey = true;
    opts.package_only = true;
    auto report = rig.run(decisions, opts);

    CHECK(report.ok);
    CHECK(report.exit_code() == 0);
    CHECK(report.artifact == rig.project.output);
    CHECK(read_text(rig.project.output) == "PKG:demo");
    CHECK(report.artifact_size == std::string("PKG:demo").size());
    CHECK_FALSE(std::filesystem::exists(rig.tmp.path / "staging" / "demo.pkg"));

    CHECK(rig.backend.packages == 1);
    CHECK(rig.backend.deploys == 0);
    CHECK(rig.backend.rekeys == 0);
    CHECK(decisions.build_questions() == 0);
    CHECK(rig.http.count("/keypress/home") == 2);
}

// Answers the fallback question after `delay`, like a user thinking it over.
class SlowDecisions : public DecisionProvider {
public:
    SlowDecisions(milliseconds delay, bool accept) : delay_(delay), accept_(accept) {}

    BuildChoice choose_build(const std::vector<BuildTask>&, const std::vector<BuildTask>&, bool) override {
        return {BuildChoiceKind::Skip, {}};
    }
    bool confirm_package_fallback(const std::string&) override {
        std::this_thread::sleep_for(delay_);
        return accept_;
    }

private:
    milliseconds delay_;
    bool accept_;
};

class ThrowingDecisions : public DecisionProvider {
public:
    BuildChoice choose_build(const std::vector<BuildTask>&, const std::vector<BuildTask>&, bool) override {
        return {BuildChoiceKind::Skip, {}};
    }
    bool confirm_package_fallback(const std::string&) override {
        throw std::runtime_error("prompt closed");
    }
};

TEST_CASE("deploy timeout with declined fallback aborts without an artifact") {
    Rig rig;
    rig.backend.hang_deploy = true;
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.skip_build = true;
    auto report = rig.run(decisions, opts);

    CHECK_FALSE(report.ok);
    CHECK(report.failed_stage == Stage::Deploy);
    CHECK(report.failure.kind == ErrorKind::TransferTimedOut);
    CHECK(report.failure.outcome == StageOutcome::Fatal);
    CHECK(report.recovered.empty());
    CHECK(report.exit_code() != 0);
    CHECK_FALSE(std::filesystem::exists(rig.project.output));

    CHECK(decisions.fallback_questions() == 1);
    CHECK(rig.backend.cancels == 1);
    CHECK(rig.backend.packages == 0);
    CHECK(rig.backend.rekeys == 1);
}

TEST_CASE("deploy timeout with accepted fallback packages after the transfer is abandoned") {
    Rig rig;
    rig.backend.hang_deploy = true;
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, true);

    RunOptions opts;
    opts.skip_build = true;
    opts.skip_rekey = true;
    auto report = rig.run(decisions, opts);

    CHECK(report.ok);
    CHECK(report.fallback_used);
    CHECK(rig.backend.cancels == 1);
    CHECK(rig.backend.packages == 1);
    CHECK(read_text(rig.project.output) == "PKG:demo");

    REQUIRE(report.recovered.size() == 1);
    CHECK(report.recovered[0].outcome == StageOutcome::Recoverable);
    CHECK(report.recovered[0].kind == ErrorKind::TransferTimedOut);
    CHECK(report.recovered[0].fallback);
}

TEST_CASE("full deploy within budget does not ask about fallback") {
    Rig rig;
    rig.timings.deploy_timeout = milliseconds(5000);
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    auto report = rig.run(decisions, RunOptions{});

    CHECK(report.ok);
    CHECK_FALSE(report.fallback_used);
    CHECK(rig.backend.deploys == 1);
    CHECK(decisions.fallback_questions() == 0);
}

TEST_CASE("unknown pre-selected build task fails listing the available labels") {
    Rig rig;
    rig.catalog.tasks = {task("build-app"), task("lint")};
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.build_task = "nope";
    auto report = rig.run(decisions, opts);

    CHECK_FALSE(report.ok);
    CHECK(report.failed_stage == Stage::BuildDecision);
    CHECK(report.failure.kind == ErrorKind::ValidationFailed);
    REQUIRE(report.failure.hints.size() == 1);
    CHECK(report.failure.hints[0].find("'build-app'") != std::string::npos);
    CHECK(report.failure.hints[0].find("'lint'") != std::string::npos);
    CHECK(rig.executor.executed.empty());
}

TEST_CASE("failed build task is fatal; chosen task is the first build-like one") {
    Rig rig;
    rig.catalog.tasks = {task("lint"), task("compile-app"), task("make-zip", "build")};
    rig.executor.outcome.kind = TaskOutcomeKind::FailedExitCode;
    rig.executor.outcome.exit_code = 2;
    ScriptedDecisions decisions({BuildChoiceKind::RunTask, {}}, false);

    auto report = rig.run(decisions, RunOptions{});

    CHECK_FALSE(report.ok);
    CHECK(report.failed_stage == Stage::BuildDecision);
    CHECK(report.failure.kind == ErrorKind::TaskExecutionFailed);
    REQUIRE(rig.executor.executed.size() == 1);
    CHECK(rig.executor.executed[0] == "compile-app");
    CHECK(rig.backend.deploys == 0);
}

TEST_CASE("build timeout gets skip-build guidance") {
    Rig rig;
    rig.catalog.tasks = {task("build")};
    rig.executor.outcome.kind = TaskOutcomeKind::TimedOut;
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.build_task = "build";
    auto report = rig.run(decisions, opts);

    CHECK(report.failure.kind == ErrorKind::TaskExecutionFailed);
    bool mentions = std::any_of(report.failure.hints.begin(), report.failure.hints.end(),
                                [](const std::string& h) { return h.find("--skip-build") != std::string::npos; });
    CHECK(mentions);
}

TEST_CASE("use-existing-build without a build is ArtifactMissing") {
    Rig rig;
    rig.config.dir = rig.tmp.path / "app" / "empty";
    std::filesystem::create_directories(rig.config.dir);
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.use_existing_build = true;
    auto report = rig.run(decisions, opts);

    CHECK(report.failed_stage == Stage::BuildDecision);
    CHECK(report.failure.kind == ErrorKind::ArtifactMissing);
}

TEST_CASE("no tasks at all continues to validation") {
    Rig rig;
    rig.config.dir = rig.tmp.path / "app" / "empty";
    std::filesystem::create_directories(rig.config.dir);
    ScriptedDecisions decisions({BuildChoiceKind::RunTask, {}}, false);

    auto report = rig.run(decisions, RunOptions{});

    CHECK(decisions.build_questions() == 0);
    CHECK(report.failed_stage == Stage::Validate);
    CHECK(report.failure.kind == ErrorKind::ValidationFailed);
    CHECK(report.failure.hints.size() == 2);
}

TEST_CASE("missing reference package stops before rekey") {
    Rig rig;
    rig.project.sign_package = (rig.tmp.path / "keys" / "missing.pkg").string();
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.skip_build = true;
    auto report = rig.run(decisions, opts);

    CHECK(report.failed_stage == Stage::PackageCheck);
    CHECK(report.failure.kind == ErrorKind::ValidationFailed);
    CHECK(rig.backend.rekeys == 0);
}

TEST_CASE("rekey rejection carries the backend's kind") {
    Rig rig;
    rig.backend.rekey_result = BackendResult{false, ErrorKind::AuthenticationFailed, "HTTP 401", {}};
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.skip_build = true;
    auto report = rig.run(decisions, opts);

    CHECK(report.failed_stage == Stage::Rekey);
    CHECK(report.failure.kind == ErrorKind::AuthenticationFailed);
    CHECK(report.exit_code() == exit_code_for(ErrorKind::AuthenticationFailed));
    CHECK(rig.backend.deploys == 0);
}

TEST_CASE("home navigation refusal is only a warning") {
    Rig rig;
    rig.http.handler = [](const HttpRequest& req) {
        if (req.target == "/keypress/home") return reply(403);
        return reply(200);
    };
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.skip_build = true;
    opts.skip_rekey = true;
    opts.package_only = true;
    auto report = rig.run(decisions, opts);

    CHECK(report.ok);
    REQUIRE(report.warnings.size() == 2);
    CHECK(report.warnings[0].find("403") != std::string::npos);
    for (const auto& req : rig.http.requests()) {
        CHECK(req.method == "POST");
        CHECK(req.port == CONTROL_PORT);
        CHECK(req.body.empty());
    }
}

TEST_CASE("transfer finishing while the fallback question is open keeps its package") {
    for (bool accept : {false, true}) {
        CAPTURE(accept);
        Rig rig;
        rig.backend.deploy_delay = milliseconds(250);
        SlowDecisions decisions(milliseconds(600), accept);

        RunOptions opts;
        opts.skip_build = true;
        opts.skip_rekey = true;
        auto report = rig.run(decisions, opts);

        CHECK(report.ok);
        CHECK_FALSE(report.fallback_used);
        CHECK(report.recovered.empty());
        CHECK(read_text(rig.project.output) == "PKG:demo");
        CHECK_FALSE(std::filesystem::exists(rig.tmp.path / "staging" / "demo.pkg"));
        CHECK(rig.backend.packages == 0);
    }
}

TEST_CASE("a throwing decision provider still stops the transfer") {
    Rig rig;
    rig.backend.hang_deploy = true;
    ThrowingDecisions decisions;

    RunOptions opts;
    opts.skip_build = true;
    opts.skip_rekey = true;
    CHECK_THROWS_AS(rig.run(decisions, opts), std::runtime_error);
    CHECK(rig.backend.cancels == 1);
    CHECK(rig.backend.packages == 0);
}

TEST_CASE("deploy budget depends on whether the build was skipped") {
    Rig rig;
    rig.timings.deploy_timeout = milliseconds(5000);
    rig.timings.deploy_timeout_skipped_build = milliseconds(3000);
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions skipped;
    skipped.skip_build = true;
    skipped.skip_rekey = true;
    REQUIRE(rig.run(decisions, skipped).ok);
    CHECK(rig.backend.last_timeout_ms == 3000);

    RunOptions fresh;
    fresh.skip_rekey = true;
    REQUIRE(rig.run(decisions, fresh).ok);
    CHECK(rig.backend.last_timeout_ms == 5000);
}

TEST_CASE("fresh build whose deploy overruns the budget fails after the build ran") {
    Rig rig;
    rig.catalog.tasks = {task("build")};
    rig.backend.hang_deploy = true;
    ScriptedDecisions decisions({BuildChoiceKind::RunTask, {}}, false);

    const auto start = std::chrono::steady_clock::now();
    auto report = rig.run(decisions, RunOptions{});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(rig.executor.executed.size() == 1);
    CHECK(report.failed_stage == Stage::Deploy);
    CHECK(report.failure.kind == ErrorKind::TransferTimedOut);
    CHECK(report.failure.outcome == StageOutcome::Fatal);
    CHECK(rig.backend.last_timeout_ms == 150);
    CHECK(elapsed >= milliseconds(150));
    CHECK(rig.backend.cancels == 1);
    CHECK_FALSE(std::filesystem::exists(rig.project.output));
}

TEST_CASE("heartbeats are logged while the deploy is pending") {
    Rig rig;
    rig.backend.hang_deploy = true;
    rig.timings.deploy_timeout_skipped_build = milliseconds(300);
    rig.timings.heartbeat = milliseconds(40);
    ScriptedDecisions decisions({BuildChoiceKind::Skip, {}}, false);

    RunOptions opts;
    opts.skip_build = true;
    opts.skip_rekey = true;

    LogCapture log;
    rig.run(decisions, opts);

    CHECK(log.count("still deploying") >= 2);
}
