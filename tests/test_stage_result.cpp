#include <doctest/doctest.h>
#include "sideload/stage_result.hpp"
#include "sideload/project.hpp"

#include <set>
#include <string>

using namespace sideload;

TEST_CASE("every fatal kind has its own non-zero exit code") {
    const ErrorKind kinds[] = {
        ErrorKind::NetworkUnreachable, ErrorKind::AuthenticationFailed, ErrorKind::ValidationFailed,
        ErrorKind::TaskExecutionFailed, ErrorKind::TransferTimedOut, ErrorKind::ArtifactMissing,
        ErrorKind::DeployFailed, ErrorKind::IoFailed,
    };
    std::set<int> codes;
    for (auto k : kinds) {
        const int c = exit_code_for(k);
        CHECK(c != 0);
        CHECK(c != 2);
        codes.insert(c);
        CHECK_FALSE(remediation_for(k).empty());
    }
    CHECK(codes.size() == 8);
    CHECK(exit_code_for(ErrorKind::None) == 0);
    CHECK(remediation_for(ErrorKind::None).empty());
}

TEST_CASE("tokens are stable snake_case") {
    CHECK(std::string(to_string(ErrorKind::NetworkUnreachable)) == "network_unreachable");
    CHECK(std::string(to_string(ErrorKind::TransferTimedOut)) == "transfer_timed_out");
    CHECK(std::string(to_string(Stage::BuildDecision)) == "build");
    CHECK(std::string(to_string(Stage::PackageCheck)) == "package_check");
}

TEST_CASE("fatal result carries kind, message and hints") {
    auto ok = StageResult::success();
    CHECK(ok.ok());
    CHECK(ok.kind == ErrorKind::None);

    auto r = StageResult::fatal(ErrorKind::ArtifactMissing, "gone", {"rebuild"});
    CHECK_FALSE(r.ok());
    CHECK(r.outcome == StageOutcome::Fatal);
    CHECK(r.message == "gone");
    REQUIRE(r.hints.size() == 1);
    CHECK_FALSE(r.fallback);
}

TEST_CASE("recoverable result keeps the failure and marks the fallback") {
    auto r = StageResult::recoverable(ErrorKind::TransferTimedOut, "slow", {"retry"});
    CHECK_FALSE(r.ok());
    CHECK(r.outcome == StageOutcome::Recoverable);
    CHECK(r.kind == ErrorKind::TransferTimedOut);
    CHECK(r.fallback);
    CHECK(r.hints.size() == 1);
    CHECK(exit_code_for(r.kind) != 0);
}

TEST_CASE("build-like tasks: group or label keywords") {
    BuildTask t;
    t.label = "Lint";
    CHECK_FALSE(is_build_like(t));
    t.group = "build";
    CHECK(is_build_like(t));

    BuildTask u;
    u.label = "Package Channel";
    CHECK(is_build_like(u));
    u.label = "COMPILE";
    CHECK(is_build_like(u));
    u.label = "npm: deploy-dev";
    CHECK(is_build_like(u));
    u.label = "test";
    CHECK_FALSE(is_build_like(u));
}
