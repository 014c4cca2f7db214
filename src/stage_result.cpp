// ============================================================================
// stage_result.cpp — implementation for stage_result.hpp
// ============================================================================

#include "sideload/stage_result.hpp"

namespace sideload {

StageResult StageResult::fatal(ErrorKind k, std::string msg, std::vector<std::string> hints) {
    StageResult r;
    r.outcome = StageOutcome::Fatal;
    r.kind = k;
    r.message = std::move(msg);
    r.hints = std::move(hints);
    return r;
}

StageResult StageResult::recoverable(ErrorKind k, std::string msg, std::vector<std::string> hints) {
    StageResult r = fatal(k, std::move(msg), std::move(hints));
    r.outcome = StageOutcome::Recoverable;
    r.fallback = true;
    return r;
}

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                 return "none";
        case ErrorKind::NetworkUnreachable:   return "network_unreachable";
        case ErrorKind::AuthenticationFailed: return "authentication_failed";
        case ErrorKind::ValidationFailed:     return "validation_failed";
        case ErrorKind::TaskExecutionFailed:  return "task_execution_failed";
        case ErrorKind::TransferTimedOut:     return "transfer_timed_out";
        case ErrorKind::ArtifactMissing:      return "artifact_missing";
        case ErrorKind::DeployFailed:         return "deploy_failed";
        case ErrorKind::IoFailed:             return "io_failed";
    }
    return "unknown";
}

const char* to_string(Stage s) {
    switch (s) {
        case Stage::HomeNavigation: return "home_navigation";
        case Stage::BuildDecision:  return "build";
        case Stage::ConfigResolve:  return "config_resolve";
        case Stage::Validate:       return "validate";
        case Stage::PackageCheck:   return "package_check";
        case Stage::OutputPrep:     return "output_prep";
        case Stage::Rekey:          return "rekey";
        case Stage::Deploy:         return "deploy";
        case Stage::Relocate:       return "relocate";
        case Stage::Finalize:       return "finalize";
    }
    return "unknown";
}

int exit_code_for(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                 return 0;
        case ErrorKind::NetworkUnreachable:   return 3;
        case ErrorKind::AuthenticationFailed: return 4;
        case ErrorKind::ValidationFailed:     return 5;
        case ErrorKind::TaskExecutionFailed:  return 6;
        case ErrorKind::TransferTimedOut:     return 7;
        case ErrorKind::ArtifactMissing:      return 8;
        case ErrorKind::DeployFailed:         return 9;
        case ErrorKind::IoFailed:             return 10;
    }
    return 1;
}

std::vector<std::string> remediation_for(ErrorKind k) {
    switch (k) {
        case ErrorKind::NetworkUnreachable:
            return {"check that the device is powered on and on the same network",
                    "check that developer mode is enabled on the device",
                    "run `sideload discover` to refresh the device address"};
        case ErrorKind::AuthenticationFailed:
            return {"check the developer password (`sideload device --password ...`)",
                    "the password is the one set when developer mode was enabled"};
        case ErrorKind::ValidationFailed:
            return {"check the project settings with `sideload list`"};
        case ErrorKind::TaskExecutionFailed:
            return {"run the build manually, then retry with --skip-build"};
        case ErrorKind::TransferTimedOut:
            return {"retry with --package-only if the channel is already installed"};
        case ErrorKind::ArtifactMissing:
            return {"rebuild the project, or drop --use-existing-build"};
        case ErrorKind::DeployFailed:
            return {"check the device's developer page for the install log",
                    "make sure the signing key matches the reference package"};
        case ErrorKind::IoFailed:
            return {"check permissions on the output location"};
        case ErrorKind::None:
            break;
    }
    return {};
}

} // namespace sideload
