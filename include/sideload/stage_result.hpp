#pragma once
/**
 * @page sl-stage-result Sideload Stage Results
 * @file stage_result.hpp
 * @brief Error taxonomy, stage identifiers and the per-stage outcome record.
 *
 * @details
 * PURPOSE
 * -------
 * Every orchestration stage finishes with a StageResult. The record carries
 * enough for the CLI to print a stable one-line reason, a few remediation
 * lines and pick an exit code, without the core ever throwing.
 *
 * CONVENTIONS
 * -----------
 * - `to_string(ErrorKind)` and `to_string(Stage)` return stable snake_case
 *   tokens, safe for scripts to match on (`kind=network_unreachable`).
 * - Soft warnings never become a StageResult; they are logged and absorbed.
 * - Recoverable marks a failure the run may route around (the deploy timeout
 *   and its package-only fallback). It turns Fatal if the fallback is refused.
 * - exit_code_for() maps each kind to its own non-zero code; usage errors use 2
 *   and are produced by the CLI, not here.
 */

#include <string>
#include <vector>

namespace sideload {

enum class ErrorKind {
    None,
    NetworkUnreachable,
    AuthenticationFailed,
    ValidationFailed,
    TaskExecutionFailed,
    TransferTimedOut,
    ArtifactMissing,
    DeployFailed,
    IoFailed,
};

enum class StageOutcome { Success, Recoverable, Fatal };

enum class Stage {
    HomeNavigation,
    BuildDecision,
    ConfigResolve,
    Validate,
    PackageCheck,
    OutputPrep,
    Rekey,
    Deploy,
    Relocate,
    Finalize,
};

struct StageResult {
    StageOutcome outcome = StageOutcome::Success;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::vector<std::string> hints;
    bool fallback = false;  /**< A fallback path exists for this failure. */

    bool ok() const { return outcome == StageOutcome::Success; }

    static StageResult success() { return {}; }
    static StageResult fatal(ErrorKind k, std::string msg, std::vector<std::string> hints = {});
    /// Failure with a fallback path; `fallback` is set.
    static StageResult recoverable(ErrorKind k, std::string msg, std::vector<std::string> hints = {});
};

const char* to_string(ErrorKind k);
const char* to_string(Stage s);

/// Process exit code for a fatal kind; 0 for ErrorKind::None.
int exit_code_for(ErrorKind k);

/// General remediation lines for a kind, printed after the stage's own hints.
std::vector<std::string> remediation_for(ErrorKind k);

} // namespace sideload
