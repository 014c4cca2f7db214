#pragma once
/**
 * @file decisions.hpp
 * @brief The two questions the orchestrator may need answered mid-run.
 *
 * @details
 * The engine never prompts. When a run reaches a branch only the user can
 * settle, it asks a DecisionProvider:
 *   - which build to use when no task was pre-selected,
 *   - whether to fall back to package-only after a transfer timeout.
 *
 * ScriptedDecisions answers from values fixed up front; the CLI builds one
 * from its flags and tests use it directly.
 */

#include "sideload/project.hpp"

#include <string>
#include <vector>

namespace sideload {

enum class BuildChoiceKind { RunTask, UseExisting, Skip };

struct BuildChoice {
    BuildChoiceKind kind = BuildChoiceKind::Skip;
    std::string label;   /**< RunTask: task label; empty means the first build-like task. */
};

class DecisionProvider {
public:
    virtual ~DecisionProvider() = default;

    virtual BuildChoice choose_build(const std::vector<BuildTask>& build_tasks,
                                     const std::vector<BuildTask>& all_tasks,
                                     bool build_exists) = 0;

    /// `reason` is a short human sentence describing why a fallback is offered.
    virtual bool confirm_package_fallback(const std::string& reason) = 0;
};

class ScriptedDecisions : public DecisionProvider {
public:
    ScriptedDecisions(BuildChoice build, bool accept_fallback)
        : build_(std::move(build)), accept_fallback_(accept_fallback) {}

    BuildChoice choose_build(const std::vector<BuildTask>& build_tasks,
                             const std::vector<BuildTask>& all_tasks,
                             bool build_exists) override;

    bool confirm_package_fallback(const std::string& reason) override;

    int build_questions() const { return build_questions_; }
    int fallback_questions() const { return fallback_questions_; }

private:
    BuildChoice build_;
    bool accept_fallback_;
    int build_questions_ = 0;
    int fallback_questions_ = 0;
};

} // namespace sideload
