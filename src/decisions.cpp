// ============================================================================
// decisions.cpp — implementation for decisions.hpp
// ============================================================================

#include "sideload/decisions.hpp"

#include <spdlog/spdlog.h>

namespace sideload {

BuildChoice ScriptedDecisions::choose_build(const std::vector<BuildTask>& build_tasks,
                                            const std::vector<BuildTask>& all_tasks,
                                            bool build_exists) {
    ++build_questions_;
    BuildChoice c = build_;
    if (c.kind == BuildChoiceKind::RunTask && c.label.empty()) {
        if (build_tasks.empty()) {
            spdlog::info("no build-like task among {} task(s), skipping build", all_tasks.size());
            return BuildChoice{BuildChoiceKind::Skip, {}};
        }
        c.label = build_tasks.front().label;
    }
    spdlog::debug("build choice: kind={} label='{}' (existing build: {})",
                  static_cast<int>(c.kind), c.label, build_exists ? "yes" : "no");
    return c;
}

bool ScriptedDecisions::confirm_package_fallback(const std::string& reason) {
    ++fallback_questions_;
    spdlog::warn("{}", reason);
    spdlog::info("package-only fallback {}", accept_fallback_ ? "accepted" : "declined");
    return accept_fallback_;
}

} // namespace sideload
