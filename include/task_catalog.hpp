#pragma once
/**
 * @file task_catalog.hpp
 * @brief TaskCatalog backed by `.vscode/tasks.json`.
 *
 * @details
 * Mapping of the editor's task entries:
 *   - `type: "npm"` with `script`     → TaskKind::Script (label defaults to "npm: <script>")
 *   - `type: "shell"`                 → TaskKind::Shell
 *   - anything else with a `command`  → TaskKind::Process
 *   - `options.cwd`, `options.env`    → cwd / env overrides
 *   - `group: "build"` or `group: {"kind": "build"}` → group
 * `args` entries may be strings or `{ "value": ... }` objects.
 * Entries with nothing to run are skipped.
 */

#include "sideload/collaborators.hpp"

#include <nlohmann/json.hpp>

namespace sideload {

/// Tasks described by a parsed tasks document; unknown shapes are ignored.
std::vector<BuildTask> parse_tasks(const nlohmann::json& doc);

class JsonTaskCatalog : public TaskCatalog {
public:
    std::vector<BuildTask> list_tasks(const std::filesystem::path& root) override;
};

} // namespace sideload
