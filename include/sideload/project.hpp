#pragma once
/**
 * @file project.hpp
 * @brief Project and BuildTask records shared by the store, the catalog and the orchestrator.
 *
 * @details
 * A Project is the persisted description of one channel source tree and where
 * its signed artifact should end up. A BuildTask is one entry of the editor's
 * task file; the orchestrator only ever runs tasks, it never writes them.
 *
 * Both are plain aggregates. Validation of names lives in project_store.hpp,
 * command resolution lives in task_runner.hpp.
 */

#include <map>
#include <string>
#include <vector>

namespace sideload {

/**
 * @struct Project
 * @brief One deployable channel.
 */
struct Project {
    std::string name;          /**< Unique key in the store. */
    std::string root_dir;      /**< Source tree root. */
    std::string sign_key;      /**< Developer signing password of the reference package. */
    std::string sign_package;  /**< Previously signed package, used to rekey the device. */
    std::string output;        /**< Where the signed artifact must land (file path). */
    std::vector<std::string> files;  /**< Optional include globs, kept for the store only. */
};

/// How a BuildTask's command line is formed.
enum class TaskKind {
    Process,  ///< `command` + `args`, executed directly
    Shell,    ///< `command` split on whitespace + `args`, through /bin/sh -c
    Script,   ///< `npm run <script>`
};

/**
 * @struct BuildTask
 * @brief One externally defined task.
 */
struct BuildTask {
    std::string label;
    TaskKind kind = TaskKind::Process;
    std::string command;
    std::string script;                       /**< Only for TaskKind::Script. */
    std::vector<std::string> args;
    std::string cwd;                          /**< Override; absolute or relative to the project root. */
    std::map<std::string, std::string> env;   /**< Layered over the ambient environment. */
    std::string group;                        /**< e.g. "build", "test"; empty if ungrouped. */
};

/// Label contains build/compile/package/deploy (any case) or group is "build".
bool is_build_like(const BuildTask& t);

} // namespace sideload
