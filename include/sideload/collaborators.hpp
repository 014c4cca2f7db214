#pragma once
/**
 * @file collaborators.hpp
 * @brief Read-only project document interfaces consumed by the orchestrator.
 *
 * @details
 * TaskCatalog lists the build tasks a project defines. BuildConfigReader
 * finds the directory the build writes its staged channel to. File-backed
 * implementations live in task_catalog.hpp and build_config.hpp.
 */

#include "sideload/project.hpp"

#include <filesystem>
#include <vector>

namespace sideload {

class TaskCatalog {
public:
    virtual ~TaskCatalog() = default;
    /// Every task defined for `root`, in file order. Missing or unreadable files yield {}.
    virtual std::vector<BuildTask> list_tasks(const std::filesystem::path& root) = 0;
};

class BuildConfigReader {
public:
    virtual ~BuildConfigReader() = default;
    /// Staging path → declared output → conventional names → root. Always returns a path.
    virtual std::filesystem::path resolve_build_directory(const std::filesystem::path& root) = 0;
};

} // namespace sideload
