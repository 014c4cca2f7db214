#pragma once
/**
 * @file build_config.hpp
 * @brief BuildConfigReader backed by the project's launch and bsconfig files.
 *
 * @details
 * Resolution order (first existing directory wins):
 *   1) `.vscode/launch.json`, first configuration of type `brightscript` or
 *      `roku`: `stagingFolderPath`, then `outDir`
 *   2) `bsconfig.json`: `stagingDir` (or legacy `stagingFolderPath`), then `outDir`
 *   3) `.build`, `dist`, `build`, `out`, `.out` under the root
 *   4) the root itself
 * Relative paths are taken from the project root; `${workspaceFolder}` is
 * replaced by the root.
 */

#include "sideload/collaborators.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sideload {

/// Conventional build directory names, in lookup order.
const std::vector<std::string>& conventional_build_dirs();

/// Path value of a config document made concrete against `root`.
std::filesystem::path resolve_config_path(const std::filesystem::path& root, const std::string& value);

/// Candidate directories a launch.json document declares, in priority order.
std::vector<std::string> launch_candidates(const nlohmann::json& doc);

/// Candidate directories a bsconfig.json document declares, in priority order.
std::vector<std::string> bsconfig_candidates(const nlohmann::json& doc);

class JsonBuildConfig : public BuildConfigReader {
public:
    std::filesystem::path resolve_build_directory(const std::filesystem::path& root) override;
};

} // namespace sideload
