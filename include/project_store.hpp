#pragma once
/**
 * @page sl-project-store Sideload Project Store
 * @file project_store.hpp
 * @brief Persistent projects and default device, one JSON file under XDG config.
 *
 * @details
 * PURPOSE
 * -------
 * The CLI remembers two things between runs: the device to deploy to and the
 * projects it knows how to package. The orchestrator never touches this
 * file; the CLI loads it, picks one Project and one device, and hands both
 * over by value.
 *
 * FILE
 * ----
 *   $XDG_CONFIG_HOME/sideload/config.json   (fallback ~/.config/sideload/)
 *
 * @code
 *   {
 *     "device":   { "ip": "192.168.1.40", "password": "...", "name": "Living Room",
 *                   "model": "Roku Ultra", "serial": "X00...", "software_version": "12.5" },
 *     "projects": [ { "name": "demo", "root_dir": "/src/demo", "sign_key": "...",
 *                     "sign_package": "/keys/demo.pkg", "output": "/out/demo.pkg",
 *                     "files": ["source/**", "manifest"] } ]
 *   }
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Writes go to `config.json.tmp` and are renamed into place.
 * - The password and signing key are stored as plain text; the file is
 *   created with the user's umask. Keep it private.
 * - A missing file loads as an empty store.
 *
 * ERROR TOKENS
 * ------------
 *   bad_name:<n>  duplicate:<n>  not_found:<n>  parse_error:<detail>  write_failed:<detail>
 */

#include "sideload/device.hpp"
#include "sideload/project.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sideload {

struct DeviceConfig {
    std::string ip;
    std::string password;
    std::string name;
    std::string model;
    std::string serial;
    std::string software_version;
};

/// Fields of a Project that `edit` may change; disengaged = keep.
struct ProjectPatch {
    std::optional<std::string> root_dir;
    std::optional<std::string> sign_key;
    std::optional<std::string> sign_package;
    std::optional<std::string> output;
    std::optional<std::vector<std::string>> files;
};

void to_json(nlohmann::json& j, const Project& p);
void from_json(const nlohmann::json& j, Project& p);
void to_json(nlohmann::json& j, const DeviceConfig& d);
void from_json(const nlohmann::json& j, DeviceConfig& d);

DeviceConfig to_device_config(const Device& d, const std::string& password);
AuthorizedDevice to_authorized(const DeviceConfig& d);

/// Non-empty, only [A-Za-z0-9_-].
bool validate_project_name(const std::string& name, std::string& err);

/// Exists, readable, `.pkg` extension, non-empty.
bool validate_package_file(const std::filesystem::path& path, std::string& err);

class ProjectStore {
public:
    explicit ProjectStore(std::filesystem::path file = default_path());

    static std::filesystem::path default_path();

    bool load(std::string& err);
    bool save(std::string& err) const;

    const std::filesystem::path& path() const { return file_; }
    const std::vector<Project>& list() const { return projects_; }
    std::optional<Project> get(const std::string& name) const;

    const std::optional<DeviceConfig>& device() const { return device_; }
    void set_device(const DeviceConfig& d) { device_ = d; }

    bool add(const Project& p, std::string& err);
    bool update(const std::string& name, const ProjectPatch& patch, std::string& err);
    bool remove(const std::string& name, std::string& err);

private:
    std::filesystem::path file_;
    std::optional<DeviceConfig> device_;
    std::vector<Project> projects_;
};

} // namespace sideload
