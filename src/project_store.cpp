// ============================================================================
// project_store.cpp — implementation for project_store.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file project_store.cpp
 */

#include "project_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>         // isalnum for project names
#include <cstdlib>        // getenv for XDG/HOME lookups
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sideload {

// -------- JSON mapping --------

void to_json(json& j, const Project& p) {
    j = json{{"name", p.name},
             {"root_dir", p.root_dir},
             {"sign_key", p.sign_key},
             {"sign_package", p.sign_package},
             {"output", p.output}};
    if (!p.files.empty()) j["files"] = p.files;
}

void from_json(const json& j, Project& p) {
    p.name         = j.value("name", std::string());
    p.root_dir     = j.value("root_dir", std::string());
    p.sign_key     = j.value("sign_key", std::string());
    p.sign_package = j.value("sign_package", std::string());
    p.output       = j.value("output", std::string());
    p.files        = j.value("files", std::vector<std::string>());
}

void to_json(json& j, const DeviceConfig& d) {
    j = json{{"ip", d.ip},
             {"password", d.password},
             {"name", d.name},
             {"model", d.model},
             {"serial", d.serial},
             {"software_version", d.software_version}};
}

void from_json(const json& j, DeviceConfig& d) {
    d.ip               = j.value("ip", std::string());
    d.password         = j.value("password", std::string());
    d.name             = j.value("name", std::string());
    d.model            = j.value("model", std::string());
    d.serial           = j.value("serial", std::string());
    d.software_version = j.value("software_version", std::string());
}

DeviceConfig to_device_config(const Device& d, const std::string& password) {
    DeviceConfig c;
    c.ip = d.address;
    c.password = password;
    c.name = d.name;
    c.model = d.model;
    c.serial = d.serial;
    c.software_version = d.software_version.value_or("");
    return c;
}

AuthorizedDevice to_authorized(const DeviceConfig& d) {
    AuthorizedDevice a;
    a.device.address = d.ip;
    a.device.name = d.name.empty() ? "device-" + d.ip : d.name;
    a.device.model = d.model.empty() ? "unknown" : d.model;
    a.device.serial = d.serial.empty() ? "unknown" : d.serial;
    if (!d.software_version.empty()) a.device.software_version = d.software_version;
    a.password = d.password;
    return a;
}


// -------- validation --------

bool validate_project_name(const std::string& name, std::string& err) {
    if (name.empty()) {
        err = "bad_name:<empty>";
        return false;
    }
    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_' || c == '-')) {
            err = "bad_name:" + name;
            return false;
        }
    }
    return true;
}

bool validate_package_file(const fs::path& path, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        err = "package_not_found:" + path.string();
        return false;
    }
    if (!fs::is_regular_file(path, ec)) {
        err = "package_not_a_file:" + path.string();
        return false;
    }
    if (path.extension() != ".pkg") {
        err = "package_bad_extension:" + path.string();
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "package_unreadable:" + path.string();
        return false;
    }
    if (fs::file_size(path, ec) == 0 || ec) {
        err = "package_empty:" + path.string();
        return false;
    }
    return true;
}


// -------- ProjectStore --------

ProjectStore::ProjectStore(fs::path file) : file_(std::move(file)) {}

fs::path ProjectStore::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : "") / ".config";
    return base / "sideload" / "config.json";
}

/*
 * load()
 * ------
 * Missing file → empty store, success. A present but malformed file is an
 * error: silently starting over would drop the user's projects on next save.
 */
bool ProjectStore::load(std::string& err) {
    device_.reset();
    projects_.clear();

    std::error_code ec;
    if (!fs::exists(file_, ec)) return true;

    std::ifstream in(file_);
    if (!in) {
        err = "read_failed:" + file_.string();
        return false;
    }
    try {
        json j;
        in >> j;
        if (!j.is_object()) {
            err = "parse_error:" + file_.string() + ": not an object";
            return false;
        }
        if (auto d = j.find("device"); d != j.end() && d->is_object()) device_ = d->get<DeviceConfig>();
        if (auto p = j.find("projects"); p != j.end() && p->is_array())
            projects_ = p->get<std::vector<Project>>();
    } catch (const json::exception& e) {
        err = "parse_error:" + file_.string() + ": " + e.what();
        return false;
    }
    return true;
}

bool ProjectStore::save(std::string& err) const {
    json j = json::object();
    if (device_) j["device"] = *device_;
    j["projects"] = projects_;

    std::error_code ec;
    fs::create_directories(file_.parent_path(), ec);
    if (ec) {
        err = "write_failed:" + ec.message();
        return false;
    }

    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            err = "write_failed:" + tmp.string();
            return false;
        }
        out << j.dump(2) << "\n";
        out.flush();
        if (!out) {
            err = "write_failed:" + tmp.string();
            return false;
        }
    }
    fs::rename(tmp, file_, ec);
    if (ec) {
        err = "write_failed:" + ec.message();
        return false;
    }
    spdlog::debug("saved {}", file_.string());
    return true;
}

std::optional<Project> ProjectStore::get(const std::string& name) const {
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const Project& p) { return p.name == name; });
    if (it == projects_.end()) return std::nullopt;
    return *it;
}

bool ProjectStore::add(const Project& p, std::string& err) {
    if (!validate_project_name(p.name, err)) return false;
    if (get(p.name)) {
        err = "duplicate:" + p.name;
        return false;
    }
    projects_.push_back(p);
    return true;
}

bool ProjectStore::update(const std::string& name, const ProjectPatch& patch, std::string& err) {
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const Project& p) { return p.name == name; });
    if (it == projects_.end()) {
        err = "not_found:" + name;
        return false;
    }
    if (patch.root_dir)     it->root_dir = *patch.root_dir;
    if (patch.sign_key)     it->sign_key = *patch.sign_key;
    if (patch.sign_package) it->sign_package = *patch.sign_package;
    if (patch.output)       it->output = *patch.output;
    if (patch.files)        it->files = *patch.files;
    return true;
}

bool ProjectStore::remove(const std::string& name, std::string& err) {
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const Project& p) { return p.name == name; });
    if (it == projects_.end()) {
        err = "not_found:" + name;
        return false;
    }
    projects_.erase(it);
    return true;
}

} // namespace sideload
