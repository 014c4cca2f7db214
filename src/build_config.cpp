// ============================================================================
// build_config.cpp — implementation for build_config.hpp
// ============================================================================

#include "build_config.hpp"
#include "jsonc.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sideload {

static void push_if_string(std::vector<std::string>& out, const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty())
        out.push_back(it->get<std::string>());
}

const std::vector<std::string>& conventional_build_dirs() {
    static const std::vector<std::string> dirs = {".build", "dist", "build", "out", ".out"};
    return dirs;
}

fs::path resolve_config_path(const fs::path& root, const std::string& value) {
    static const std::string ws = "${workspaceFolder}";
    std::string v = value;
    if (v.rfind(ws, 0) == 0) {
        v = v.substr(ws.size());
        while (!v.empty() && (v.front() == '/' || v.front() == '\\')) v.erase(0, 1);
        return (root / v).lexically_normal();
    }
    fs::path p(v);
    return p.is_absolute() ? p : (root / p).lexically_normal();
}

std::vector<std::string> launch_candidates(const json& doc) {
    std::vector<std::string> out;
    if (!doc.is_object()) return out;
    auto cfgs = doc.find("configurations");
    if (cfgs == doc.end() || !cfgs->is_array()) return out;

    for (const auto& c : *cfgs) {
        if (!c.is_object()) continue;
        const std::string type = c.value("type", std::string());
        if (type != "brightscript" && type != "roku") continue;
        push_if_string(out, c, "stagingFolderPath");
        push_if_string(out, c, "outDir");
        break;
    }
    return out;
}

std::vector<std::string> bsconfig_candidates(const json& doc) {
    std::vector<std::string> out;
    if (!doc.is_object()) return out;
    push_if_string(out, doc, "stagingDir");
    push_if_string(out, doc, "stagingFolderPath");
    push_if_string(out, doc, "outDir");
    return out;
}

/*
 * resolve_build_directory()
 * -------------------------
 * A declared directory that does not exist yet is skipped, not returned:
 * validation on a missing directory would only produce a confusing list.
 */
fs::path JsonBuildConfig::resolve_build_directory(const fs::path& root) {
    std::error_code ec;
    std::vector<std::string> declared;

    json doc;
    std::string err;
    if (read_jsonc_file(root / ".vscode" / "launch.json", doc, err)) {
        auto c = launch_candidates(doc);
        declared.insert(declared.end(), c.begin(), c.end());
    } else if (err.rfind("not_found", 0) != 0) {
        spdlog::warn("ignoring launch config: {}", err);
    }

    if (read_jsonc_file(root / "bsconfig.json", doc, err)) {
        auto c = bsconfig_candidates(doc);
        declared.insert(declared.end(), c.begin(), c.end());
    } else if (err.rfind("not_found", 0) != 0) {
        spdlog::warn("ignoring bsconfig: {}", err);
    }

    for (const auto& d : declared) {
        auto p = resolve_config_path(root, d);
        if (fs::is_directory(p, ec)) return p;
        spdlog::debug("declared build directory {} does not exist", p.string());
    }
    for (const auto& d : conventional_build_dirs()) {
        auto p = root / d;
        if (fs::is_directory(p, ec)) return p;
    }
    return root;
}

} // namespace sideload
