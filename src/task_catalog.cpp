// ============================================================================
// task_catalog.cpp — implementation for task_catalog.hpp
// ============================================================================

#include "task_catalog.hpp"
#include "jsonc.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sideload {

static std::string str_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

static std::string env_value(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return {};
    return v.dump();
}

// ---- parse_task() — one entry; false when it names nothing to run
static bool parse_task(const json& t, BuildTask& out) {
    if (!t.is_object()) return false;

    const std::string type = str_or_empty(t, "type");
    out.command = str_or_empty(t, "command");
    out.script  = str_or_empty(t, "script");
    out.label   = str_or_empty(t, "label");

    if (type == "npm") {
        if (out.script.empty()) return false;
        out.kind = TaskKind::Script;
        if (out.label.empty()) out.label = "npm: " + out.script;
    } else {
        if (out.command.empty()) return false;
        out.kind = (type == "shell") ? TaskKind::Shell : TaskKind::Process;
        if (out.label.empty()) out.label = out.command;
    }

    if (auto a = t.find("args"); a != t.end() && a->is_array()) {
        for (const auto& arg : *a) {
            if (arg.is_string()) out.args.push_back(arg.get<std::string>());
            else if (arg.is_object()) out.args.push_back(str_or_empty(arg, "value"));
        }
    }

    if (auto o = t.find("options"); o != t.end() && o->is_object()) {
        out.cwd = str_or_empty(*o, "cwd");
        if (auto e = o->find("env"); e != o->end() && e->is_object()) {
            for (auto it = e->begin(); it != e->end(); ++it) out.env[it.key()] = env_value(it.value());
        }
    }

    if (auto g = t.find("group"); g != t.end()) {
        if (g->is_string()) out.group = g->get<std::string>();
        else if (g->is_object()) out.group = str_or_empty(*g, "kind");
    }
    return true;
}

std::vector<BuildTask> parse_tasks(const json& doc) {
    std::vector<BuildTask> out;
    if (!doc.is_object()) return out;
    auto tasks = doc.find("tasks");
    if (tasks == doc.end() || !tasks->is_array()) return out;

    for (const auto& t : *tasks) {
        BuildTask bt;
        if (parse_task(t, bt)) out.push_back(std::move(bt));
    }
    return out;
}

std::vector<BuildTask> JsonTaskCatalog::list_tasks(const fs::path& root) {
    const fs::path file = root / ".vscode" / "tasks.json";
    json doc;
    std::string err;
    if (!read_jsonc_file(file, doc, err)) {
        if (err.rfind("not_found", 0) != 0) spdlog::warn("ignoring task file: {}", err);
        return {};
    }
    auto tasks = parse_tasks(doc);
    spdlog::debug("{}: {} task(s)", file.string(), tasks.size());
    return tasks;
}

} // namespace sideload
