#include <doctest/doctest.h>
#include "build_config.hpp"
#include "fakes.hpp"

using namespace sideload;
using namespace sideload::testing;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("config paths: workspace variable, relative and absolute") {
    const fs::path root = "/src/app";
    CHECK(resolve_config_path(root, "${workspaceFolder}/out/staging") == fs::path("/src/app/out/staging"));
    CHECK(resolve_config_path(root, "dist") == fs::path("/src/app/dist"));
    CHECK(resolve_config_path(root, "./build/../dist") == fs::path("/src/app/dist"));
    CHECK(resolve_config_path(root, "/tmp/stage") == fs::path("/tmp/stage"));
}

TEST_CASE("launch candidates come from the first device configuration only") {
    auto doc = json::parse(R"({
        "configurations": [
            { "type": "node", "outDir": "node-out" },
            { "type": "brightscript", "stagingFolderPath": "stage", "outDir": "out" },
            { "type": "roku", "outDir": "second" }
        ]
    })");
    CHECK(launch_candidates(doc) == std::vector<std::string>{"stage", "out"});
    CHECK(launch_candidates(json::object()).empty());
}

TEST_CASE("bsconfig candidates in priority order") {
    auto doc = json::parse(R"({ "outDir": "o", "stagingDir": "s", "rootDir": "src" })");
    CHECK(bsconfig_candidates(doc) == std::vector<std::string>{"s", "o"});
}

TEST_CASE("resolution: declared existing dir, then conventional, then root") {
    TempDir tmp;
    JsonBuildConfig config;

    CHECK(config.resolve_build_directory(tmp.path) == tmp.path);

    fs::create_directories(tmp.path / "out");
    fs::create_directories(tmp.path / "dist");
    CHECK(config.resolve_build_directory(tmp.path) == tmp.path / "dist");

    // declared but absent: skipped
    write_text(tmp.path / "bsconfig.json", R"({ "stagingDir": "staging" })");
    CHECK(config.resolve_build_directory(tmp.path) == tmp.path / "dist");

    fs::create_directories(tmp.path / "staging");
    CHECK(config.resolve_build_directory(tmp.path) == tmp.path / "staging");

    // launch.json outranks bsconfig
    fs::create_directories(tmp.path / "launch-stage");
    write_text(tmp.path / ".vscode" / "launch.json",
               "{ // editor file\n \"configurations\": [ { \"type\": \"brightscript\", "
               "\"stagingFolderPath\": \"${workspaceFolder}/launch-stage\" }, ] }");
    CHECK(config.resolve_build_directory(tmp.path) == tmp.path / "launch-stage");
}
