#include <doctest/doctest.h>
#include "project_store.hpp"
#include "fakes.hpp"

using namespace sideload;
using namespace sideload::testing;
namespace fs = std::filesystem;

static Project demo_project(const std::string& name = "demo") {
    Project p;
    p.name = name;
    p.root_dir = "/src/demo";
    p.sign_key = "abc123";
    p.sign_package = "/keys/demo.pkg";
    p.output = "/out/demo.pkg";
    p.files = {"source/**", "manifest"};
    return p;
}

TEST_CASE("missing config file loads as an empty store") {
    TempDir tmp;
    ProjectStore store(tmp.path / "nested" / "config.json");
    std::string err;
    CHECK(store.load(err));
    CHECK(store.list().empty());
    CHECK_FALSE(store.device());
}

TEST_CASE("save then load keeps projects and device; no temp file left behind") {
    TempDir tmp;
    const auto file = tmp.path / "sideload" / "config.json";
    std::string err;

    {
        ProjectStore store(file);
        REQUIRE(store.load(err));
        REQUIRE(store.add(demo_project(), err));
        Device d{"192.168.1.40", "Den", "Roku Ultra", "X004", std::string("12.5"), {}};
        store.set_device(to_device_config(d, "devpass"));
        REQUIRE(store.save(err));
    }
    CHECK(fs::exists(file));
    CHECK_FALSE(fs::exists(tmp.path / "sideload" / "config.json.tmp"));

    ProjectStore again(file);
    REQUIRE(again.load(err));
    REQUIRE(again.list().size() == 1);
    auto p = again.get("demo");
    REQUIRE(p);
    CHECK(p->sign_key == "abc123");
    CHECK(p->files == std::vector<std::string>{"source/**", "manifest"});

    REQUIRE(again.device());
    auto a = to_authorized(*again.device());
    CHECK(a.device.address == "192.168.1.40");
    CHECK(a.device.name == "Den");
    REQUIRE(a.device.software_version);
    CHECK(*a.device.software_version == "12.5");
    CHECK(a.password == "devpass");
}

TEST_CASE("malformed config is an error, not an empty store") {
    TempDir tmp;
    write_text(tmp.path / "config.json", "{ not json");
    ProjectStore store(tmp.path / "config.json");
    std::string err;
    CHECK_FALSE(store.load(err));
    CHECK(err.rfind("parse_error:", 0) == 0);
}

TEST_CASE("add, update and remove report their error tokens") {
    TempDir tmp;
    ProjectStore store(tmp.path / "config.json");
    std::string err;

    REQUIRE(store.add(demo_project(), err));
    CHECK_FALSE(store.add(demo_project(), err));
    CHECK(err == "duplicate:demo");

    CHECK_FALSE(store.add(demo_project("bad name"), err));
    CHECK(err == "bad_name:bad name");

    ProjectPatch patch;
    patch.output = "/elsewhere/demo.pkg";
    REQUIRE(store.update("demo", patch, err));
    CHECK(store.get("demo")->output == "/elsewhere/demo.pkg");
    CHECK(store.get("demo")->sign_key == "abc123");

    CHECK_FALSE(store.update("ghost", patch, err));
    CHECK(err == "not_found:ghost");

    REQUIRE(store.remove("demo", err));
    CHECK(store.list().empty());
    CHECK_FALSE(store.remove("demo", err));
}

TEST_CASE("partial device config falls back to placeholder identity") {
    DeviceConfig c;
    c.ip = "10.0.0.9";
    c.password = "p";
    auto a = to_authorized(c);
    CHECK(a.device.name == "device-10.0.0.9");
    CHECK(a.device.model == "unknown");
    CHECK(a.device.serial == "unknown");
    CHECK_FALSE(a.device.software_version);
}

TEST_CASE("reference package validation") {
    TempDir tmp;
    std::string err;

    CHECK_FALSE(validate_package_file(tmp.path / "none.pkg", err));
    CHECK(err.rfind("package_not_found:", 0) == 0);

    CHECK_FALSE(validate_package_file(tmp.path, err));
    CHECK(err.rfind("package_not_a_file:", 0) == 0);

    write_text(tmp.path / "keys.zip", "x");
    CHECK_FALSE(validate_package_file(tmp.path / "keys.zip", err));
    CHECK(err.rfind("package_bad_extension:", 0) == 0);

    write_text(tmp.path / "empty.pkg", "");
    CHECK_FALSE(validate_package_file(tmp.path / "empty.pkg", err));
    CHECK(err.rfind("package_empty:", 0) == 0);

    write_text(tmp.path / "ok.pkg", "PKG");
    CHECK(validate_package_file(tmp.path / "ok.pkg", err));
}
