#include <doctest/doctest.h>
#include "sideload/device.hpp"

using namespace sideload;

static const char* FULL_INFO =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
    "<device-info>\n"
    "  <serial-number>X00400ABCDEF</serial-number>\n"
    "  <model-name>Roku Ultra</model-name>\n"
    "  <model-number>4800X</model-number>\n"
    "  <friendly-device-name>Living Room</friendly-device-name>\n"
    "  <user-device-name>Den</user-device-name>\n"
    "  <software-version>12.5.0</software-version>\n"
    "  <device-type>Box</device-type>\n"
    "</device-info>\n";

TEST_CASE("device-info: preferred tags win") {
    CHECK(has_device_info_marker(FULL_INFO));

    auto d = parse_device_info("192.168.1.40", FULL_INFO);
    CHECK(d.address == "192.168.1.40");
    CHECK(d.name == "Living Room");
    CHECK(d.model == "Roku Ultra");
    CHECK(d.serial == "X00400ABCDEF");
    REQUIRE(d.software_version);
    CHECK(*d.software_version == "12.5.0");
    REQUIRE(d.device_class);
    CHECK(*d.device_class == "Box");
}

TEST_CASE("device-info: fallback chain for name, model and serial") {
    auto d = parse_device_info("10.0.0.7",
        "<device-info><user-device-name>Den</user-device-name>"
        "<model-number>3930X</model-number></device-info>");
    CHECK(d.name == "Den");
    CHECK(d.model == "3930X");
    CHECK(d.serial == "unknown");
    CHECK_FALSE(d.software_version);
    CHECK_FALSE(d.device_class);

    auto bare = parse_device_info("10.0.0.8", "<device-info></device-info>");
    CHECK(bare.name == "device-10.0.0.8");
    CHECK(bare.model == "unknown");
}

TEST_CASE("device-info: empty tags fall through, entities decoded") {
    auto d = parse_device_info("10.0.0.9",
        "<device-info><friendly-device-name>  </friendly-device-name>"
        "<user-device-name>Tom &amp; Jerry&apos;s</user-device-name></device-info>");
    CHECK(d.name == "Tom & Jerry's");
}

TEST_CASE("device-info marker") {
    CHECK_FALSE(has_device_info_marker("<html>router login</html>"));
    CHECK_FALSE(has_device_info_marker(""));
    CHECK(extract_tag("<a>1</a>", "b").empty());
}

TEST_CASE("describe() one-liner") {
    Device d{"1.2.3.4", "Den", "Roku Express", "S", {}, {}};
    CHECK(describe(d) == "Den (Roku Express) at 1.2.3.4");
}
