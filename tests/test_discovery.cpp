#include <doctest/doctest.h>
#include "sideload/discovery.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace sideload;
using namespace sideload::testing;
using std::chrono::milliseconds;

static std::string info_doc(const std::string& name, const std::string& model) {
    return "<device-info><friendly-device-name>" + name + "</friendly-device-name>"
           "<model-name>" + model + "</model-name></device-info>";
}

static SsdpSearchFn no_replies() {
    return [](milliseconds) { return SsdpSearchResult{}; };
}

static DiscoveryOptions fast_options(std::vector<std::string> prefixes) {
    DiscoveryOptions o;
    o.window = milliseconds(1);
    o.info_timeout = milliseconds(50);
    o.probe_timeout = milliseconds(50);
    o.prefixes = std::move(prefixes);
    return o;
}

TEST_CASE("merge: subnet fields override, absent fields keep multicast values") {
    Device a{"192.168.1.40", "Old Name", "Roku Ultra", "S-MC", std::string("11.0"), {}};
    Device b{"192.168.1.40", "New Name", "", "S-SN", {}, std::string("TV")};
    Device other{"192.168.1.41", "Attic", "Express", "S3", {}, {}};

    auto merged = merge_devices({a, other}, {b});
    REQUIRE(merged.size() == 2);

    // ordered by display name
    CHECK(merged[0].name == "Attic");
    const Device& m = merged[1];
    CHECK(m.address == "192.168.1.40");
    CHECK(m.name == "New Name");
    CHECK(m.model == "Roku Ultra");
    CHECK(m.serial == "S-SN");
    REQUIRE(m.software_version);
    CHECK(*m.software_version == "11.0");
    REQUIRE(m.device_class);
    CHECK(*m.device_class == "TV");
}

TEST_CASE("merge: same address reported twice yields one device") {
    Device a{"10.0.0.5", "Den", "X", "1", {}, {}};
    auto merged = merge_devices({a, a}, {a});
    CHECK(merged.size() == 1);
}

TEST_CASE("candidate prefixes: own networks first, no duplicates") {
    auto p = candidate_prefixes({"10.0.0", "192.168.77", "10.0.0"});
    REQUIRE(p.size() == 6);
    CHECK(p[0] == "10.0.0");
    CHECK(p[1] == "192.168.77");
    CHECK(p[2] == "192.168.1");
    CHECK(std::count(p.begin(), p.end(), "10.0.0") == 1);
    CHECK(p.back() == "172.16.0");
}

TEST_CASE("discovery: all probes failing returns an empty list without error") {
    FakeTransport http;
    http.handler = [](const HttpRequest&) { return transport_error("timeout"); };

    SsdpSearchFn search = [](milliseconds) {
        SsdpSearchResult r;
        r.hosts = {"10.9.8.200"};
        return r;
    };
    NetworkDiscovery disco(http, fast_options({"10.9.8"}), search);
    auto r = disco.discover();

    CHECK(r.ok);
    CHECK(r.error.empty());
    CHECK(r.devices.empty());
    CHECK(http.count("/query/device-info") == 254 + 1);
}

TEST_CASE("subnet probe keeps at most 50 requests in flight") {
    FakeTransport http;
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    http.handler = [&](const HttpRequest&) {
        int now = ++in_flight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(milliseconds(20));
        --in_flight;
        return transport_error("timeout");
    };

    auto opts = fast_options({"10.9.8"});
    opts.multicast = false;
    NetworkDiscovery disco(http, opts, no_replies());
    auto devices = disco.subnet_probe();

    CHECK(devices.empty());
    CHECK(http.requests().size() == 254);
    CHECK(peak.load() <= 50);
    CHECK(peak.load() > 1);
}

TEST_CASE("subnet probe: needs status 200 and the device-info marker") {
    FakeTransport http;
    http.handler = [](const HttpRequest& req) {
        if (req.host == "10.9.8.7")  return reply(200, info_doc("Den", "Roku Express"));
        if (req.host == "10.9.8.8")  return reply(200, "<html>printer</html>");
        if (req.host == "10.9.8.9")  return reply(404, info_doc("Ghost", "X"));
        return transport_error("connection_refused");
    };

    auto opts = fast_options({"10.9.8"});
    NetworkDiscovery disco(http, opts, no_replies());
    auto devices = disco.subnet_probe();

    REQUIRE(devices.size() == 1);
    CHECK(devices[0].address == "10.9.8.7");
    CHECK(devices[0].name == "Den");
    for (const auto& req : http.requests()) {
        CHECK(req.port == CONTROL_PORT);
        CHECK(req.method == "GET");
    }
}

TEST_CASE("multicast probe queries each location host") {
    FakeTransport http;
    http.handler = [](const HttpRequest& req) {
        if (req.host == "192.168.5.10") return reply(200, info_doc("Bedroom", "Roku Stick"));
        return transport_error("timeout");
    };
    SsdpSearchFn search = [](milliseconds) {
        SsdpSearchResult r;
        r.hosts = {"192.168.5.10", "192.168.5.11"};
        return r;
    };

    auto opts = fast_options({"10.9.8"});
    opts.subnet = false;
    NetworkDiscovery disco(http, opts, search);
    auto r = disco.discover();

    CHECK(r.ok);
    REQUIRE(r.devices.size() == 1);
    CHECK(r.devices[0].name == "Bedroom");
    CHECK(http.requests().size() == 2);
}

TEST_CASE("multicast socket failure is reported but subnet results survive") {
    FakeTransport http;
    http.handler = [](const HttpRequest& req) {
        if (req.host == "10.9.8.7") return reply(200, info_doc("Den", "Roku Express"));
        return transport_error("timeout");
    };
    SsdpSearchFn search = [](milliseconds) {
        SsdpSearchResult r;
        r.ok = false;
        r.error = "bind_failed: address in use";
        return r;
    };

    NetworkDiscovery disco(http, fast_options({"10.9.8"}), search);
    auto r = disco.discover();

    CHECK_FALSE(r.ok);
    CHECK(r.error.find("bind_failed") != std::string::npos);
    REQUIRE(r.devices.size() == 1);
    CHECK(r.devices[0].address == "10.9.8.7");
}
