// ============================================================================
// discovery.cpp — implementation for discovery.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file discovery.cpp
 */

#include "sideload/discovery.hpp"
#include "net_interfaces.hpp"   // local_ipv4_prefixes()

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>    // std::async fan-out for both strategies and each chunk
#include <map>
#include <tuple>

namespace sideload {

static constexpr int FIRST_HOST = 1;
static constexpr int LAST_HOST  = 254;


// -------- helpers --------

/*
 * overlay()
 * ---------
 * Copy every field `src` actually has onto `dst`. Address is the merge key
 * and is never touched.
 */
static void overlay(Device& dst, const Device& src) {
    if (!src.name.empty())     dst.name = src.name;
    if (!src.model.empty())    dst.model = src.model;
    if (!src.serial.empty())   dst.serial = src.serial;
    if (src.software_version)  dst.software_version = src.software_version;
    if (src.device_class)      dst.device_class = src.device_class;
}


// -------- public API --------

const std::vector<std::string>& default_prefixes() {
    static const std::vector<std::string> p = {
        "192.168.1", "192.168.0", "10.0.0", "10.0.1", "172.16.0",
    };
    return p;
}

std::vector<std::string> candidate_prefixes(const std::vector<std::string>& local) {
    std::vector<std::string> out;
    auto add = [&out](const std::string& p) {
        if (!p.empty() && std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
    };
    for (const auto& p : local) add(p);
    for (const auto& p : default_prefixes()) add(p);
    return out;
}

std::vector<Device> merge_devices(const std::vector<Device>& multicast,
                                  const std::vector<Device>& subnet) {
    std::map<std::string, Device> by_addr;
    for (const auto& d : multicast) {
        auto [it, inserted] = by_addr.emplace(d.address, d);
        if (!inserted) overlay(it->second, d);
    }
    for (const auto& d : subnet) {
        auto [it, inserted] = by_addr.emplace(d.address, d);
        if (!inserted) overlay(it->second, d);
    }

    std::vector<Device> out;
    out.reserve(by_addr.size());
    for (auto& kv : by_addr) out.push_back(std::move(kv.second));
    std::sort(out.begin(), out.end(), [](const Device& a, const Device& b) {
        return std::tie(a.name, a.address) < std::tie(b.name, b.address);
    });
    return out;
}

NetworkDiscovery::NetworkDiscovery(HttpTransport& http, DiscoveryOptions opts, SsdpSearchFn search)
    : http_(http), opts_(std::move(opts)), search_(std::move(search)) {}

std::optional<Device> NetworkDiscovery::query_device(const std::string& address,
                                                     std::chrono::milliseconds timeout,
                                                     bool require_marker) {
    HttpRequest req;
    req.method = "GET";
    req.host = address;
    req.port = CONTROL_PORT;
    req.target = "/query/device-info";
    req.timeout = timeout;

    auto res = http_.send(req);
    if (!res.ok || res.status != 200) return std::nullopt;
    if (require_marker && !has_device_info_marker(res.body)) return std::nullopt;
    return parse_device_info(address, res.body);
}

/*
 * multicast_probe()
 * -----------------
 * The search itself is the blocking part (the whole window). Location hosts
 * are then queried concurrently; a host that does not answer is dropped.
 */
std::vector<Device> NetworkDiscovery::multicast_probe(bool& ok, std::string& error) {
    std::vector<Device> out;

    auto search = search_(opts_.window);
    ok = search.ok;
    error = search.error;
    if (!search.ok) return out;

    std::vector<std::future<std::optional<Device>>> pending;
    pending.reserve(search.hosts.size());
    for (const auto& host : search.hosts) {
        pending.push_back(std::async(std::launch::async, [this, host] {
            return query_device(host, opts_.info_timeout, false);
        }));
    }
    for (auto& f : pending) {
        if (auto d = f.get()) out.push_back(std::move(*d));
    }
    spdlog::debug("multicast probe: {} replies, {} devices", search.hosts.size(), out.size());
    return out;
}

/*
 * subnet_probe()
 * --------------
 * Policy:
 * - At most chunk_size requests in flight: a chunk is launched, then fully
 *   joined before the next one starts. Slow hosts only delay their chunk.
 * - Prefix order is preserved so own-network devices surface first in logs.
 */
std::vector<Device> NetworkDiscovery::subnet_probe() {
    std::vector<Device> out;

    auto prefixes = opts_.prefixes.empty() ? candidate_prefixes(local_ipv4_prefixes())
                                           : opts_.prefixes;
    std::vector<std::string> targets;
    targets.reserve(prefixes.size() * LAST_HOST);
    for (const auto& p : prefixes)
        for (int h = FIRST_HOST; h <= LAST_HOST; ++h) targets.push_back(p + "." + std::to_string(h));

    const std::size_t chunk = std::max<std::size_t>(1, opts_.chunk_size);
    for (std::size_t i = 0; i < targets.size(); i += chunk) {
        const std::size_t end = std::min(targets.size(), i + chunk);

        std::vector<std::future<std::optional<Device>>> pending;
        pending.reserve(end - i);
        for (std::size_t j = i; j < end; ++j) {
            pending.push_back(std::async(std::launch::async, [this, addr = targets[j]] {
                return query_device(addr, opts_.probe_timeout, true);
            }));
        }
        for (auto& f : pending) {
            if (auto d = f.get()) out.push_back(std::move(*d));
        }
    }
    spdlog::debug("subnet probe: {} prefixes, {} hosts, {} devices",
                  prefixes.size(), targets.size(), out.size());
    return out;
}

/*
 * discover()
 * ----------
 * Fan out both strategies, join both, merge. Neither strategy throws, and a
 * disabled strategy contributes an empty list.
 */
DiscoveryResult NetworkDiscovery::discover() {
    DiscoveryResult result;

    bool mc_ok = true;
    std::string mc_error;

    auto mc = std::async(std::launch::async, [&]() -> std::vector<Device> {
        if (!opts_.multicast) return {};
        return multicast_probe(mc_ok, mc_error);
    });
    auto sn = std::async(std::launch::async, [&]() -> std::vector<Device> {
        if (!opts_.subnet) return {};
        return subnet_probe();
    });

    auto mc_devices = mc.get();
    auto sn_devices = sn.get();

    result.devices = merge_devices(mc_devices, sn_devices);
    if (!mc_ok) {
        result.ok = false;
        result.error = "multicast_unavailable: " + mc_error;
    }
    spdlog::info("discovery: {} device(s) ({} multicast, {} subnet)",
                 result.devices.size(), mc_devices.size(), sn_devices.size());
    return result;
}

} // namespace sideload
