#pragma once
/**
 * @page sl-discovery Sideload Network Discovery
 * @file discovery.hpp
 * @brief Locate ECP devices on the LAN with two concurrent strategies.
 *
 * @details
 * PURPOSE
 * -------
 * The user rarely knows the device address. Discovery finds every responder
 * it can within a bounded time and hands back a deduplicated, name-ordered
 * list. Picking one is the caller's job.
 *
 * WHAT THIS DOES
 * --------------
 * - Multicast probe: one SSDP `M-SEARCH`, listen for the window (5 s), then
 *   query `device-info` (3 s timeout) on every location host that replied.
 * - Subnet probe: for each candidate /24 prefix (own interfaces first, then
 *   192.168.1, 192.168.0, 10.0.0, 10.0.1, 172.16.0) query hosts 1..254 with
 *   a 2 s timeout, at most `chunk_size` (50) requests in flight. A reply
 *   counts only with status 200 and a `<device-info>` body.
 * - Both probes run concurrently; neither can fail the other. The results
 *   are merged by address, subnet fields overriding multicast ones when the
 *   subnet record has them.
 *
 * FAILURE MODEL
 * -------------
 * - Per-host errors (timeouts, refusals, garbage) are dropped silently.
 * - `ok=false` only when the multicast socket itself could not be used.
 *   Devices found by the subnet probe are still returned in that case.
 * - discover() never throws.
 *
 * EXAMPLE
 * -------
 * @code
 *   sideload::BeastTransport http;
 *   sideload::NetworkDiscovery disco(http);
 *   auto r = disco.discover();
 *   for (const auto& d : r.devices) std::cout << sideload::describe(d) << "\n";
 * @endcode
 *
 * DEPENDENCIES
 * ------------
 * - http_io.hpp (HttpTransport), ssdp.hpp, net_interfaces.hpp.
 */

#include "sideload/device.hpp"
#include "http_io.hpp"
#include "ssdp.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sideload {

struct DiscoveryOptions {
    std::chrono::milliseconds window{5000};         /**< SSDP listening window. */
    std::chrono::milliseconds info_timeout{3000};   /**< device-info after an SSDP reply. */
    std::chrono::milliseconds probe_timeout{2000};  /**< device-info during the subnet sweep. */
    std::size_t chunk_size = 50;                    /**< Max subnet requests in flight. */
    std::vector<std::string> prefixes;              /**< Non-empty: replaces candidate_prefixes(). */
    bool multicast = true;
    bool subnet = true;
};

struct DiscoveryResult {
    bool ok = true;
    std::vector<Device> devices;
    std::string error;
};

using SsdpSearchFn = std::function<SsdpSearchResult(std::chrono::milliseconds)>;

/// Fixed fallback prefixes, in probe order.
const std::vector<std::string>& default_prefixes();

/// `local` prefixes first (deduplicated), then default_prefixes() not already present.
std::vector<std::string> candidate_prefixes(const std::vector<std::string>& local);

/**
 * @brief Merge two probe results keyed by address.
 *
 * A field present in `subnet` (non-empty string, engaged optional) wins;
 * an absent one keeps the `multicast` value. Output is ordered by name,
 * then address.
 */
std::vector<Device> merge_devices(const std::vector<Device>& multicast,
                                  const std::vector<Device>& subnet);

class NetworkDiscovery {
public:
    explicit NetworkDiscovery(HttpTransport& http,
                              DiscoveryOptions opts = {},
                              SsdpSearchFn search = ssdp_search);

    DiscoveryResult discover();

    /// SSDP search + device-info on each location. `ok`/`error` report socket failures.
    std::vector<Device> multicast_probe(bool& ok, std::string& error);

    /// Brute-force sweep of the candidate prefixes.
    std::vector<Device> subnet_probe();

    /// One device-info query; nullopt unless status 200 (and the marker, when required).
    std::optional<Device> query_device(const std::string& address,
                                       std::chrono::milliseconds timeout,
                                       bool require_marker);

private:
    HttpTransport& http_;
    DiscoveryOptions opts_;
    SsdpSearchFn search_;
};

} // namespace sideload
