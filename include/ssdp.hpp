#pragma once
/**
 * @file ssdp.hpp
 * @brief SSDP M-SEARCH announce/listen for ECP devices.
 *
 * @details
 * Sends one `M-SEARCH` for `ST: roku:ecp` to 239.255.255.250:1900 from an
 * ephemeral UDP socket (broadcast enabled), then listens for unicast replies
 * until the window closes. Each reply whose payload carries the service type
 * and a `LOCATION:` header contributes the location's host.
 *
 * The socket is the only systemic failure point: open, bind or send errors
 * set `ok=false` and an error string. Individual replies are never errors;
 * garbage is ignored.
 *
 * Dependencies: Boost.Asio (udp socket, steady_timer-free `run_for`).
 */

#include <chrono>
#include <string>
#include <vector>

namespace sideload {

inline constexpr const char* SSDP_GROUP = "239.255.255.250";
inline constexpr unsigned short SSDP_PORT = 1900;
inline constexpr const char* SSDP_SEARCH_TARGET = "roku:ecp";

struct SsdpSearchResult {
    bool ok = true;
    std::vector<std::string> hosts;   /**< Unique location hosts, in reply order. */
    std::string error;
};

/// The M-SEARCH datagram payload.
std::string build_search_request();

/// Location URL of a reply, or empty if the reply is not an ECP responder.
std::string parse_search_reply(const std::string& payload);

/// Host part of "http://host[:port]/path"; empty if not an http URL.
std::string host_from_location(const std::string& url);

/// Send one search and collect hosts for `window`.
SsdpSearchResult ssdp_search(std::chrono::milliseconds window);

} // namespace sideload
