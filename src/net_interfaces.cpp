// ============================================================================
// net_interfaces.cpp — implementation for net_interfaces.hpp
// ============================================================================

#include "net_interfaces.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>      // errno for getifaddrs diagnostics
#include <cstring>     // strerror

#include <arpa/inet.h> // inet_ntop
#include <ifaddrs.h>   // getifaddrs/freeifaddrs
#include <net/if.h>    // IFF_LOOPBACK, IFF_UP
#include <netinet/in.h>

namespace sideload {

std::string prefix_of(const std::string& address) {
    int dots = 0;
    for (char c : address) {
        if (c == '.') ++dots;
        else if (c < '0' || c > '9') return {};
    }
    if (dots != 3) return {};
    return address.substr(0, address.rfind('.'));
}

/*
 * local_ipv4_prefixes()
 * ---------------------
 * Walk getifaddrs(). Failure is not an error for callers: the fixed prefix
 * list still gets probed, so we log and return what we have.
 */
std::vector<std::string> local_ipv4_prefixes() {
    std::vector<std::string> out;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        spdlog::debug("getifaddrs failed: {}", std::strerror(errno));
        return out;
    }

    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if ((it->ifa_flags & IFF_LOOPBACK) || !(it->ifa_flags & IFF_UP)) continue;

        char buf[INET_ADDRSTRLEN] = {};
        const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        auto p = prefix_of(buf);
        if (!p.empty() && std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
    }
    freeifaddrs(list);
    return out;
}

} // namespace sideload
