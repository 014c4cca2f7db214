#pragma once
/**
 * @file net_interfaces.hpp
 * @brief Local IPv4 interface enumeration for the subnet probe.
 */

#include <string>
#include <vector>

namespace sideload {

/// "a.b.c" prefixes of every up, non-loopback IPv4 interface, interface order, no duplicates.
std::vector<std::string> local_ipv4_prefixes();

/// "a.b.c" of a dotted quad; empty if `address` is not IPv4.
std::string prefix_of(const std::string& address);

} // namespace sideload
