#pragma once
/**
 * @page sl-device Sideload Device Records
 * @file device.hpp
 * @brief Device and AuthorizedDevice records plus the device-info document parser.
 *
 * @details
 * PURPOSE
 * -------
 * A Device is what discovery hands back: one responder on the LAN that
 * answered the control-port `device-info` query. It is ephemeral, nothing
 * here is persisted. An AuthorizedDevice is the same record paired with the
 * developer password the caller supplied; it is the only form the
 * orchestrator accepts.
 *
 * WHAT THIS DOES
 * --------------
 * - Defines the record types.
 * - Parses the XML-ish `<device-info>` document returned on port 8060 with
 *   the naming fallbacks the devices need in practice:
 *     * name:   friendly-device-name → user-device-name → "device-<address>"
 *     * model:  model-name → model-number → "unknown"
 *     * serial: serial-number → "unknown"
 * - Exposes the control and developer port numbers used everywhere else.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - The parser is a tag scanner, not an XML parser. The documents are flat,
 *   single-level and small; entities are decoded for the five standard ones.
 * - parse_device_info() never fails: a garbled body still yields a Device
 *   with the fallback values. Callers decide validity with
 *   has_device_info_marker() before parsing.
 *
 * EXAMPLE
 * -------
 * @code
 *   if (sideload::has_device_info_marker(body)) {
 *       auto dev = sideload::parse_device_info("192.168.1.40", body);
 *       std::cout << dev.name << " (" << dev.model << ")\n";
 *   }
 * @endcode
 */

#include <cstdint>
#include <optional>
#include <string>

namespace sideload {

/// External control protocol (ECP) port: device-info, keypress.
inline constexpr std::uint16_t CONTROL_PORT = 8060;
/// Developer web server port: plugin_install, plugin_package.
inline constexpr std::uint16_t DEVELOPER_PORT = 80;
/// Fixed account name of the developer web server.
inline constexpr const char* DEVELOPER_USER = "rokudev";

/**
 * @struct Device
 * @brief One responder found on the network.
 *
 * `address` is the identity: discovery deduplicates on it and two Device
 * values with the same address describe the same box.
 */
struct Device {
    std::string address;                      /**< IPv4 dotted quad. */
    std::string name;                         /**< Display name, never empty after parsing. */
    std::string model;                        /**< Model name or number, "unknown" if absent. */
    std::string serial;                       /**< Serial number, "unknown" if absent. */
    std::optional<std::string> software_version;
    std::optional<std::string> device_class;  /**< `device-type` tag, e.g. "TV". */
};

/**
 * @struct AuthorizedDevice
 * @brief Device bound to the developer password for one orchestration run.
 */
struct AuthorizedDevice {
    Device device;
    std::string password;
};

/// Extract the text of the first `<tag>...</tag>` in `body`; empty if absent.
std::string extract_tag(const std::string& body, const std::string& tag);

/// True if `body` looks like a device-info document.
bool has_device_info_marker(const std::string& body);

/// Build a Device from a device-info document fetched from `address`.
Device parse_device_info(const std::string& address, const std::string& body);

/// "name (model) at address" one-liner used in logs and CLI output.
std::string describe(const Device& d);

} // namespace sideload
