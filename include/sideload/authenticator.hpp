#pragma once
/**
 * @file authenticator.hpp
 * @brief Reachability and credential checks for one candidate device.
 *
 * @details
 * Two independent yes/no questions, each a single bounded HTTP call:
 *   - test_reachable(): does the control port answer `device-info` with 200?
 *   - test_credential(): does the developer web server accept
 *     `rokudev:<secret>`? The transport answers the server's challenge
 *     (Digest on real devices, see http_auth.hpp), so "single call" here
 *     may be two round trips.
 *
 * Neither throws and neither distinguishes "wrong password" from "device
 * gone" beyond the boolean; callers that need the difference call
 * test_reachable() first.
 */

#include "sideload/device.hpp"
#include "http_io.hpp"

#include <chrono>
#include <string>

namespace sideload {

class DeviceAuthenticator {
public:
    explicit DeviceAuthenticator(HttpTransport& http,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
        : http_(http), timeout_(timeout) {}

    bool test_reachable(const Device& device);
    bool test_credential(const std::string& address, const std::string& secret);

private:
    HttpTransport& http_;
    std::chrono::milliseconds timeout_;
};

} // namespace sideload
