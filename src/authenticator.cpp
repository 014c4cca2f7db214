// ============================================================================
// authenticator.cpp — implementation for authenticator.hpp
// ============================================================================

#include "sideload/authenticator.hpp"

#include <spdlog/spdlog.h>

namespace sideload {

bool DeviceAuthenticator::test_reachable(const Device& device) {
    HttpRequest req;
    req.host = device.address;
    req.port = CONTROL_PORT;
    req.target = "/query/device-info";
    req.timeout = timeout_;

    auto res = http_.send(req);
    if (!res.ok) {
        spdlog::debug("reachability {}: {}", device.address, res.error);
        return false;
    }
    return res.status == 200;
}

// ---- test_credential() — one authenticated GET against the developer server
// POLICY: 2xx only counts as valid; 401/403, other statuses and transport errors are not.
bool DeviceAuthenticator::test_credential(const std::string& address, const std::string& secret) {
    HttpRequest req;
    req.host = address;
    req.port = DEVELOPER_PORT;
    req.target = "/";
    req.user = DEVELOPER_USER;
    req.password = secret;
    req.timeout = timeout_;

    auto res = http_.send(req);
    if (!res.ok) {
        spdlog::debug("credential check {}: {}", address, res.error);
        return false;
    }
    if (res.status == 401 || res.status == 403) {
        spdlog::debug("credential check {}: rejected ({})", address, res.status);
        return false;
    }
    return res.status >= 200 && res.status < 300;
}

} // namespace sideload
