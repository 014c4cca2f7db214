// ============================================================================
// ssdp.cpp — implementation for ssdp.hpp
// ============================================================================

#include "ssdp.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <sstream>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace sideload {

static constexpr size_t REPLY_BUF_BYTES = 2048;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string build_search_request() {
    std::ostringstream os;
    os << "M-SEARCH * HTTP/1.1\r\n"
       << "HOST: " << SSDP_GROUP << ":" << SSDP_PORT << "\r\n"
       << "MAN: \"ssdp:discover\"\r\n"
       << "MX: 3\r\n"
       << "ST: " << SSDP_SEARCH_TARGET << "\r\n"
       << "\r\n";
    return os.str();
}

// ---- parse_search_reply() — keep replies that name our service and carry a location
// POLICY: header name match is case-insensitive, value is trimmed.
std::string parse_search_reply(const std::string& payload) {
    if (payload.find(SSDP_SEARCH_TARGET) == std::string::npos) return {};

    std::istringstream in(payload);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (lower(line.substr(0, 9)) != "location:") continue;

        auto value = line.substr(9);
        auto b = value.find_first_not_of(" \t");
        if (b == std::string::npos) return {};
        auto e = value.find_last_not_of(" \t");
        return value.substr(b, e - b + 1);
    }
    return {};
}

std::string host_from_location(const std::string& url) {
    const std::string scheme = "http://";
    if (lower(url.substr(0, scheme.size())) != scheme) return {};

    auto rest = url.substr(scheme.size());
    auto end = rest.find_first_of(":/");
    return end == std::string::npos ? rest : rest.substr(0, end);
}

/*
 * ssdp_search()
 * -------------
 * Phases:
 *   1) open + broadcast option + bind to an ephemeral port,
 *   2) send one M-SEARCH to the multicast group,
 *   3) receive replies until `window` elapses (re-arming after each),
 *   4) close and drain the aborted receive.
 *
 * Only phase 1 and 2 failures make the result !ok.
 */
SsdpSearchResult ssdp_search(std::chrono::milliseconds window) {
    SsdpSearchResult out;

    asio::io_context ioc;
    udp::socket sock(ioc);
    boost::system::error_code ec;

    auto fail = [&](const char* what) {
        out.ok = false;
        out.error = std::string(what) + ": " + ec.message();
        spdlog::warn("ssdp: {}", out.error);
        return out;
    };

    sock.open(udp::v4(), ec);
    if (ec) return fail("socket_open_failed");
    sock.set_option(asio::socket_base::broadcast(true), ec);
    if (ec) return fail("socket_option_failed");
    sock.bind(udp::endpoint(udp::v4(), 0), ec);
    if (ec) return fail("bind_failed");

    const auto group_addr = asio::ip::make_address(SSDP_GROUP, ec);
    if (ec) return fail("bad_group_address");
    const udp::endpoint group(group_addr, SSDP_PORT);

    const std::string request = build_search_request();
    sock.send_to(asio::buffer(request), group, 0, ec);
    if (ec) return fail("send_failed");

    std::array<char, REPLY_BUF_BYTES> buf{};
    udp::endpoint from;
    std::function<void()> arm = [&]() {
        sock.async_receive_from(asio::buffer(buf), from,
            [&](const boost::system::error_code& rec, std::size_t n) {
                if (rec) return;  // aborted at window close, or socket gone
                auto location = parse_search_reply(std::string(buf.data(), n));
                auto host = host_from_location(location);
                if (!host.empty() &&
                    std::find(out.hosts.begin(), out.hosts.end(), host) == out.hosts.end()) {
                    spdlog::debug("ssdp: reply from {} location {}", from.address().to_string(), location);
                    out.hosts.push_back(host);
                }
                arm();
            });
    };
    arm();

    ioc.run_for(window);

    boost::system::error_code close_ec;
    sock.close(close_ec);
    if (close_ec) spdlog::debug("ssdp: close: {}", close_ec.message());
    ioc.restart();
    ioc.poll();

    return out;
}

} // namespace sideload
