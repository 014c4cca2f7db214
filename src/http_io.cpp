// ============================================================================
// http_io.cpp — implementation for http_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file http_io.cpp
 */

#include "http_io.hpp"

#include <boost/asio/io_context.hpp>   // private io_context per request
#include <boost/asio/ip/tcp.hpp>       // resolver, socket
#include <boost/beast/core.hpp>        // tcp_stream with expires_after(), flat_buffer
#include <boost/beast/http.hpp>        // request/response_parser, async_write/async_read

#include <spdlog/spdlog.h>

#include <random>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace sideload {

// ---------------------------------------------------------------------------
// Transport constants.
// - MAX_BODY_BYTES: cap for a single response body (signed packages are small).
// - POLL_MS:        granularity of the cancel/deadline checks in the run loop.
// ---------------------------------------------------------------------------
static constexpr std::uint64_t MAX_BODY_BYTES = 512ull * 1024 * 1024;
static constexpr int POLL_MS = 100;


// -------- helpers --------

/*
 * error_token()
 * -------------
 * Fold the error codes we care about into short, stable tokens. Anything else
 * keeps Boost's message so logs stay informative.
 */
static std::string error_token(const beast::error_code& ec) {
    if (ec == beast::error::timeout)               return "timeout";
    if (ec == asio::error::connection_refused)     return "connection_refused";
    if (ec == asio::error::host_unreachable ||
        ec == asio::error::network_unreachable)    return "host_unreachable";
    if (ec == asio::error::host_not_found ||
        ec == asio::error::host_not_found_try_again) return "resolve_failed";
    return ec.message();
}


// -------- public API --------

/*
 * BeastTransport::send()
 * ----------------------
 * Resolve → connect → write → read, chained as completion handlers on a
 * private io_context, then drive that context in short slices.
 *
 * Deadline:
 * - tcp_stream::expires_after() puts one absolute deadline over connect,
 *   write and read. The resolver has no timer of its own, so the run loop
 *   cancels it as well once the same deadline passes.
 *
 * Cancellation:
 * - If `req.cancel` flips to true, the loop cancels the resolver and the
 *   stream; pending handlers complete with operation_aborted and the call
 *   returns error "cancelled".
 *
 * Never throws.
 */
HttpResponse BeastTransport::send(const HttpRequest& req) {
    HttpResponse out;

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);

    http::request<http::string_body> msg;
    msg.method_string(req.method);
    msg.target(req.target);
    msg.version(11);
    msg.set(http::field::host, req.host + ":" + std::to_string(req.port));
    msg.set(http::field::user_agent, "sideload");
    msg.set(http::field::connection, "close");
    if (!req.content_type.empty()) msg.set(http::field::content_type, req.content_type);
    if (!req.authorization.empty()) msg.set(http::field::authorization, req.authorization);
    msg.body() = req.body;
    msg.prepare_payload();

    beast::error_code result_ec;
    bool done = false;
    auto finish = [&](beast::error_code ec) { result_ec = ec; done = true; };

    stream.expires_after(req.timeout);
    resolver.async_resolve(req.host, std::to_string(req.port),
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) return finish(ec);
            stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) return finish(ec);
                http::async_write(stream, msg, [&](beast::error_code ec, std::size_t) {
                    if (ec) return finish(ec);
                    http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
                        finish(ec);
                    });
                });
            });
        });

    const auto deadline = std::chrono::steady_clock::now() + req.timeout;
    bool cancelled = false;
    bool overran = false;
    while (!done) {
        ioc.run_for(std::chrono::milliseconds(POLL_MS));
        if (done) break;
        if (ioc.stopped()) {
            // out of work without a completion: nothing left to wait for
            out.error = "internal";
            return out;
        }
        if (!cancelled && req.cancel && req.cancel->load()) {
            cancelled = true;
            resolver.cancel();
            stream.cancel();
        }
        if (!overran && std::chrono::steady_clock::now() > deadline) {
            overran = true;
            resolver.cancel();
            stream.cancel();
        }
    }

    if (cancelled) {
        out.error = "cancelled";
        return out;
    }
    if (result_ec) {
        out.error = (overran && result_ec == asio::error::operation_aborted)
                        ? std::string("timeout")
                        : error_token(result_ec);
        spdlog::debug("http {} {}:{}{} failed: {}", req.method, req.host, req.port, req.target, out.error);
        return out;
    }

    auto& res = parser.get();
    out.ok = true;
    out.status = static_cast<int>(res.result_int());
    out.body = std::move(res.body());
    if (auto it = res.find(http::field::content_type); it != res.end())
        out.content_type.assign(it->value().data(), it->value().size());
    if (auto it = res.find(http::field::www_authenticate); it != res.end())
        out.www_authenticate.assign(it->value().data(), it->value().size());

    // not_connected happens sometimes, so don't bother reporting it
    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    spdlog::debug("http {} {}:{}{} -> {}", req.method, req.host, req.port, req.target, out.status);
    return out;
}

std::string base64_encode(const std::string& in) {
    static const char* tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < in.size(); i += 3) {
        const unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                           (static_cast<unsigned char>(in[i + 1]) << 8) |
                            static_cast<unsigned char>(in[i + 2]);
        out.push_back(tbl[(v >> 18) & 0x3F]);
        out.push_back(tbl[(v >> 12) & 0x3F]);
        out.push_back(tbl[(v >> 6) & 0x3F]);
        out.push_back(tbl[v & 0x3F]);
    }
    const size_t rem = in.size() - i;
    if (rem == 1) {
        const unsigned v = static_cast<unsigned char>(in[i]) << 16;
        out.push_back(tbl[(v >> 18) & 0x3F]);
        out.push_back(tbl[(v >> 12) & 0x3F]);
        out += "==";
    } else if (rem == 2) {
        const unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                           (static_cast<unsigned char>(in[i + 1]) << 8);
        out.push_back(tbl[(v >> 18) & 0x3F]);
        out.push_back(tbl[(v >> 12) & 0x3F]);
        out.push_back(tbl[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}


// -------- multipart --------

MultipartForm::MultipartForm() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    static const char* hex = "0123456789abcdef";
    boundary_ = "----sideload";
    for (int i = 0; i < 24; ++i) boundary_.push_back(hex[gen() & 0xF]);
}

void MultipartForm::add_field(const std::string& name, const std::string& value) {
    parts_ += "--" + boundary_ + "\r\n";
    parts_ += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    parts_ += value;
    parts_ += "\r\n";
}

void MultipartForm::add_file(const std::string& name, const std::string& filename,
                             const std::string& data, const std::string& mime) {
    parts_ += "--" + boundary_ + "\r\n";
    parts_ += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename + "\"\r\n";
    parts_ += "Content-Type: " + mime + "\r\n\r\n";
    parts_ += data;
    parts_ += "\r\n";
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartForm::body() const {
    return parts_ + "--" + boundary_ + "--\r\n";
}

} // namespace sideload
