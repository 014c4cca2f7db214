#pragma once
/**
 * @page sl-http-io Sideload HTTP I/O
 * @file http_io.hpp
 * @brief Blocking, deadline-bounded HTTP/1.1 client used for every device call.
 *
 * @details
 * PURPOSE
 * -------
 * All traffic to a device is plain HTTP on the LAN: the control port (8060)
 * for `device-info` and keypresses, the developer port (80) for install and
 * packaging. This header is the seam between the core and the wire. The core
 * only sees HttpTransport; production uses BeastTransport, tests use a fake.
 *
 * WHAT THIS DOES
 * --------------
 * - HttpRequest / HttpResponse: value types, no sockets leak out.
 * - HttpTransport: one virtual `send()`. It never throws; transport failures
 *   come back as `ok=false` plus a short error token.
 * - BeastTransport: Boost.Beast over a private io_context per call.
 *     * One deadline covers resolve, connect, write and read.
 *     * An optional `std::atomic<bool>*` lets another thread abandon the call;
 *       the run loop polls it every 100 ms and closes the socket.
 *     * Sends `authorization` as given; credential negotiation lives in
 *       AuthenticatingTransport (http_auth.hpp).
 * - MultipartForm: builds `multipart/form-data` bodies for the developer
 *   server (text fields + one file part).
 *
 * ERROR TOKENS
 * ------------
 *   "timeout", "cancelled", "connection_refused", "host_unreachable",
 *   "resolve_failed", otherwise the Boost error message.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Response bodies are capped at 512 MiB (signed packages are a few MiB).
 * - BeastTransport never retries. A 401 comes back as a normal response with
 *   its WWW-Authenticate header.
 *
 * DEPENDENCIES
 * ------------
 * - Boost.Asio / Boost.Beast (header-only, Boost.System for error codes).
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sideload {

struct HttpRequest {
    std::string method = "GET";
    std::string host;
    std::uint16_t port = 80;
    std::string target = "/";
    std::string body;
    std::string content_type;
    std::string user;                       /**< Credentials for AuthenticatingTransport; empty = none. */
    std::string password;
    std::string authorization;              /**< Sent verbatim as the Authorization header when set. */
    std::chrono::milliseconds timeout{3000};
    const std::atomic<bool>* cancel = nullptr;  /**< Optional, polled while waiting. */
};

struct HttpResponse {
    bool ok = false;        /**< A complete response was received (any status). */
    int status = 0;
    std::string body;
    std::string content_type;
    std::string www_authenticate;   /**< Challenge header of a 401, if any. */
    std::string error;      /**< Token when !ok. */
};

/**
 * @class HttpTransport
 * @brief Abstract request/response exchange. Implementations must be thread-safe.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

/**
 * @class BeastTransport
 * @brief HttpTransport over Boost.Beast. Stateless; safe to share across threads.
 */
class BeastTransport : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& req) override;
};

/// Standard base64 (RFC 4648, with padding).
std::string base64_encode(const std::string& in);

/**
 * @class MultipartForm
 * @brief Minimal multipart/form-data encoder.
 */
class MultipartForm {
public:
    MultipartForm();

    void add_field(const std::string& name, const std::string& value);
    void add_file(const std::string& name, const std::string& filename,
                  const std::string& data,
                  const std::string& mime = "application/octet-stream");

    std::string content_type() const;
    std::string body() const;

private:
    std::string boundary_;
    std::string parts_;
};

} // namespace sideload
