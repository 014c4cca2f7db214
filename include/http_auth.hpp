#pragma once
/**
 * @page sl-http-auth Sideload HTTP Authentication
 * @file http_auth.hpp
 * @brief Challenge/response credentials (Digest or Basic) over any HttpTransport.
 *
 * @details
 * PURPOSE
 * -------
 * The developer server on port 80 protects install, rekey and packaging with
 * HTTP Digest. Callers only fill `user` and `password` on an HttpRequest;
 * AuthenticatingTransport turns those into an Authorization header the
 * server accepts.
 *
 * FLOW
 * ----
 *   1) First request to a host:port goes out without credentials.
 *   2) A 401 carrying `WWW-Authenticate: Digest ...` (or `Basic ...`) is
 *      answered once with the matching Authorization header.
 *   3) The challenge is remembered per host:port. Later requests answer it
 *      up front with an increasing nonce count, so large uploads are sent
 *      once. A 401 on a remembered challenge (stale nonce, wrong password)
 *      gets one more try against the fresh challenge.
 * Whatever the last attempt returns is the caller's result; a rejected
 * password still surfaces as a 401.
 *
 * DIGEST
 * ------
 * RFC 2617 / RFC 7616 with MD5 and MD5-sess, `qop=auth` or no qop. MD5 comes
 * from OpenSSL's EVP interface.
 */

#include "http_io.hpp"

#include <map>
#include <mutex>
#include <string>

namespace sideload {

struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string opaque;
    std::string algorithm;  /**< Empty means MD5. */
    std::string qop;        /**< "auth" when offered, else empty. */
    bool stale = false;
};

/// Lower-cased scheme of a challenge header ("digest", "basic"); empty if none.
std::string auth_scheme(const std::string& header);

/// `key=value` / `key="value"` parameters after the scheme; keys lower-cased.
std::map<std::string, std::string> parse_auth_params(const std::string& header);

/// False unless `header` is a Digest challenge with a nonce this client can answer.
bool parse_digest_challenge(const std::string& header, DigestChallenge& out);

/// Lower-case hex MD5 of `data`.
std::string md5_hex(const std::string& data);

/// Complete `Digest ...` Authorization header value for one request.
std::string digest_authorization(const DigestChallenge& c,
                                 const std::string& method,
                                 const std::string& uri,
                                 const std::string& user,
                                 const std::string& password,
                                 const std::string& cnonce,
                                 unsigned nc);

/**
 * @class AuthenticatingTransport
 * @brief Decorator that answers auth challenges for requests carrying `user`.
 *
 * Requests without `user`, or with `authorization` already set, pass through
 * untouched. Thread-safe.
 */
class AuthenticatingTransport : public HttpTransport {
public:
    explicit AuthenticatingTransport(HttpTransport& inner) : inner_(inner) {}

    HttpResponse send(const HttpRequest& req) override;

private:
    struct Session {
        bool digest = false;
        DigestChallenge challenge;
        unsigned nc = 0;
    };

    /// Header for `req` from a remembered session; empty when there is none.
    std::string answer_from_session(const std::string& key, const HttpRequest& req);
    /// Header answering `header`; records the session. Empty if unsupported.
    std::string answer_challenge(const std::string& key, const std::string& header,
                                 const HttpRequest& req);

    HttpTransport& inner_;
    std::mutex m_;
    std::map<std::string, Session> sessions_;
};

} // namespace sideload
