// ============================================================================
// http_auth.cpp — implementation for http_auth.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file http_auth.cpp
 */

#include "http_auth.hpp"

#include <openssl/evp.h>     // EVP_Digest / EVP_md5 for the Digest hashes
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>            // snprintf for the 8-digit nonce count
#include <random>

namespace sideload {

// -------- helpers --------

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

static std::string make_cnonce() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    for (int i = 0; i < 16; ++i) out.push_back(hex[gen() & 0xF]);
    return out;
}

static std::string basic_authorization(const HttpRequest& req) {
    return "Basic " + base64_encode(req.user + ":" + req.password);
}


// -------- challenge parsing --------

std::string auth_scheme(const std::string& header) {
    const std::string h = trim(header);
    const auto sp = h.find_first_of(" \t");
    return lower(h.substr(0, sp));
}

/*
 * parse_auth_params()
 * -------------------
 * Comma-separated `key=value` pairs following the scheme token. Quoted values
 * may contain commas and backslash escapes; unquoted values end at a comma.
 */
std::map<std::string, std::string> parse_auth_params(const std::string& header) {
    std::map<std::string, std::string> out;
    const std::string h = trim(header);
    auto i = h.find_first_of(" \t");
    if (i == std::string::npos) return out;

    while (i < h.size()) {
        while (i < h.size() && (h[i] == ' ' || h[i] == '\t' || h[i] == ',')) ++i;
        const auto eq = h.find('=', i);
        if (eq == std::string::npos) break;
        const std::string key = lower(trim(h.substr(i, eq - i)));
        i = eq + 1;
        while (i < h.size() && (h[i] == ' ' || h[i] == '\t')) ++i;

        std::string value;
        if (i < h.size() && h[i] == '"') {
            ++i;
            while (i < h.size() && h[i] != '"') {
                if (h[i] == '\\' && i + 1 < h.size()) ++i;
                value.push_back(h[i++]);
            }
            ++i;  // closing quote
        } else {
            const auto comma = h.find(',', i);
            const auto end = (comma == std::string::npos) ? h.size() : comma;
            value = trim(h.substr(i, end - i));
            i = end;
        }
        if (!key.empty()) out[key] = value;
    }
    return out;
}

bool parse_digest_challenge(const std::string& header, DigestChallenge& out) {
    if (auth_scheme(header) != "digest") return false;
    auto p = parse_auth_params(header);

    DigestChallenge c;
    c.realm = p["realm"];
    c.nonce = p["nonce"];
    c.opaque = p["opaque"];
    c.algorithm = p["algorithm"];
    c.stale = lower(p["stale"]) == "true";
    if (c.nonce.empty()) return false;

    const std::string alg = lower(c.algorithm);
    if (!alg.empty() && alg != "md5" && alg != "md5-sess") return false;

    // qop is a list; only "auth" is answered, "auth-int" alone is not
    if (auto q = p.find("qop"); q != p.end()) {
        std::string list = q->second;
        size_t start = 0;
        while (start <= list.size()) {
            const auto comma = list.find(',', start);
            const auto end = (comma == std::string::npos) ? list.size() : comma;
            if (lower(trim(list.substr(start, end - start))) == "auth") c.qop = "auth";
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        if (c.qop.empty()) return false;
    }
    out = c;
    return true;
}


// -------- digest --------

std::string md5_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1) return {};

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0xF]);
    }
    return out;
}

std::string digest_authorization(const DigestChallenge& c,
                                 const std::string& method,
                                 const std::string& uri,
                                 const std::string& user,
                                 const std::string& password,
                                 const std::string& cnonce,
                                 unsigned nc) {
    std::string ha1 = md5_hex(user + ":" + c.realm + ":" + password);
    if (lower(c.algorithm) == "md5-sess") ha1 = md5_hex(ha1 + ":" + c.nonce + ":" + cnonce);
    const std::string ha2 = md5_hex(method + ":" + uri);

    char ncbuf[9];
    std::snprintf(ncbuf, sizeof(ncbuf), "%08x", nc);

    const std::string response =
        c.qop.empty() ? md5_hex(ha1 + ":" + c.nonce + ":" + ha2)
                      : md5_hex(ha1 + ":" + c.nonce + ":" + ncbuf + ":" + cnonce + ":" + c.qop + ":" + ha2);

    std::string h = "Digest username=\"" + user + "\", realm=\"" + c.realm + "\", nonce=\"" + c.nonce +
                    "\", uri=\"" + uri + "\"";
    if (!c.algorithm.empty()) h += ", algorithm=" + c.algorithm;
    if (!c.qop.empty()) h += ", qop=" + c.qop + ", nc=" + ncbuf + ", cnonce=\"" + cnonce + "\"";
    h += ", response=\"" + response + "\"";
    if (!c.opaque.empty()) h += ", opaque=\"" + c.opaque + "\"";
    return h;
}


// -------- AuthenticatingTransport --------

std::string AuthenticatingTransport::answer_from_session(const std::string& key, const HttpRequest& req) {
    std::lock_guard<std::mutex> lk(m_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) return {};
    Session& s = it->second;
    if (!s.digest) return basic_authorization(req);
    return digest_authorization(s.challenge, req.method, req.target, req.user, req.password,
                                make_cnonce(), ++s.nc);
}

std::string AuthenticatingTransport::answer_challenge(const std::string& key, const std::string& header,
                                                      const HttpRequest& req) {
    const std::string scheme = auth_scheme(header);
    std::lock_guard<std::mutex> lk(m_);

    if (scheme == "digest") {
        DigestChallenge c;
        if (!parse_digest_challenge(header, c)) {
            spdlog::warn("{}: unsupported digest challenge: {}", key, header);
            return {};
        }
        Session& s = sessions_[key];
        s.digest = true;
        s.challenge = c;
        s.nc = 1;
        return digest_authorization(c, req.method, req.target, req.user, req.password, make_cnonce(), s.nc);
    }
    if (scheme == "basic") {
        sessions_[key] = Session{};
        return basic_authorization(req);
    }
    return {};
}

/*
 * send()
 * ------
 * At most two round trips: the first with whatever the session already
 * knows, the second answering the 401's challenge. A Basic header identical
 * to the one just rejected is not sent again.
 */
HttpResponse AuthenticatingTransport::send(const HttpRequest& req) {
    if (req.user.empty() || !req.authorization.empty()) return inner_.send(req);

    const std::string key = req.host + ":" + std::to_string(req.port);
    HttpRequest attempt = req;
    attempt.authorization = answer_from_session(key, req);

    auto res = inner_.send(attempt);
    if (!res.ok || res.status != 401) return res;

    std::string header = answer_challenge(key, res.www_authenticate, req);
    if (header.empty() || header == attempt.authorization) return res;

    spdlog::debug("{} {}{}: answering {} challenge", req.method, key, req.target,
                  auth_scheme(res.www_authenticate));
    attempt.authorization = std::move(header);
    return inner_.send(attempt);
}

} // namespace sideload
