/**
 * @file crypto_failures.cpp
 * @brief HTTPS, cookie attribute and TLS version checks
 */

#include "crypto_failures.h"
#include <core/findings.h>
#include <core/url_utils.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>

using json = nlohmann::json;

namespace {

// Helper function
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

/// Connect with a deadline; returns the socket or -1.
int connect_with_timeout(const std::string& host, int port, long timeout_seconds, std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        error = std::string("resolve failed: ") + gai_strerror(rc);
        return -1;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(res, freeaddrinfo);

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        int c = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (c < 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            int ready = poll(&pfd, 1, static_cast<int>(timeout_seconds * 1000));
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (ready == 1 && getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                c = 0;
            }
        }
        if (c == 0) {
            fcntl(fd, F_SETFL, flags);
            timeval tv{};
            tv.tv_sec = timeout_seconds;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            return fd;
        }
        close(fd);
    }
    error = "connect failed";
    return -1;
}

} // namespace

TlsProbeResult openssl_tls_probe(const std::string& host, int port, long timeout_seconds) {
    TlsProbeResult result;

    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
    if (!ctx) {
        result.error = "SSL_CTX_new failed";
        return result;
    }
    // Accept every protocol version so an outdated server can still be detected
    SSL_CTX_set_security_level(ctx.get(), 0);
    SSL_CTX_set_min_proto_version(ctx.get(), 0);
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    int fd = connect_with_timeout(host, port, timeout_seconds, result.error);
    if (fd < 0) return result;

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(ctx.get()), SSL_free);
    if (!ssl) {
        close(fd);
        result.error = "SSL_new failed";
        return result;
    }
    SSL_set_fd(ssl.get(), fd);
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());

    if (SSL_connect(ssl.get()) == 1) {
        result.ok = true;
        result.version = SSL_get_version(ssl.get());
        SSL_shutdown(ssl.get());
    } else {
        unsigned long err = ERR_get_error();
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        result.error = err ? buf : "handshake failed";
    }
    ssl.reset();
    close(fd);
    return result;
}

CryptoFailuresAnalyzer::CryptoFailuresAnalyzer(TlsProbe probe) : probe_(std::move(probe)) {}

bool CryptoFailuresAnalyzer::is_outdated_tls(const std::string& version) {
    return version == "TLSv1" || version == "TLSv1.1" || version == "SSLv3" || version == "SSLv2";
}

std::vector<CookieIssue> CryptoFailuresAnalyzer::audit_cookies(const std::vector<std::string>& set_cookie_values) {
    std::vector<CookieIssue> out;
    for (const auto& raw : set_cookie_values) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= raw.size()) {
            size_t semi = raw.find(';', start);
            parts.push_back(trim(raw.substr(start, semi == std::string::npos ? std::string::npos : semi - start)));
            if (semi == std::string::npos) break;
            start = semi + 1;
        }
        if (parts.empty() || parts[0].empty()) continue;

        CookieIssue cookie;
        size_t eq = parts[0].find('=');
        cookie.name = trim(eq == std::string::npos ? parts[0] : parts[0].substr(0, eq));

        bool secure = false, http_only = false, has_samesite = false;
        std::string samesite;
        for (size_t i = 1; i < parts.size(); i++) {
            std::string attr = to_lower_copy(parts[i]);
            size_t aeq = attr.find('=');
            std::string key = trim(aeq == std::string::npos ? attr : attr.substr(0, aeq));
            if (key == "secure") secure = true;
            else if (key == "httponly") http_only = true;
            else if (key == "samesite") {
                has_samesite = true;
                samesite = aeq == std::string::npos ? "" : trim(attr.substr(aeq + 1));
            }
        }

        if (!secure) cookie.issues.push_back("Missing Secure flag");
        if (!http_only) cookie.issues.push_back("Missing HttpOnly flag");
        if (!has_samesite) cookie.issues.push_back("Missing SameSite attribute");
        else if (samesite.empty() || samesite == "none") cookie.issues.push_back("Weak SameSite policy");

        if (!cookie.issues.empty()) out.push_back(std::move(cookie));
    }
    return out;
}

TlsProbeResult CryptoFailuresAnalyzer::probe_host(const std::string& host, int port, const ScanContext& ctx) const {
    std::string key = host + ":" + std::to_string(port);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = tls_cache_.find(key);
        if (it != tls_cache_.end()) return it->second;
    }

    TlsProbeResult result = probe_ ? probe_(host, port, 5) : TlsProbeResult{};
    if (!result.ok) {
        ctx.events.info("tls_probe_failed", "Could not check TLS version for " + key + ": " + result.error,
                        {{"host", host}, {"port", port}});
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    tls_cache_.emplace(key, result);
    return result;
}

void CryptoFailuresAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                   std::vector<Finding>& findings) const {
    bool https = scheme_of(page.url) == "https";

    if (!https) {
        findings.push_back(make_finding("crypto_failure_no_https", page.url,
            finding_details("High",
                            "Site is not using HTTPS encryption",
                            "Implement HTTPS for all web traffic",
                            "Data transmitted in plaintext can be intercepted, read, or modified by attackers")));
    }

    if (ctx.config.scan_cookies) {
        auto insecure = audit_cookies(page_header_values(page, "set-cookie"));
        if (!insecure.empty()) {
            json cookies = json::array();
            for (const auto& c : insecure) {
                cookies.push_back({{"name", c.name}, {"issues", c.issues}});
            }
            auto details = finding_details("Medium",
                                           "Cookies with missing security attributes",
                                           "Set Secure, HttpOnly, and SameSite attributes on cookies",
                                           "Cookies may be stolen via XSS attacks or transmitted over unencrypted connections");
            details["insecure_cookies"] = cookies;
            findings.push_back(make_finding("crypto_failure_insecure_cookies", page.url, std::move(details)));
        }
    }

    if (https) {
        std::string host = host_of(page.url);
        if (host.empty()) return;
        int port = 443;
        std::string origin = origin_of(page.url);
        size_t colon = origin.rfind(':');
        if (colon != std::string::npos && colon > origin.find("://") + 2 &&
            origin.find(']', colon) == std::string::npos) {
            try {
                port = std::stoi(origin.substr(colon + 1));
            } catch (const std::exception&) {
                port = 443;
            }
        }

        TlsProbeResult tls = probe_host(host, port, ctx);
        if (tls.ok && is_outdated_tls(tls.version)) {
            auto details = finding_details("Medium",
                                           "Outdated TLS version: " + tls.version,
                                           "Upgrade to TLS 1.2 or later",
                                           "Known vulnerabilities in older TLS versions could lead to "
                                           "man-in-the-middle attacks or information disclosure");
            details["tls_version"] = tls.version;
            findings.push_back(make_finding("crypto_failure_outdated_tls", page.url, std::move(details)));
        }
    }
}
