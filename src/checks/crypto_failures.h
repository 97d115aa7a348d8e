#pragma once
#include "analyzer.h"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Cryptographic failures: plain-HTTP pages, cookies without Secure/HttpOnly/
// SameSite, and servers that negotiate an outdated TLS protocol.

/**
 * @brief Result of one TLS handshake probe
 */
struct TlsProbeResult {
    bool ok = false;
    std::string version;   // as reported by OpenSSL, e.g. "TLSv1.2"
    std::string error;
};

/**
 * @brief Handshake with host:port and report the negotiated protocol
 */
using TlsProbe = std::function<TlsProbeResult(const std::string& host, int port, long timeout_seconds)>;

/**
 * @brief Default probe: TCP connect plus OpenSSL handshake with every
 *        protocol version allowed, certificate not verified
 */
TlsProbeResult openssl_tls_probe(const std::string& host, int port, long timeout_seconds);

struct CookieIssue {
    std::string name;
    std::vector<std::string> issues;
};

class CryptoFailuresAnalyzer : public Analyzer {
public:
    explicit CryptoFailuresAnalyzer(TlsProbe probe = openssl_tls_probe);

    const char* name() const override { return "crypto_failures"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_crypto_failures; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief Missing or weak security attributes of Set-Cookie values
     * @return One entry per cookie that has at least one issue
     */
    static std::vector<CookieIssue> audit_cookies(const std::vector<std::string>& set_cookie_values);

    /**
     * @brief True for TLSv1, TLSv1.1, SSLv3 and SSLv2
     */
    static bool is_outdated_tls(const std::string& version);

private:
    TlsProbe probe_;
    mutable std::mutex cache_mutex_;
    mutable std::map<std::string, TlsProbeResult> tls_cache_;   // keyed by host:port

    TlsProbeResult probe_host(const std::string& host, int port, const ScanContext& ctx) const;
};
