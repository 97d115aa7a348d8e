#pragma once
#include "analyzer.h"

// Server-side request forgery.
// URL-like query parameters and form inputs are rewritten to point at
// internal hosts; API-looking sites get a fixed list of fetch/proxy style
// endpoints probed once per origin. Redirects are never followed while
// probing.

class SsrfAnalyzer : public Analyzer {
public:
    const char* name() const override { return "ssrf"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_ssrf; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief Whether a probe response shows internal content
     *
     * Requires status 200, 201 or 202 and at least one SSRF indicator
     * pattern in the body.
     */
    static bool is_ssrf_successful(const HttpResponse& resp);

    /**
     * @brief Same as above, ignoring indicators already in baseline_body
     *
     * A page that always mentions "region" or "mysql" is not evidence of
     * SSRF; only indicators the unmodified request did not produce count.
     */
    static bool is_ssrf_successful(const HttpResponse& resp, const std::string& baseline_body);

    /**
     * @brief Parameter or input name suggests it takes a URL
     */
    static bool is_url_parameter(const std::string& name);

    static const std::vector<std::string>& internal_targets();

    /**
     * @brief Payload templates; "{target}" is replaced by an internal host
     */
    static const std::vector<std::string>& payload_templates();

    static std::string make_payload(const std::string& tmpl, const std::string& target);

private:
    void check_url_parameters(const CrawlResult& page, const ScanContext& ctx,
                              std::vector<Finding>& findings) const;

    void check_forms(const CrawlResult& page, const ScanContext& ctx,
                     std::vector<Finding>& findings) const;

    void check_api_endpoints(const CrawlResult& page, const ScanContext& ctx,
                             std::vector<Finding>& findings) const;
};
