#pragma once
#include "analyzer.h"

// Insecure design: forms without CSRF tokens and state-changing forms that
// accept repeated submissions without any rate limiting.

class InsecureDesignAnalyzer : public Analyzer {
public:
    const char* name() const override { return "insecure_design"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_insecure_design; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief Look for an anti-CSRF token
     *
     * Accepts a token-like input name, a meta element whose name contains
     * "csrf", or an X-CSRF-TOKEN / X-XSRF-TOKEN header named in the page or
     * sent with it.
     */
    static bool has_csrf_protection(const Form& form, const CrawlResult& page);

    /**
     * @brief Submit a POST form three times and watch for throttling
     *
     * Only POST forms with inputs and no file upload are probed; anything
     * else, and any transport failure, counts as protected.
     *
     * @return true if a 429, a rate-limit message or a failed submission
     *         was seen
     */
    static bool has_rate_limiting(const Form& form, const ScanContext& ctx);
};
