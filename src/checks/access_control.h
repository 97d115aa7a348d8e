#pragma once
#include "analyzer.h"

// Broken access control.
// Requests well-known restricted paths on the target origin without
// credentials, once per scan before the crawl.

class AccessControlAnalyzer : public Analyzer {
public:
    const char* name() const override { return "broken_access_control"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_broken_access; }

    /// Per-page work is done by the site sweep.
    void check(const CrawlResult&, const ScanContext&, std::vector<Finding>&) const override {}

    /**
     * @brief GET each restricted path on the seed's origin
     *
     * A 200 whose body has admin-like content and no login form is
     * "access_granted". With access_control_strict (the default) every 200
     * is reported; otherwise only granted ones are.
     */
    void sweep_site(const std::string& seed_url, const ScanContext& ctx,
                    std::vector<Finding>& findings) const override;

    static const std::vector<std::string>& restricted_paths();

    /**
     * @brief Admin-like keywords present and no login form
     */
    static bool looks_like_open_admin_page(const std::string& body);
};
