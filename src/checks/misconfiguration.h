#pragma once
#include "analyzer.h"

// Security misconfiguration: directory listings, verbose error pages and
// default configuration files or install leftovers.

class MisconfigurationAnalyzer : public Analyzer {
public:
    const char* name() const override { return "security_misconfiguration"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_security_misconfigurations; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /// Directory listing markup on a 200 response.
    static bool has_directory_listing(long status, const std::string& body);

    /// Stack traces or framework error banners on a 4xx/5xx response.
    static bool has_verbose_errors(long status, const std::string& body);

    /**
     * @brief Known default config file names in the URL, or install/default
     *        credential text in the body
     */
    static bool has_default_configs(const std::string& url, const std::string& body);
};
