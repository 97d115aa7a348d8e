#pragma once
#include "analyzer.h"

// Software and data integrity failures: external scripts without SRI,
// scripts fetched over plain HTTP, package registries referenced over plain
// HTTP, and client-side deserialization calls.

class IntegrityFailuresAnalyzer : public Analyzer {
public:
    const char* name() const override { return "integrity_failures"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_integrity_failures; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief True if script_url is on a different host than page_url
     *
     * Only absolute http(s) URLs can be external.
     */
    static bool is_external_url(const std::string& script_url, const std::string& page_url);
};
